#include <remex/harness.h>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include "utils.h"

const char kIpcFdEnv[] = "REMEX_IPC_FD";
const char kResultFileEnv[] = "REMEX_RESULT_FILE";
const char kExecutionModeEnv[] = "REMEX_EXECUTION_MODE";

const char kRemoteResultFile[] = "/tmp/remex_result.json";
const char kRemoteHarnessFile[] = "/tmp/remex_harness.sh";

namespace {

// a heredoc delimiter / marker line that cannot occur in the program
std::string UniqueToken(const std::string& prefix, const std::string& program) {
  while (true) {
    std::string token = prefix + RandomToken(16);
    if (program.find(token) == std::string::npos) return token;
  }
}

} // namespace

std::string ShellQuote(const std::string& str) {
  std::string ret = "'";
  for (char c : str) {
    if (c == '\'') {
      ret += "'\\''";
    } else {
      ret += c;
    }
  }
  ret += '\'';
  return ret;
}

Harness RenderHarness(const HarnessSpec& spec, const std::string& program) {
  Harness ret;
  std::string delim = UniqueToken("REMEX_PAYLOAD_", program);
  std::string& s = ret.script;
  s += "#!/usr/bin/env ";
  s += ShellExecutable(spec.shell);
  s += "\n";
  s += std::string("export ") + kExecutionModeEnv + "=1\n";

  // (a)/(b): result channel
  switch (spec.channel) {
    case ResultChannel::DESCRIPTOR:
      // duplicate onto a shell-chosen descriptor so the entrypoint closing its
      // copy cannot break the handoff descriptor
      s += "exec {__remex_ipc}>&" + std::to_string(kChannelHandoffFd) + " || exit 70\n";
      s += "exec " + std::to_string(kChannelHandoffFd) + ">&-\n";
      s += std::string("export ") + kIpcFdEnv + "=\"$__remex_ipc\"\n";
      break;
    case ResultChannel::SHARED_FILE: [[fallthrough]];
    case ResultChannel::CAPTURED_STDOUT:
      s += std::string("export ") + kResultFileEnv + "=" + ShellQuote(spec.result_file) + "\n";
      s += std::string("rm -f \"$") + kResultFileEnv + "\"\n";
      break;
  }

  s += "__remex_prog=\"$(mktemp \"${TMPDIR:-/tmp}/remex_payload.XXXXXX\")\" || exit 70\n";
  if (spec.channel == ResultChannel::CAPTURED_STDOUT) {
    s += "__remex_log=\"$(mktemp \"${TMPDIR:-/tmp}/remex_log.XXXXXX\")\" || exit 70\n";
    s += "trap 'rm -f \"$__remex_prog\" \"$__remex_log\"' EXIT\n";
  } else {
    s += "trap 'rm -f \"$__remex_prog\"' EXIT\n";
  }
  s += "cat >\"$__remex_prog\" <<'" + delim + "'\n";
  s += program;
  if (program.empty() || program.back() != '\n') s += '\n';
  s += delim + "\n";
  if (!spec.workdir.empty()) s += "cd " + ShellQuote(spec.workdir) + " || exit 70\n";

  // (c)/(d): run the entrypoint and propagate its status
  s += spec.interpreter + " \"$__remex_prog\"";
  if (spec.channel == ResultChannel::CAPTURED_STDOUT) s += " >\"$__remex_log\" 2>&1";
  s += "\n__remex_status=$?\n";
  if (spec.channel == ResultChannel::CAPTURED_STDOUT) {
    ret.result_marker = UniqueToken("__REMEX_RESULT_", program);
    s += "cat \"$__remex_log\"\n";
    s += "printf '\\n%s\\n' '" + ret.result_marker + "'\n";
    s += std::string("if [ -f \"$") + kResultFileEnv + "\" ]; then cat \"$" + kResultFileEnv + "\"; fi\n";
  }
  s += "exit \"$__remex_status\"\n";
  spdlog::debug("Rendered {} harness: shell={} interpreter={} size={}",
                ResultChannelName(spec.channel), ShellExecutable(spec.shell), spec.interpreter, s.size());
  return ret;
}

std::string TransportCommand(const std::string& script) {
  return "printf '%s' '" + httplib::detail::base64_encode(script) + "' | base64 -d > " +
         kRemoteHarnessFile + " && bash " + kRemoteHarnessFile;
}

bool InRemoteExecution() {
  auto mode = GetEnv(kExecutionModeEnv);
  return mode && *mode == "1";
}
