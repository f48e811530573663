#include "local_backend.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <regex>
#include <fstream>
#include <optional>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <remex/errors.h>
#include "process.h"
#include "utils.h"

namespace {

const long kVersionProbeTimeout = 5000; // ms

class TempScript { // RAII script file
  fs::path path_;
 public:
  const fs::path& Path() const { return path_; }
  explicit TempScript(const std::string& contents) {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) dir = "/tmp";
    std::string tmpl = (dir / "remex_harness.XXXXXX").string();
    int fd = mkstemp(tmpl.data());
    if (fd < 0) return;
    close(fd);
    std::ofstream fout(tmpl, std::ios::binary);
    if (fout << contents && fout.flush()) {
      path_ = tmpl;
    } else {
      fs::remove(tmpl, ec);
    }
  }
  ~TempScript() {
    std::error_code ec;
    if (!path_.empty() && !fs::remove(path_, ec)) {
      spdlog::warn("Failed to remove {}: {}", path_.string(), ec.message());
    }
  }
};

std::string FirstWord(const std::string& cmdline) {
  size_t start = cmdline.find_first_not_of(" \t");
  if (start == std::string::npos) return "";
  return cmdline.substr(start, cmdline.find_first_of(" \t", start) - start);
}

void CheckBashVersion(const std::string& shell) {
  ProcessOptions opt;
  opt.command = {shell, "--version"};
  opt.wall_time = kVersionProbeTimeout;
  ProcessResult res = RunProcess(opt);
  if (res.error || res.timed_out || res.exit_code != 0) {
    throw EnvironmentUnavailable(shell + " --version failed; install bash 4+ or switch to zsh");
  }
  auto version = ParseBashVersion(res.out);
  if (!version) {
    throw EnvironmentUnavailable("Cannot determine bash version from '" + Preview(res.out, 80) + "'");
  }
  spdlog::debug("Found bash {}.{}", version->first, version->second);
  if (version->first < 4) {
    throw EnvironmentUnavailable(fmt::format(
        "bash {}.{} cannot allocate descriptors dynamically (needs 4.0+); "
        "install or switch to zsh", version->first, version->second));
  }
}

void CheckZsh(const std::string& shell) {
  ProcessOptions opt;
  opt.command = {shell, "--version"};
  opt.wall_time = kVersionProbeTimeout;
  ProcessResult res = RunProcess(opt);
  if (res.error || res.timed_out || res.exit_code != 0) {
    throw EnvironmentUnavailable(shell + " --version failed; install zsh or switch to bash 4+");
  }
  spdlog::debug("Found {}", Preview(res.out, 80));
}

} // namespace

std::optional<std::pair<int, int>> ParseBashVersion(const std::string& version_output) {
  static const std::regex kPattern(R"(version (\d+)\.(\d+))");
  std::smatch match;
  if (!std::regex_search(version_output, match, kPattern)) return std::nullopt;
  try {
    return std::make_pair(std::stoi(match[1]), std::stoi(match[2]));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

HarnessSpec LocalProcessBackend::GetHarnessSpec(const ExecutionConfig& config) const {
  auto& conf = std::get<LocalProcessConfig>(config);
  HarnessSpec ret;
  ret.shell = conf.shell;
  ret.channel = ResultChannel::DESCRIPTOR;
  ret.interpreter = conf.interpreter;
  ret.workdir = conf.project_root;
  return ret;
}

void LocalProcessBackend::PreCheck(const ExecutionConfig& config) {
  auto& conf = std::get<LocalProcessConfig>(config);
  std::string shell = ShellExecutable(conf.shell);
  if (FindExecutable(shell).empty()) {
    throw EnvironmentUnavailable(shell + " not found on PATH; install it or select the other shell");
  }
  switch (conf.shell) {
    case Shell::BASH4: CheckBashVersion(shell); break;
    case Shell::ZSH: CheckZsh(shell); break;
  }
  std::string interpreter = FirstWord(conf.interpreter);
  if (interpreter.empty() || FindExecutable(interpreter).empty()) {
    throw EnvironmentUnavailable("Interpreter '" + conf.interpreter + "' not found on PATH");
  }
  if (!conf.project_root.empty()) {
    std::error_code ec;
    if (!fs::is_directory(conf.project_root, ec)) {
      throw ConfigurationError("project_root " + conf.project_root + " is not a directory");
    }
  }
}

ExecutionOutcome LocalProcessBackend::Execute(
    const ExecutionConfig& config, const Payload& payload, long deadline_ms) {
  auto& conf = std::get<LocalProcessConfig>(config);
  TempScript script(payload.harness.script);
  if (script.Path().empty()) {
    return ExecutionOutcome::Failure(FailureKind::REMOTE_FAULT,
        std::string("Failed to write harness script: ") + strerror(errno));
  }

  ProcessOptions opt;
  opt.command = {ShellExecutable(conf.shell), script.Path().string()};
  opt.channel = true;
  opt.wall_time = deadline_ms;
  ProcessResult res = RunProcess(opt);
  spdlog::debug("Local execution finished: exit={} signal={} timed_out={} time={}us",
                res.exit_code, res.term_signal, res.timed_out, res.wall_time);

  if (res.timed_out) {
    std::string msg = fmt::format("Execution exceeded the {}ms deadline", deadline_ms);
    if (res.drained) {
      msg += fmt::format("\nstdout: {}\nstderr: {}", Preview(res.out), Preview(res.err));
    } else {
      msg += " (output not captured)";
    }
    return ExecutionOutcome::Failure(FailureKind::TIMEOUT, msg);
  }
  if (res.error && res.exit_code == -1 && res.term_signal == 0) {
    return ExecutionOutcome::Failure(FailureKind::REMOTE_FAULT,
        fmt::format("Failed to run {}: {}", opt.command[0], strerror(res.error)));
  }
  if (res.exit_code != 0) {
    std::string msg = res.term_signal ?
        fmt::format("Process killed by signal {}", res.term_signal) :
        fmt::format("Process exited with code {}", res.exit_code);
    if (!res.err.empty()) msg += "\nstderr: " + Preview(res.err);
    auto ret = ExecutionOutcome::Failure(FailureKind::NON_ZERO_EXIT, msg, res.exit_code);
    ret.data = std::move(res.channel);
    return ret;
  }
  if (res.error) {
    return ExecutionOutcome::Failure(FailureKind::CHANNEL_ERROR,
        fmt::format("Reading the result channel failed: {}", strerror(res.error)), 0);
  }
  if (res.channel.empty()) {
    std::string msg = "Process exited 0 without writing a result to the channel";
    if (!res.err.empty()) msg += "\nstderr: " + Preview(res.err);
    return ExecutionOutcome::Failure(FailureKind::CHANNEL_ERROR, msg, 0);
  }
  return ExecutionOutcome::Success(std::move(res.channel), 0);
}
