#ifndef INCLUDE_REMEX_HARNESS_H_
#define INCLUDE_REMEX_HARNESS_H_

#include <string>

#include <remex/config.h>

// Environment variables shared by the harness and the entrypoint
extern const char kIpcFdEnv[];         // REMEX_IPC_FD
extern const char kResultFileEnv[];    // REMEX_RESULT_FILE
extern const char kExecutionModeEnv[]; // REMEX_EXECUTION_MODE

// descriptor the host hands the channel pipe on; the harness moves it away
constexpr int kChannelHandoffFd = 3;
extern const char kRemoteResultFile[];
extern const char kRemoteHarnessFile[];

#define ENUM_RESULT_CHANNEL_ \
  X(DESCRIPTOR) /* inherited duplicated descriptor */ \
  X(SHARED_FILE) /* file read back through the provider */ \
  X(CAPTURED_STDOUT) /* file printed after a marker on combined output */
enum class ResultChannel {
#define X(name) name,
  ENUM_RESULT_CHANNEL_
#undef X
};

const char* ResultChannelName(ResultChannel);

// Chosen by the backend for a config; the dispatcher never picks the channel itself.
struct HarnessSpec {
  Shell shell;
  ResultChannel channel;
  std::string interpreter; // command line, inserted verbatim
  std::string workdir;     // empty: inherit
  std::string result_file; // file strategies only

  HarnessSpec() : shell(Shell::BASH4), channel(ResultChannel::DESCRIPTOR) {}
};

struct Harness {
  std::string script;
  // CAPTURED_STDOUT only: line separating diagnostics from the result document
  std::string result_marker;
};

Harness RenderHarness(const HarnessSpec&, const std::string& program);

// Command that reproduces the script remotely without relying on the
// provider honoring shebang lines.
std::string TransportCommand(const std::string& script);

// True when this process is itself the target of a remote invocation
bool InRemoteExecution();

std::string ShellQuote(const std::string&);

#endif  // INCLUDE_REMEX_HARNESS_H_
