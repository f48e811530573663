#ifndef INCLUDE_REMEX_OUTCOME_H_
#define INCLUDE_REMEX_OUTCOME_H_

#include <string>

#define ENUM_FAILURE_KIND_ \
  X(TIMEOUT, "Timeout") \
  X(NON_ZERO_EXIT, "NonZeroExit") \
  X(CHANNEL_ERROR, "ChannelError") \
  X(REMOTE_FAULT, "RemoteFault")
enum class FailureKind {
#define X(name, desc) name,
  ENUM_FAILURE_KIND_
#undef X
};

const char* FailureKindName(FailureKind);

// Exactly one per invocation.
struct ExecutionOutcome {
  bool ok;
  // success: full contents of the result channel
  // failure: whatever the channel held (may carry a failure envelope)
  std::string data;
  FailureKind kind;
  std::string message;
  int exit_code; // -1 if the environment never reported one

  ExecutionOutcome() : ok(false), kind(FailureKind::REMOTE_FAULT), exit_code(-1) {}

  static ExecutionOutcome Success(std::string data, int exit_code = 0);
  static ExecutionOutcome Failure(FailureKind kind, std::string message, int exit_code = -1);
};

#endif  // INCLUDE_REMEX_OUTCOME_H_
