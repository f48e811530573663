#ifndef INCLUDE_REMEX_ERRORS_H_
#define INCLUDE_REMEX_ERRORS_H_

#include <stdexcept>
#include <string>

#include <remex/outcome.h>

class RemexError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// bad/missing credentials, missing build source, unresolvable version
class ConfigurationError : public RemexError {
 public:
  using RemexError::RemexError;
};

// missing shell/binary, version too old
class EnvironmentUnavailable : public RemexError {
 public:
  using RemexError::RemexError;
};

// raised from an ExecutionOutcome failure
class ExecutionError : public RemexError {
  FailureKind kind_;
  int exit_code_;
 public:
  ExecutionError(FailureKind kind, const std::string& msg, int exit_code = -1) :
      RemexError(msg), kind_(kind), exit_code_(exit_code) {}
  FailureKind kind() const { return kind_; }
  int exit_code() const { return exit_code_; }
};

class TimeoutError : public ExecutionError {
 public:
  explicit TimeoutError(const std::string& msg) : ExecutionError(FailureKind::TIMEOUT, msg) {}
};

class NonZeroExitError : public ExecutionError {
 public:
  NonZeroExitError(const std::string& msg, int exit_code) :
      ExecutionError(FailureKind::NON_ZERO_EXIT, msg, exit_code) {}
};

// the channel was unreadable, or held neither a result nor a failure envelope
class ChannelError : public ExecutionError {
 public:
  explicit ChannelError(const std::string& msg, int exit_code = -1) :
      ExecutionError(FailureKind::CHANNEL_ERROR, msg, exit_code) {}
};

class RemoteFaultError : public ExecutionError {
 public:
  explicit RemoteFaultError(const std::string& msg) : ExecutionError(FailureKind::REMOTE_FAULT, msg) {}
};

// the isolated program raised and reported it through the channel
class RemoteApplicationError : public RemexError {
  std::string error_type_, error_message_;
 public:
  RemoteApplicationError(const std::string& type, const std::string& message) :
      RemexError(type + ": " + message), error_type_(type), error_message_(message) {}
  const std::string& error_type() const { return error_type_; }
  const std::string& error_message() const { return error_message_; }
};

// provider control plane failures
class ProviderError : public RemexError {
  int status_;
 public:
  explicit ProviderError(const std::string& msg, int status = -1) : RemexError(msg), status_(status) {}
  int status() const { return status_; } // HTTP status, -1 for transport errors
};

class ProviderTimeout : public ProviderError {
 public:
  using ProviderError::ProviderError;
};

#endif  // INCLUDE_REMEX_ERRORS_H_
