#ifndef INCLUDE_REMEX_BACKEND_H_
#define INCLUDE_REMEX_BACKEND_H_

#include <array>
#include <memory>

#include <remex/config.h>
#include <remex/outcome.h>
#include <remex/payload.h>

class Backend {
 public:
  virtual ~Backend() = default;

  // Harness parameters for a config, including the result channel strategy
  virtual HarnessSpec GetHarnessSpec(const ExecutionConfig&) const = 0;

  // Verify usability and do idempotent provisioning before first use.
  // Throws ConfigurationError, EnvironmentUnavailable or ProviderError.
  // Must be safe for distinct configs running concurrently.
  virtual void PreCheck(const ExecutionConfig&) = 0;

  // Run to completion or deadline. Never throws; returns exactly one outcome
  // and releases everything it provisioned on every path.
  virtual ExecutionOutcome Execute(const ExecutionConfig&, const Payload&, long deadline_ms) = 0;
};

// indexed by (int)BackendKind
using BackendTable = std::array<std::shared_ptr<Backend>, kBackendKindCount>;

BackendTable DefaultBackendTable();

#endif  // INCLUDE_REMEX_BACKEND_H_
