#ifndef REMEX_LOCAL_BACKEND_H_
#define REMEX_LOCAL_BACKEND_H_

#include <string>
#include <utility>
#include <optional>

#include <remex/backend.h>

// Runs the harness as a child of this process; the result comes back through
// a pipe handed to the shell as descriptor 3.
class LocalProcessBackend : public Backend {
 public:
  HarnessSpec GetHarnessSpec(const ExecutionConfig&) const override;
  void PreCheck(const ExecutionConfig&) override;
  ExecutionOutcome Execute(const ExecutionConfig&, const Payload&, long deadline_ms) override;
};

// major, minor of `bash --version`; nullopt if unparsable
std::optional<std::pair<int, int>> ParseBashVersion(const std::string& version_output);

#endif  // REMEX_LOCAL_BACKEND_H_
