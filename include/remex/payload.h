#ifndef INCLUDE_REMEX_PAYLOAD_H_
#define INCLUDE_REMEX_PAYLOAD_H_

#include <string>
#include <functional>

#include <nlohmann/json.hpp>
#include <remex/harness.h>

struct WorkItem {
  std::string module;   // import path, resolvable from the project root
  std::string function;
  nlohmann::json argument;
  // runs the unit of work in this process; used when already inside remote execution
  std::function<nlohmann::json(const nlohmann::json&)> in_process;
};

struct Payload {
  std::string program;
  Harness harness;
};

class PayloadGenerator {
 public:
  virtual ~PayloadGenerator() = default;
  // The program must write exactly one result or failure envelope to the
  // channel named by REMEX_IPC_FD or REMEX_RESULT_FILE and exit 0 / non-zero.
  virtual std::string Generate(const WorkItem&) const = 0;
};

class PythonPayloadGenerator : public PayloadGenerator {
 public:
  std::string Generate(const WorkItem&) const override;
};

// A prepared program, independent of the work item
class StaticPayloadGenerator : public PayloadGenerator {
  std::string program_;
 public:
  explicit StaticPayloadGenerator(std::string program) : program_(std::move(program)) {}
  std::string Generate(const WorkItem&) const override { return program_; }
};

#endif  // INCLUDE_REMEX_PAYLOAD_H_
