#ifndef INCLUDE_REMEX_DISPATCHER_H_
#define INCLUDE_REMEX_DISPATCHER_H_

#include <mutex>
#include <string>
#include <vector>
#include <future>
#include <memory>
#include <functional>
#include <condition_variable>

#include <nlohmann/json.hpp>
#include <remex/config.h>
#include <remex/errors.h>
#include <remex/backend.h>
#include <remex/payload.h>

// Configurations already pre-checked. Lookup is by value equality; entries
// are never removed.
class PrecheckCache {
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::vector<ExecutionConfig> checked_;
  std::vector<ExecutionConfig> in_flight_;

  static bool Find(const std::vector<ExecutionConfig>&, const ExecutionConfig&);
 public:
  // Runs check unless an equal config already passed. Concurrent callers with
  // an equal config wait for the one in flight. A throwing check records
  // nothing and the exception propagates. Returns whether check ran here.
  bool RunOnce(const ExecutionConfig&, const std::function<void()>& check);
  bool Contains(const ExecutionConfig&) const;
  size_t size() const;
};

[[noreturn]] void ThrowUndecodable(const nlohmann::json& doc, const std::string& raw);

// success schema first, then the failure envelope, else ChannelError
template <class O>
O DecodeResult(const std::string& raw) {
  nlohmann::json doc = nlohmann::json::parse(raw, nullptr, false);
  if (!doc.is_discarded()) {
    try {
      return doc.get<O>();
    } catch (const nlohmann::json::exception&) {
      // not the success schema
    }
  }
  ThrowUndecodable(doc, raw);
}

class Dispatcher {
  BackendTable table_;
  std::shared_ptr<const PayloadGenerator> generator_;
  PrecheckCache cache_;

  Backend& BackendFor(const ExecutionConfig&);
 public:
  explicit Dispatcher(BackendTable table = DefaultBackendTable(),
                      std::shared_ptr<const PayloadGenerator> generator =
                          std::make_shared<PythonPayloadGenerator>());

  // pre-check once per distinct config
  void Activate(const ExecutionConfig&);

  // Raw result document of a successful call; throws the typed errors otherwise.
  // Inside remote execution the work item runs in-process without pre-check.
  std::string CallRaw(const ExecutionConfig&, const WorkItem&, long timeout_ms);

  template <class O>
  O Call(const ExecutionConfig& config, const WorkItem& work, long timeout_ms) {
    return DecodeResult<O>(CallRaw(config, work, timeout_ms));
  }

  template <class O>
  std::future<O> CallAsync(ExecutionConfig config, WorkItem work, long timeout_ms) {
    return std::async(std::launch::async, [this, config = std::move(config), work = std::move(work), timeout_ms]() {
      return Call<O>(config, work, timeout_ms);
    });
  }

  const PrecheckCache& precheck_cache() const { return cache_; }
};

// raises the error matching a failed outcome
[[noreturn]] void ThrowOutcome(const ExecutionOutcome&);

#endif  // INCLUDE_REMEX_DISPATCHER_H_
