#include <remex/dispatcher.h>

#include <algorithm>

bool PrecheckCache::Find(const std::vector<ExecutionConfig>& list, const ExecutionConfig& config) {
  return std::find(list.begin(), list.end(), config) != list.end();
}

bool PrecheckCache::RunOnce(const ExecutionConfig& config, const std::function<void()>& check) {
  auto Finish = [&](bool success) {
    std::lock_guard lck(mtx_);
    in_flight_.erase(std::find(in_flight_.begin(), in_flight_.end(), config));
    if (success) checked_.push_back(config);
    cv_.notify_all();
  };
  {
    std::unique_lock lck(mtx_);
    while (true) {
      if (Find(checked_, config)) return false;
      if (!Find(in_flight_, config)) break;
      cv_.wait(lck);
    }
    in_flight_.push_back(config);
  }
  try {
    check();
  } catch (...) {
    // not recorded; the next activation checks again
    Finish(false);
    throw;
  }
  Finish(true);
  return true;
}

bool PrecheckCache::Contains(const ExecutionConfig& config) const {
  std::lock_guard lck(mtx_);
  return Find(checked_, config);
}

size_t PrecheckCache::size() const {
  std::lock_guard lck(mtx_);
  return checked_.size();
}
