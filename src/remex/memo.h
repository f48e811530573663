#ifndef REMEX_MEMO_H_
#define REMEX_MEMO_H_

#include <map>
#include <mutex>

// Append-only memo keyed by value. Only successful computations are stored;
// two threads racing on a new key may both compute it.
template <class Key, class Value>
class Memo {
  mutable std::mutex mtx_;
  std::map<Key, Value> values_;
 public:
  template <class Func>
  Value Get(const Key& key, Func&& compute) {
    {
      std::lock_guard lck(mtx_);
      if (auto it = values_.find(key); it != values_.end()) return it->second;
    }
    Value val = compute();
    std::lock_guard lck(mtx_);
    return values_.emplace(key, std::move(val)).first->second;
  }
  size_t size() const {
    std::lock_guard lck(mtx_);
    return values_.size();
  }
};

#endif  // REMEX_MEMO_H_
