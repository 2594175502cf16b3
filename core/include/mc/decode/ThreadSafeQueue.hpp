#pragma once
#include <cstddef>
#include <mutex>
#include <queue>
#include <vector>

namespace mc {

// Unbounded MPSC hand-off queue. Producers push from any thread; the UI
// thread drains.
template <typename T>
class ThreadSafeQueue {
public:
  void push(T item) {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.push(std::move(item));
  }

  bool pop(T& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty()) return false;
    out = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  // Take everything queued so far, in arrival order.
  std::vector<T> drain() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<T> out;
    out.reserve(queue_.size());
    while (!queue_.empty()) {
      out.push_back(std::move(queue_.front()));
      queue_.pop();
    }
    return out;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    while (!queue_.empty()) queue_.pop();
  }

private:
  mutable std::mutex mtx_;
  std::queue<T> queue_;
};

} // namespace mc
