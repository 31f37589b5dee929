#ifndef LOCK_QUEUE_HPP
#define LOCK_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace threadsafe {
// Multi producer multi consumer queue. Once closed, pushes are dropped and
// wait_pop() drains what is left before returning false.
template <typename T>
class stl_queue {
 private:
  mutable std::mutex mut;
  std::deque<T> data_queue;
  std::condition_variable cv;
  bool is_closed{false};

 public:
  stl_queue() = default;
  stl_queue(const stl_queue<T>&) = delete;
  auto operator=(const stl_queue<T>&) -> stl_queue<T>& = delete;

  // Returns false if the queue was already closed.
  auto push(T x) -> bool {
    {
      std::lock_guard<std::mutex> lk(mut);
      if (is_closed) return false;
      data_queue.push_back(std::move(x));
    }
    cv.notify_one();
    return true;
  }

  auto try_pop(T& x) -> bool {
    std::lock_guard<std::mutex> lk(mut);
    if (data_queue.empty()) return false;
    x = std::move(data_queue.front());
    data_queue.pop_front();
    return true;
  }

  // Blocks until an element is available or the queue is closed and empty.
  auto wait_pop(T& x) -> bool {
    std::unique_lock<std::mutex> lk(mut);
    cv.wait(lk, [this]() { return !data_queue.empty() || is_closed; });
    if (data_queue.empty()) return false;
    x = std::move(data_queue.front());
    data_queue.pop_front();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lk(mut);
      is_closed = true;
    }
    cv.notify_all();
  }

  auto closed() const -> bool {
    std::lock_guard<std::mutex> lk(mut);
    return is_closed;
  }
  auto empty() const -> bool {
    std::lock_guard<std::mutex> lk(mut);
    return data_queue.empty();
  }
  auto size() const -> size_t {
    std::lock_guard<std::mutex> lk(mut);
    return data_queue.size();
  }
};
}  // namespace threadsafe

#endif
