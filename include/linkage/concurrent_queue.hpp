/**
 * @file concurrent_queue.hpp
 * @brief Потокобезопасная очередь сообщений от потока ввода к владельцу движка
 *
 * Производитель закрывает очередь на EOF; потребитель дочитывает остаток
 * и получает std::nullopt.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace linkage {

template <class T> class ConcurrentQueue {
public:
  ConcurrentQueue() = default;

  ConcurrentQueue(const ConcurrentQueue &) = delete;
  ConcurrentQueue &operator=(const ConcurrentQueue &) = delete;

  /// @return false если очередь уже закрыта
  bool push(T value) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_) {
        return false;
      }
      q_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  /// Больше сообщений не будет
  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  /**
   * @brief Ждёт сообщение не дольше timeout
   * @param drained Выставляется в true, если очередь закрыта и пуста
   */
  [[nodiscard]] std::optional<T> pop_wait_for(std::chrono::milliseconds timeout,
                                              bool &drained) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !q_.empty(); });

    drained = closed_ && q_.empty();
    if (q_.empty()) {
      return std::nullopt;
    }

    T value = std::move(q_.front());
    q_.pop_front();
    return value;
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.size();
  }

  [[nodiscard]] bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> q_;
  bool closed_ = false;
};

} // namespace linkage
