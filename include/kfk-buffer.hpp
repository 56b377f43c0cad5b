/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-buffer.hpp
 * @brief Thread-safe FIFO buffer (queue) for passing items between threads.
 *
 * Overview
 * --------
 * Kfk_Buffer<T> is a thread-safe FIFO queue shared by producer and consumer
 * threads. It backs two things in kfk:
 *  - the task queue of Kfk_Async (unbounded),
 *  - the "channel" that Kfk_Consumer::consumeChannel() sends records into
 *    (usually bounded, so a slow receiver applies back pressure to the
 *    consume loop).
 *
 * Capacity and closing
 * --------------------
 * - capacity == 0 means unbounded, push never waits.
 * - capacity > 0 bounds the queue, push waits while the queue is full.
 * - close() wakes every waiter. Pushing into a closed buffer fails with
 *   Kfk_Errc::kChannelClosed, popping drains what is left and then returns
 *   std::nullopt.
 *
 * Blocking and cancellation
 * -------------------------
 * - pop(): blocks until an item is available or the buffer is closed and
 *   empty.
 * - pop(count, timeout): returns between 1 and count items as soon as count
 *   items are queued or timeout expired with at least one item queued, an
 *   empty vector once the buffer is closed and drained.
 * - push(item, ctx): blocks while the buffer is full until space frees up,
 *   the buffer is closed, or ctx is finished (the ctx error is returned).
 *   Waits are sliced by kWaitSlice so that a cancelled ctx is noticed even
 *   though the context has no way to signal this buffer's condition
 *   variables.
 *
 * Counters
 * --------
 * - m_push_count and m_pop_count count every item that entered and left the
 *   buffer. waitForEmpty() returns the pop count once the queue is empty.
 */

#ifndef KFK_BUFFER_HPP_
#define KFK_BUFFER_HPP_

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

#include "kfk-context.hpp"
#include "kfk-error.hpp"

namespace kfk {

template <typename T> class Kfk_Buffer {
public:
  static constexpr std::chrono::milliseconds kWaitSlice{100};

  explicit Kfk_Buffer(std::size_t capacity = 0);
  Kfk_Buffer(std::initializer_list<T> list);
  virtual ~Kfk_Buffer() noexcept;

  Kfk_Buffer(const Kfk_Buffer<T> &obj) = delete;
  const Kfk_Buffer<T> &operator=(const Kfk_Buffer<T> &obj) = delete;
  Kfk_Buffer(Kfk_Buffer<T> &&obj) = delete;
  Kfk_Buffer<T> &operator=(Kfk_Buffer<T> &&obj) = delete;

  /**
   * @brief Remove and return the front item, blocking while the buffer is
   *        empty and open.
   *
   * @return The front item, or std::nullopt if the buffer is closed and
   *         drained.
   */
  auto pop() -> std::optional<T>;

  /**
   * @brief Pop up to count items, waiting up to timeout for the full count
   *        once at least one item is queued.
   *
   * @param count   Number of desired items, must be > 0
   * @param timeout How long to wait for the full count
   *
   * @return 1..count items, or an empty vector if closed and drained
   */
  auto pop(std::size_t count, std::chrono::microseconds timeout)
      -> std::vector<T>;

  auto popNoWait() -> std::optional<T>;

  /**
   * @brief Append item, waiting for space when the buffer is bounded.
   *
   * @param item The value to push
   * @param ctx  Optional context bounding the wait for space
   *
   * @return An empty error_code on success, Kfk_Errc::kChannelClosed if the
   *         buffer is closed, or the ctx error if ctx finished first
   */
  auto push(T item, const Kfk_Context::Ptr &ctx = {}) -> std::error_code;

  void close();

  auto isClosed() const -> bool;

  auto size() const -> std::size_t;

  auto capacity() const -> std::size_t;

  /**
   * @brief Wait until the queue becomes empty and return the total number of
   *        items that have passed through the buffer.
   */
  auto waitForEmpty() -> std::size_t;

private:
  auto isFull() const -> bool;
  void takeFront(std::vector<T> &out);

  const std::size_t m_capacity{};

  mutable std::mutex m_mutex{};
  std::condition_variable m_not_empty_cond{};
  std::condition_variable m_not_full_cond{};
  std::condition_variable m_empty_cond{};
  std::deque<T> m_queue{};
  bool m_closed{};
  std::size_t m_push_count{};
  std::size_t m_pop_count{};
}; // class Kfk_Buffer

template <typename T>
Kfk_Buffer<T>::Kfk_Buffer(std::size_t capacity) : m_capacity{capacity} {}

template <typename T>
Kfk_Buffer<T>::Kfk_Buffer(std::initializer_list<T> list)
    : Kfk_Buffer(std::size_t{0}) {
  for (auto data : list) {
    this->push(std::move(data));
  }
}

template <typename T> Kfk_Buffer<T>::~Kfk_Buffer() noexcept try {
  close();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

template <typename T> auto Kfk_Buffer<T>::isFull() const -> bool {
  return m_capacity > 0 && m_queue.size() >= m_capacity;
}

template <typename T> void Kfk_Buffer<T>::takeFront(std::vector<T> &out) {
  out.push_back(std::move_if_noexcept(m_queue.front()));
  m_queue.pop_front();
  ++m_pop_count;
}

template <typename T> auto Kfk_Buffer<T>::pop() -> std::optional<T> {
  std::vector<T> item{};

  {
    std::unique_lock lock{m_mutex};

    m_not_empty_cond.wait(
        lock, [this]() -> bool { return !m_queue.empty() || m_closed; });
    if (m_queue.empty()) {
      return std::nullopt;
    }

    takeFront(item);

    if (m_queue.empty()) {
      m_empty_cond.notify_all();
    }
  }

  m_not_full_cond.notify_one();

  return std::move(item.front());
}

template <typename T>
auto Kfk_Buffer<T>::pop(std::size_t count, std::chrono::microseconds timeout)
    -> std::vector<T> {
  std::vector<T> items{};

  if (0 == count) {
    return items;
  }

  {
    std::unique_lock lock{m_mutex};

    m_not_empty_cond.wait(
        lock, [this]() -> bool { return !m_queue.empty() || m_closed; });

    m_not_empty_cond.wait_for(lock, timeout, [this, count]() -> bool {
      return m_queue.size() >= count || m_closed;
    });

    while (!m_queue.empty() && items.size() < count) {
      takeFront(items);
    }

    if (m_queue.empty()) {
      m_empty_cond.notify_all();
    }
  }

  m_not_full_cond.notify_all();

  return items;
}

template <typename T> auto Kfk_Buffer<T>::popNoWait() -> std::optional<T> {
  std::vector<T> item{};

  {
    std::unique_lock lock{m_mutex};

    if (m_queue.empty()) {
      return std::nullopt;
    }

    takeFront(item);

    if (m_queue.empty()) {
      m_empty_cond.notify_all();
    }
  }

  m_not_full_cond.notify_one();

  return std::move(item.front());
}

template <typename T>
auto Kfk_Buffer<T>::push(T item, const Kfk_Context::Ptr &ctx)
    -> std::error_code {
  while (true) {
    // the context is checked outside m_mutex, its cancel callbacks may run
    // on this thread.
    std::optional<Kfk_Context::Clock::time_point> deadline{};

    if (ctx) {
      if (auto ec = ctx->err(); ec) {
        return ec;
      }

      deadline = ctx->deadline();
    }

    std::unique_lock lock{m_mutex};

    if (m_closed) {
      return Kfk_Errc::kChannelClosed;
    }

    if (!isFull()) {
      m_queue.push_back(std::move(item));
      ++m_push_count;

      lock.unlock();
      m_not_empty_cond.notify_all();

      return {};
    }

    if (!ctx) {
      m_not_full_cond.wait(
          lock, [this]() -> bool { return !isFull() || m_closed; });
    } else {
      auto until = Kfk_Context::Clock::now() + kWaitSlice;
      if (deadline && *deadline < until) {
        until = *deadline;
      }

      m_not_full_cond.wait_until(lock, until);
    }
  }
}

template <typename T> void Kfk_Buffer<T>::close() {
  {
    std::unique_lock lock{m_mutex};

    m_closed = true;
  }

  m_not_empty_cond.notify_all();
  m_not_full_cond.notify_all();
  m_empty_cond.notify_all();
}

template <typename T> auto Kfk_Buffer<T>::isClosed() const -> bool {
  std::unique_lock lock{m_mutex};

  return m_closed;
}

template <typename T> auto Kfk_Buffer<T>::size() const -> std::size_t {
  std::unique_lock lock{m_mutex};

  return m_queue.size();
}

template <typename T> auto Kfk_Buffer<T>::capacity() const -> std::size_t {
  return m_capacity;
}

template <typename T> auto Kfk_Buffer<T>::waitForEmpty() -> std::size_t {
  std::unique_lock lock{m_mutex};

  m_empty_cond.wait(lock, [this]() -> bool { return m_queue.empty(); });

  return m_pop_count;
}

} // namespace kfk

#endif // KFK_BUFFER_HPP_
