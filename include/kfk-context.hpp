/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-context.hpp
 * @brief Cancellation and deadline propagation for blocking kfk operations.
 *
 * Every blocking operation of the facades (produce, poll, commit, admin
 * round trips, ...) takes a Kfk_Context::Ptr. The context carries:
 *  - a cancellation flag set by cancel() or inherited from its parent,
 *  - an optional deadline, the earlier of its own and its parent's,
 *  - string values set by withValue() and seen by every descendant (the
 *    producers carry trace_id and request_id values into record headers).
 *
 * Contexts form a tree rooted at background(). A child registers itself on
 * its parent, so cancelling the parent cancels every descendant. Deadline
 * expiry is observed when err()/done()/waitFor() is called, at which point
 * the context finishes with kDeadlineExceeded and notifies its callbacks.
 *
 * Cancel callbacks run exactly once, on the thread that finishes the
 * context, and never with the context's mutex held, so a callback may call
 * back into the context (or into its parent).
 *
 * Usage:
 *   auto ctx = kfk::Kfk_Context::withTimeout(kfk::Kfk_Context::background(),
 *                                            std::chrono::seconds(10));
 *   auto records = consumer->pollRecords(ctx, 10);
 */

#ifndef KFK_CONTEXT_HPP_
#define KFK_CONTEXT_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "kfk-error.hpp"

namespace kfk {

class Kfk_Context {
public:
  using Ptr = std::shared_ptr<Kfk_Context>;
  using Clock = std::chrono::steady_clock;
  using CancelCallback = std::function<void()>;
  using CallbackId = std::uint64_t;

  /**
   * @brief The root context, it is never cancelled and has no deadline.
   */
  static auto background() -> Ptr;

  static auto withCancel(const Ptr &parent) -> Ptr;
  static auto withTimeout(const Ptr &parent, Clock::duration timeout) -> Ptr;
  static auto withDeadline(const Ptr &parent, Clock::time_point deadline)
      -> Ptr;
  static auto withValue(const Ptr &parent, std::string_view key,
                        std::string_view value) -> Ptr;

  ~Kfk_Context() noexcept;

  Kfk_Context(const Kfk_Context &obj) = delete;
  const Kfk_Context &operator=(const Kfk_Context &obj) = delete;
  Kfk_Context(Kfk_Context &&obj) = delete;
  Kfk_Context &operator=(Kfk_Context &&obj) = delete;

  /**
   * @brief Cancel the context and all its descendants. Cancelling a
   *        finished context is a no-op.
   */
  void cancel();

  /**
   * @brief Return an empty error_code while the context is live, else
   *        Kfk_Errc::kContextCanceled or Kfk_Errc::kDeadlineExceeded.
   */
  auto err() -> std::error_code;

  auto done() -> bool;

  auto deadline() const -> std::optional<Clock::time_point>;

  /**
   * @brief The value of key set by the nearest withValue() up the tree.
   */
  auto value(std::string_view key) const -> std::optional<std::string>;

  /**
   * @brief Block up to timeout or until the context is finished.
   *
   * @return true if the context is finished
   */
  auto waitFor(Clock::duration timeout) -> bool;

  /**
   * @brief Time left before the deadline, bounded by cap and never negative.
   *        A context without deadline returns cap.
   */
  auto remaining(Clock::duration cap) const -> Clock::duration;

  /**
   * @brief Register fn to run when the context finishes. If the context is
   *        already finished fn runs immediately on the calling thread and 0
   *        is returned.
   *
   * @return An id for removeCancelCallback(), 0 if fn already ran
   */
  auto addCancelCallback(CancelCallback fn) -> CallbackId;

  void removeCancelCallback(CallbackId id);

private:
  Kfk_Context(Ptr parent, std::optional<Clock::time_point> deadline);

  static auto makeChild(const Ptr &parent,
                        std::optional<Clock::time_point> deadline) -> Ptr;

  void finish(std::error_code reason);

  const Ptr m_parent{};
  const std::optional<Clock::time_point> m_deadline{};
  std::optional<std::pair<std::string, std::string>> m_value{};

  mutable std::mutex m_mutex{};
  std::condition_variable m_cond{};
  std::error_code m_err{};
  std::map<CallbackId, CancelCallback> m_callbacks{};
  CallbackId m_next_callback_id{1};
  CallbackId m_parent_callback_id{};
}; // class Kfk_Context

} // namespace kfk

#endif // KFK_CONTEXT_HPP_
