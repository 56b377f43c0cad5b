/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-context.cpp
 * @brief The source implementation file for kfk-context.
 */

#include "kfk-context.hpp"

#include <algorithm>
#include <chrono>
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

Kfk_Context::Kfk_Context(Ptr parent, std::optional<Clock::time_point> deadline)
    : m_parent{std::move(parent)}, m_deadline{deadline} {}

Kfk_Context::~Kfk_Context() noexcept try {
  if (m_parent && 0 != m_parent_callback_id) {
    m_parent->removeCancelCallback(m_parent_callback_id);
  }
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Kfk_Context::background() -> Ptr {
  return Ptr{new Kfk_Context{nullptr, std::nullopt}};
}

auto Kfk_Context::withCancel(const Ptr &parent) -> Ptr {
  return makeChild(parent, parent ? parent->deadline() : std::nullopt);
}

auto Kfk_Context::withTimeout(const Ptr &parent, Clock::duration timeout)
    -> Ptr {
  return withDeadline(parent, Clock::now() + timeout);
}

auto Kfk_Context::withDeadline(const Ptr &parent, Clock::time_point deadline)
    -> Ptr {
  if (parent) {
    auto parent_deadline = parent->deadline();
    if (parent_deadline && *parent_deadline < deadline) {
      deadline = *parent_deadline;
    }
  }

  return makeChild(parent, deadline);
}

auto Kfk_Context::withValue(const Ptr &parent, std::string_view key,
                            std::string_view value) -> Ptr {
  auto ctx = makeChild(parent, parent ? parent->deadline() : std::nullopt);
  ctx->m_value.emplace(std::string{key}, std::string{value});

  return ctx;
}

auto Kfk_Context::makeChild(const Ptr &parent,
                            std::optional<Clock::time_point> deadline) -> Ptr {
  Ptr ctx{new Kfk_Context{parent, deadline}};

  if (parent) {
    std::weak_ptr<Kfk_Context> weak_ctx{ctx};
    std::weak_ptr<Kfk_Context> weak_parent{parent};

    ctx->m_parent_callback_id =
        parent->addCancelCallback([weak_ctx, weak_parent]() -> void {
          auto child = weak_ctx.lock();
          auto parent = weak_parent.lock();

          if (child && parent) {
            child->finish(parent->err());
          }
        });
  }

  return ctx;
}

void Kfk_Context::cancel() { finish(Kfk_Errc::kContextCanceled); }

auto Kfk_Context::err() -> std::error_code {
  {
    std::unique_lock lock{m_mutex};

    if (m_err || !m_deadline || Clock::now() < *m_deadline) {
      return m_err;
    }
  }

  finish(Kfk_Errc::kDeadlineExceeded);

  std::unique_lock lock{m_mutex};

  return m_err;
}

auto Kfk_Context::done() -> bool { return static_cast<bool>(err()); }

auto Kfk_Context::deadline() const -> std::optional<Clock::time_point> {
  return m_deadline;
}

auto Kfk_Context::value(std::string_view key) const
    -> std::optional<std::string> {
  for (const auto *ctx = this; nullptr != ctx; ctx = ctx->m_parent.get()) {
    if (ctx->m_value && ctx->m_value->first == key) {
      return ctx->m_value->second;
    }
  }

  return std::nullopt;
}

auto Kfk_Context::waitFor(Clock::duration timeout) -> bool {
  auto until = Clock::now() + timeout;

  if (m_deadline && *m_deadline < until) {
    until = *m_deadline;
  }

  {
    std::unique_lock lock{m_mutex};

    m_cond.wait_until(lock, until,
                      [this]() -> bool { return static_cast<bool>(m_err); });
  }

  return done();
}

auto Kfk_Context::remaining(Clock::duration cap) const -> Clock::duration {
  if (!m_deadline) {
    return cap;
  }

  auto left = *m_deadline - Clock::now();

  return std::clamp(left, Clock::duration::zero(), cap);
}

auto Kfk_Context::addCancelCallback(CancelCallback fn) -> CallbackId {
  {
    std::unique_lock lock{m_mutex};

    if (!m_err) {
      auto id = m_next_callback_id++;
      m_callbacks.emplace(id, std::move(fn));

      return id;
    }
  }

  fn();

  return 0;
}

void Kfk_Context::removeCancelCallback(CallbackId id) {
  std::unique_lock lock{m_mutex};

  m_callbacks.erase(id);
}

void Kfk_Context::finish(std::error_code reason) {
  std::map<CallbackId, CancelCallback> callbacks{};

  if (!reason) {
    reason = Kfk_Errc::kContextCanceled;
  }

  {
    std::unique_lock lock{m_mutex};

    if (m_err) {
      return;
    }

    m_err = reason;
    callbacks.swap(m_callbacks);
    m_cond.notify_all();
  }

  for (auto &[id, fn] : callbacks) {
    fn();
  }
}

} // namespace kfk
