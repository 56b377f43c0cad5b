/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-async.cpp
 * @brief The source implementation file for kfk-async.
 */

#include "kfk-async.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "kfk-proc.hpp"

namespace kfk {

void Kfk_Async::Kfk_Async_Wait::wait() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_cond_var.wait(lock, [this]() -> bool { return m_done; });

  if (m_thrown_exception) {
    std::rethrow_exception(m_thrown_exception);
  }
}

Kfk_Async::Kfk_Async(std::string_view name, ErrorHandler onError)
    : m_state{std::make_shared<Kfk_Async_State>()}, m_proc{name} {
  m_state->m_on_error = std::move(onError);

  if (!m_proc.exec([state = m_state]() -> void { run(*state); })) {
    throw std::runtime_error("Failed to start executor thread (" +
                             std::string{name} + ")");
  }
}

/**
 * @brief Closing the task queue lets the executor thread run what is queued
 *        and then return, the Kfk_Proc member joins it unless this runs on
 *        the executor thread itself.
 */
Kfk_Async::~Kfk_Async() noexcept try {
  m_state->m_tasks.close();

  if (!m_proc.isSelf()) {
    m_proc.wait();
  }
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

void Kfk_Async::run(Kfk_Async_State &state) {
  while (auto task = state.m_tasks.pop()) {
    try {
      (*task)();
    } catch (...) {
      if (state.m_on_error) {
        state.m_on_error(std::current_exception());
      } else {
        const std::unique_lock<std::mutex> lock(state.m_mutex);

        if (!state.m_thrown_exception) {
          state.m_thrown_exception = std::current_exception();
        }
      }
    }
  }
}

void Kfk_Async::addExecTask(std::function<void()> fnc) {
  if (m_state->m_tasks.push(std::move(fnc))) {
    throw std::runtime_error("Executor (" + m_proc.name() + ") is stopped");
  }
}

auto Kfk_Async::addExecTaskWithWait(std::function<void()> fnc)
    -> std::shared_ptr<Kfk_Async::Kfk_Async_Wait> {
  auto wait_shared_ptr = std::make_shared<Kfk_Async_Wait>();

  this->addExecTask([wait_shared_ptr, fnc = std::move(fnc)]() -> void {
    try {
      fnc();
    } catch (...) {
      wait_shared_ptr->m_thrown_exception = std::current_exception();
    }

    const std::unique_lock<std::mutex> lock(wait_shared_ptr->m_mutex);
    wait_shared_ptr->m_done = true;
    wait_shared_ptr->m_cond_var.notify_all();
  });

  return wait_shared_ptr;
}

void Kfk_Async::waitForEmpty() {
  // a no-op task queued behind everything else marks the point where all
  // earlier tasks have finished running. On the executor thread every
  // earlier task has already run.
  if (!isExecutorThread()) {
    addExecTaskWithWait([]() -> void {})->wait();
  }

  std::exception_ptr thrown{};
  {
    const std::unique_lock<std::mutex> lock(m_state->m_mutex);
    thrown = std::exchange(m_state->m_thrown_exception, nullptr);
  }

  if (thrown) {
    std::rethrow_exception(thrown);
  }
}

auto Kfk_Async::isExecutorThread() const -> bool { return m_proc.isSelf(); }

} // namespace kfk
