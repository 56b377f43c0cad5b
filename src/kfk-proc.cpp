/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-proc.cpp
 * @brief Lightweight RAII wrapper around native pthread functionality.
 */

#include "kfk-proc.hpp"

#include <pthread.h>
#include <sched.h>

#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace kfk {

namespace {

thread_local const Kfk_Proc *t_current_proc{};

} // namespace

Kfk_Proc::Kfk_Proc(std::string_view name, const Kfk_Proc::Task &fnc)
    : m_name{name} {
  setState(State::kNew);

  if (fnc) {
    setTask(fnc);
  }
}

/**
 * @brief If the thread is running, it is asked to stop and joined. The
 *        destructor blocks until the task observes isStopRequested(). Run
 *        from the task itself, the thread is detached instead.
 */
Kfk_Proc::~Kfk_Proc() noexcept try {
  if (getState() == State::kRunning) {
    if (isSelf()) {
      m_stop_requested = true;
      pthread_detach(m_th);
    } else {
      stopExec();
    }
  }

  setState(State::kInvalid);
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Kfk_Proc::exec(const Kfk_Proc::Task &fnc) -> bool {
  if (fnc) {
    setTask(fnc);
  }

  if (getState() != State::kReady) {
    throw std::runtime_error("No task is assigned to the Kfk_Proc (" + m_name +
                             ")");
  }

  m_stop_requested = false;
  m_thrown_exception = nullptr;

  auto old_state = setState(State::kRunning);
  int err = pthread_create(&m_th, nullptr, &(Kfk_Proc::runFnInThreadHelper),
                           this);
  if (0 != err) {
    setState(old_state);

    return false;
  }

  return true;
}

auto Kfk_Proc::getState() const -> Kfk_Proc::State { return m_state; }

auto Kfk_Proc::setState(State state) -> Kfk_Proc::State {
  return m_state.exchange(state);
}

void Kfk_Proc::setTask(Kfk_Proc::Task fnc) {
  if (getState() != State::kNew && getState() != State::kReady) {
    throw std::runtime_error("Task of a running Kfk_Proc (" + m_name +
                             ") can not be replaced");
  }

  m_fnc = std::move(fnc);
  setState(State::kReady);
}

auto Kfk_Proc::wait() -> bool {
  void *ret{};

  if (getState() != State::kRunning) {
    throw std::runtime_error("No task is exec");
  }

  int err = pthread_join(m_th, &ret);
  if (0 != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  setState(State::kReady);

  if (m_thrown_exception) {
    std::rethrow_exception(std::exchange(m_thrown_exception, nullptr));
  }

  return true;
}

auto Kfk_Proc::stopExec() -> bool {
  if (getState() != State::kRunning) {
    return true;
  }

  m_stop_requested = true;

  return wait();
}

auto Kfk_Proc::isStopRequested() const -> bool { return m_stop_requested; }

auto Kfk_Proc::isRunning() const -> bool {
  return getState() == State::kRunning;
}

auto Kfk_Proc::isSelf() const -> bool {
  return getState() == State::kRunning && t_current_proc == this;
}

auto Kfk_Proc::name() const -> const std::string & { return m_name; }

void Kfk_Proc::yield() { sched_yield(); }

auto Kfk_Proc::runFnInThreadHelper(void *context) -> void * {
  auto *proc = static_cast<Kfk_Proc *>(context);
  t_current_proc = proc;

  // the task may destroy proc, so it runs on a copy
  auto fnc = proc->m_fnc;

  try {
    fnc();
  } catch (...) {
    proc->m_thrown_exception = std::current_exception();
  }

  return nullptr;
}

} // namespace kfk
