/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-proc.hpp
 * @brief Lightweight RAII wrapper around native pthread functionality.
 *
 * Kfk_Proc encapsulates a pthread that executes a user-provided callable
 * (std::function<void()>). Behaviour is varied by the task passed in rather
 * than by inheritance.
 *
 * Stopping is cooperative: stopExec() raises a stop flag and joins the
 * thread, so long-running tasks must poll isStopRequested() (librdkafka
 * poll loops check it between bounded rd_kafka_poll() slices). The kfk
 * background threads run into librdkafka calls that must not be unwound by
 * pthread cancellation, which is why there is no forced cancel.
 *
 * An exception escaping the task is captured and rethrown by wait().
 *
 * A task may destroy its own Kfk_Proc: the destructor then detaches the
 * thread instead of joining it, and the task runs to its end on a copy of
 * the callable. It must not throw after that point.
 */

#ifndef KFK_PROC_HPP_
#define KFK_PROC_HPP_

#include <pthread.h>

#include <atomic>
#include <exception>
#include <functional>
#include <string>
#include <string_view>

namespace kfk {

class Kfk_Proc {
  using Task = std::function<void()>;

  enum class State { kInvalid, kNew, kReady, kRunning };

public:
  /**
   * Construct a Kfk_Proc.
   *
   * @param name Human-readable name for diagnostics.
   * @param fnc  Optional task to run when exec() is called. If not provided,
   *             a task must be provided to exec().
   */
  explicit Kfk_Proc(std::string_view name, const Kfk_Proc::Task &fnc = {});
  virtual ~Kfk_Proc() noexcept;

  Kfk_Proc(const Kfk_Proc &obj) = delete;
  const Kfk_Proc &operator=(const Kfk_Proc &obj) = delete;
  Kfk_Proc(Kfk_Proc &&obj) = delete;
  Kfk_Proc &operator=(Kfk_Proc &&obj) = delete;

  /**
   * Execute the task in a new thread.
   *
   * @param fnc Optional task replacing the one given at construction.
   * @return true if the thread was started successfully.
   */
  auto exec(const Kfk_Proc::Task &fnc = {}) -> bool;

  /**
   * Wait (join) for the thread to finish, rethrowing an exception that
   * escaped the task.
   *
   * @return true if the thread was joined successfully.
   */
  auto wait() -> bool;

  /**
   * Request the task to stop and join the thread. A Kfk_Proc that is not
   * running returns true immediately.
   */
  auto stopExec() -> bool;

  auto isStopRequested() const -> bool;

  auto isRunning() const -> bool;

  /**
   * @return true when called from the thread this Kfk_Proc is running.
   */
  auto isSelf() const -> bool;

  auto name() const -> const std::string &;

  static void yield();

private:
  auto getState() const -> Kfk_Proc::State;
  auto setState(Kfk_Proc::State state) -> Kfk_Proc::State;
  void setTask(Kfk_Proc::Task fnc);

  static auto runFnInThreadHelper(void *context) -> void *;

  const std::string m_name{};

  Kfk_Proc::Task m_fnc{};
  std::atomic<Kfk_Proc::State> m_state{};
  std::atomic<bool> m_stop_requested{};
  std::exception_ptr m_thrown_exception{};
  pthread_t m_th{};
}; // class Kfk_Proc

} // namespace kfk

#endif // KFK_PROC_HPP_
