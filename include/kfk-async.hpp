/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-async.hpp
 * @brief Kfk_Async: a serial executor that runs client-provided tasks on its
 *        own thread, in submission order.
 *
 *        Kfk_Producer uses it to invoke asynchronous delivery callbacks: the
 *        librdkafka delivery report hands the result over to the executor,
 *        so the user callback never runs on a librdkafka thread nor under a
 *        facade lock, and may call back into the producer.
 *
 *        - addExecTask(): schedule a task.
 *        - addExecTaskWithWait(): schedule a task and get a Kfk_Async_Wait
 *          whose wait() returns once the task has run (rethrowing what it
 *          threw).
 *        - waitForEmpty(): block until every task submitted before the call
 *          has finished running. Called from a task it returns at once,
 *          the tasks queued behind the caller run after it returns.
 *
 *        A task may also destroy the Kfk_Async that runs it: the thread
 *        keeps the task queue alive, runs what is left and ends.
 *
 *        A task that throws does not stop the executor: the exception is
 *        handed to the error handler given at construction, or kept and
 *        rethrown by the next waitForEmpty() when there is no handler.
 */

#ifndef KFK_ASYNC_HPP_
#define KFK_ASYNC_HPP_

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

#include "kfk-buffer.hpp"
#include "kfk-proc.hpp"

namespace kfk {

class Kfk_Async {
public:
  using ErrorHandler = std::function<void(std::exception_ptr)>;

  class Kfk_Async_Wait {
    friend class Kfk_Async;

  public:
    void wait();

  private:
    std::mutex m_mutex{};
    std::condition_variable m_cond_var{};

    bool m_done{};

    std::exception_ptr m_thrown_exception{};
  };

  /**
   * @brief Construct and start the executor thread.
   *
   * @param name    Textual identifier for diagnostics
   * @param onError Receives exceptions thrown by tasks
   */
  explicit Kfk_Async(std::string_view name = "",
                     ErrorHandler onError = nullptr);
  virtual ~Kfk_Async() noexcept;

  Kfk_Async(const Kfk_Async &obj) = delete;
  const Kfk_Async &operator=(const Kfk_Async &obj) = delete;
  Kfk_Async(Kfk_Async &&obj) = delete;
  Kfk_Async &operator=(Kfk_Async &&obj) = delete;

  void addExecTask(std::function<void()> fnc);

  auto addExecTaskWithWait(std::function<void()> fnc)
      -> std::shared_ptr<Kfk_Async_Wait>;

  void waitForEmpty();

  auto isExecutorThread() const -> bool;

private:
  struct Kfk_Async_State {
    Kfk_Buffer<std::function<void()>> m_tasks{};
    ErrorHandler m_on_error{};

    std::mutex m_mutex{};
    std::exception_ptr m_thrown_exception{};
  };

  static void run(Kfk_Async_State &state);

  std::shared_ptr<Kfk_Async_State> m_state{};

  Kfk_Proc m_proc;
}; // class Kfk_Async

} // namespace kfk

#endif // KFK_ASYNC_HPP_
