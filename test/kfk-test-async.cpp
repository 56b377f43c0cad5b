/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-test-async.cpp
 * @brief The unit test for the Kfk_Proc thread wrapper and the Kfk_Async
 *        serial executor that runs the async produce callbacks.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "kfk-async.hpp"
#include "kfk-proc.hpp"

using namespace std::chrono_literals;

class Counter {
public:
  void increment() {
    m_async.addExecTask([this]() { m_count++; });
  }

  auto value() -> long long {
    m_async.waitForEmpty();

    return m_count;
  }

private:
  kfk::Kfk_Async m_async{"counter"};
  long long m_count{};
};

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  // two threads feed one serial executor, no increment is lost
  Counter cnt{};
  kfk::Kfk_Proc proc1{"proc1", [&cnt]() {
                        for (int n = 0; n < 100; n++) {
                          cnt.increment();
                          kfk::Kfk_Proc::yield();
                        }
                      }};

  kfk::Kfk_Proc proc2{"proc2", [&cnt]() {
                        for (int n = 0; n < 100; n++) {
                          cnt.increment();
                          kfk::Kfk_Proc::yield();
                        }
                      }};

  EXPECT_TRUE(proc1.exec());
  EXPECT_TRUE(proc2.exec());
  EXPECT_TRUE(proc1.wait());
  EXPECT_TRUE(proc2.wait());
  EXPECT_EQ(200, cnt.value());

  // tasks run in submission order on one thread
  std::vector<int> order{};
  {
    kfk::Kfk_Async async{"order"};

    for (int n = 0; n < 10; n++) {
      async.addExecTask([&order, n]() { order.push_back(n); });
    }

    async.waitForEmpty();
  }

  EXPECT_EQ(10, order.size());
  for (int n = 0; n < 10; n++) {
    EXPECT_EQ(n, order[n]);
  }

  // addExecTaskWithWait rethrows the task's exception to the waiter
  kfk::Kfk_Async waiter{"waiter"};
  auto wait = waiter.addExecTaskWithWait(
      []() { throw std::runtime_error("task failed"); });
  EXPECT_THROW(wait->wait(), std::runtime_error);

  // without an error handler a failed task surfaces at waitForEmpty
  waiter.addExecTask([]() { throw std::logic_error("later"); });
  EXPECT_THROW(waiter.waitForEmpty(), std::logic_error);
  EXPECT_NO_THROW(waiter.waitForEmpty());

  // with an error handler the executor keeps going
  std::atomic<int> errors{};
  std::atomic<int> ran{};
  {
    kfk::Kfk_Async handled{"handled", [&errors](std::exception_ptr) {
                             errors++;
                           }};

    handled.addExecTask([]() { throw std::runtime_error("boom"); });
    handled.addExecTask([&ran]() { ran++; });
    EXPECT_NO_THROW(handled.waitForEmpty());
  }

  EXPECT_EQ(1, errors.load());
  EXPECT_EQ(1, ran.load());

  // waitForEmpty from a task returns instead of waiting on itself
  std::atomic<bool> returned{};
  std::atomic<int> behind{};
  {
    kfk::Kfk_Async reentrant{"reentrant"};

    reentrant.addExecTask([&reentrant, &returned]() {
      EXPECT_TRUE(reentrant.isExecutorThread());
      reentrant.waitForEmpty();
      returned = true;
    });
    reentrant.addExecTask([&behind]() { behind++; });

    EXPECT_FALSE(reentrant.isExecutorThread());
    reentrant.waitForEmpty();
  }

  EXPECT_TRUE(returned.load());
  EXPECT_EQ(1, behind.load());

  // a task may destroy its own executor, the queued tasks still run
  std::atomic<int> drained{};
  std::promise<void> done{};
  auto doneFuture = done.get_future();
  {
    auto owned = std::make_unique<kfk::Kfk_Async>("owned");
    auto *raw = owned.get();

    std::mutex gate{};
    std::unique_lock<std::mutex> hold{gate};

    raw->addExecTask([&gate, &owned]() {
      const std::unique_lock<std::mutex> lock{gate};
      owned.reset();
    });
    raw->addExecTask([&drained]() { drained++; });
    raw->addExecTask([&done]() { done.set_value(); });

    hold.unlock();
    EXPECT_EQ(std::future_status::ready, doneFuture.wait_for(10s));
    EXPECT_EQ(nullptr, owned);
  }

  EXPECT_EQ(1, drained.load());

  // a cooperative loop stops on stopExec
  std::atomic<int> loops{};
  kfk::Kfk_Proc poller{"poller"};
  EXPECT_TRUE(poller.exec([&poller, &loops]() {
    while (!poller.isStopRequested()) {
      loops++;
      std::this_thread::sleep_for(1ms);
    }
  }));

  std::this_thread::sleep_for(50ms);
  EXPECT_TRUE(poller.isRunning());
  EXPECT_TRUE(poller.stopExec());
  EXPECT_FALSE(poller.isRunning());
  EXPECT_TRUE(loops.load() > 0);
  EXPECT_EQ("poller", poller.name());

  // the exception of a task is rethrown by wait
  kfk::Kfk_Proc failing{"failing",
                        []() { throw std::runtime_error("proc failed"); }};
  EXPECT_TRUE(failing.exec());
  EXPECT_THROW(failing.wait(), std::runtime_error);

  return RUN_ALL_TESTS();
}
