/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-test-context.cpp
 * @brief The unit test for Kfk_Context cancellation and deadlines.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "kfk-context.hpp"
#include "kfk-error.hpp"

using namespace std::chrono_literals;

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  auto background = kfk::Kfk_Context::background();
  EXPECT_FALSE(background->err());
  EXPECT_FALSE(background->done());
  EXPECT_FALSE(background->deadline().has_value());
  EXPECT_TRUE(background->remaining(100ms) == 100ms);

  // cancel propagates from parent to child, never the other way
  auto parent = kfk::Kfk_Context::withCancel(background);
  auto child = kfk::Kfk_Context::withCancel(parent);
  auto sibling = kfk::Kfk_Context::withCancel(parent);

  sibling->cancel();
  EXPECT_TRUE(sibling->err() == kfk::Kfk_Errc::kContextCanceled);
  EXPECT_FALSE(parent->done());
  EXPECT_FALSE(child->done());

  parent->cancel();
  EXPECT_TRUE(parent->err() == kfk::Kfk_Errc::kContextCanceled);
  EXPECT_TRUE(child->err() == kfk::Kfk_Errc::kContextCanceled);
  EXPECT_FALSE(background->done());

  // a child of a done parent is done from the start
  auto late = kfk::Kfk_Context::withCancel(parent);
  EXPECT_TRUE(late->done());

  // deadlines
  auto timeout = kfk::Kfk_Context::withTimeout(background, 200ms);
  EXPECT_TRUE(timeout->deadline().has_value());
  EXPECT_FALSE(timeout->done());
  EXPECT_TRUE(timeout->remaining(10s) <= 200ms);
  EXPECT_TRUE(timeout->remaining(10ms) == 10ms);

  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(timeout->waitFor(5s));
  EXPECT_TRUE(std::chrono::steady_clock::now() - start < 4s);
  EXPECT_TRUE(timeout->err() == kfk::Kfk_Errc::kDeadlineExceeded);
  EXPECT_TRUE(timeout->remaining(10s) == std::chrono::steady_clock::duration::zero());

  // a child never outlives the deadline of its parent
  auto shortParent = kfk::Kfk_Context::withTimeout(background, 1s);
  auto longChild = kfk::Kfk_Context::withTimeout(shortParent, 1h);
  EXPECT_TRUE(longChild->deadline() == shortParent->deadline());

  // waitFor returns false on a plain timeout
  auto idle = kfk::Kfk_Context::withCancel(background);
  EXPECT_FALSE(idle->waitFor(50ms));

  // waitFor wakes up on cancel from another thread
  std::thread canceler{[idle]() {
    std::this_thread::sleep_for(100ms);
    idle->cancel();
  }};

  start = std::chrono::steady_clock::now();
  EXPECT_TRUE(idle->waitFor(10s));
  EXPECT_TRUE(std::chrono::steady_clock::now() - start < 5s);
  canceler.join();

  // cancel callbacks run once, a removed callback never runs
  std::atomic<int> fired{};
  auto withCallbacks = kfk::Kfk_Context::withCancel(background);
  withCallbacks->addCancelCallback([&fired]() { fired++; });
  auto removed = withCallbacks->addCancelCallback([&fired]() { fired += 100; });
  withCallbacks->removeCancelCallback(removed);

  withCallbacks->cancel();
  withCallbacks->cancel();
  EXPECT_EQ(1, fired.load());

  // registering on a done context runs the callback right away
  withCallbacks->addCancelCallback([&fired]() { fired++; });
  EXPECT_EQ(2, fired.load());

  // values are seen by descendants, the nearest one wins
  auto traced = kfk::Kfk_Context::withValue(background, "trace_id", "t-1");
  auto request = kfk::Kfk_Context::withValue(traced, "request_id", "r-1");
  auto retraced = kfk::Kfk_Context::withValue(request, "trace_id", "t-2");
  auto bounded = kfk::Kfk_Context::withTimeout(retraced, 1h);

  EXPECT_EQ("t-1", traced->value("trace_id").value_or(""));
  EXPECT_FALSE(traced->value("request_id").has_value());
  EXPECT_EQ("t-1", request->value("trace_id").value_or(""));
  EXPECT_EQ("t-2", bounded->value("trace_id").value_or(""));
  EXPECT_EQ("r-1", bounded->value("request_id").value_or(""));
  EXPECT_FALSE(background->value("trace_id").has_value());

  // a value child is cancelled with its parent
  auto valueParent = kfk::Kfk_Context::withCancel(background);
  auto valued = kfk::Kfk_Context::withValue(valueParent, "trace_id", "t-3");
  valueParent->cancel();
  EXPECT_TRUE(valued->err() == kfk::Kfk_Errc::kContextCanceled);

  return RUN_ALL_TESTS();
}
