/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-test-buffer.cpp
 * @brief The unit test for Kfk_Buffer, the FIFO behind the consumer channel
 *        and the async executor.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "kfk-buffer.hpp"
#include "kfk-context.hpp"
#include "kfk-error.hpp"

using namespace std::chrono_literals;

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  kfk::Kfk_Buffer<std::string> buf{"hello", "world"};
  EXPECT_EQ(2, buf.size());
  EXPECT_EQ(0, buf.capacity());

  EXPECT_TRUE(!buf.push("again"));

  auto item = buf.pop();
  EXPECT_TRUE(item && *item == "hello");

  auto items = buf.pop(5, 10ms);
  EXPECT_EQ(2, items.size());
  EXPECT_TRUE(items[0] == "world");
  EXPECT_TRUE(items[1] == "again");

  EXPECT_FALSE(buf.popNoWait().has_value());

  // a bounded buffer blocks the producer until the consumer catches up
  kfk::Kfk_Buffer<int> bounded(2);
  std::vector<int> consumed{};

  std::thread consumer{[&bounded, &consumed]() {
    while (true) {
      auto value = bounded.pop();
      if (!value) {
        break;
      }

      consumed.push_back(*value);
      std::this_thread::sleep_for(1ms);
    }
  }};

  for (int n = 0; n < 50; n++) {
    EXPECT_TRUE(!bounded.push(n));
    EXPECT_TRUE(bounded.size() <= 2);
  }

  EXPECT_EQ(50, bounded.waitForEmpty());
  bounded.close();
  consumer.join();

  EXPECT_EQ(50, consumed.size());
  for (int n = 0; n < 50; n++) {
    EXPECT_EQ(n, consumed[n]);
  }

  // pushing into a closed buffer fails
  EXPECT_TRUE(bounded.isClosed());
  EXPECT_TRUE(bounded.push(99) == kfk::Kfk_Errc::kChannelClosed);
  EXPECT_FALSE(bounded.pop().has_value());

  // a push blocked on a full buffer gives up when its context is done
  kfk::Kfk_Buffer<int> full(1);
  EXPECT_TRUE(!full.push(1));

  auto ctx = kfk::Kfk_Context::withTimeout(kfk::Kfk_Context::background(),
                                           200ms);
  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(full.push(2, ctx) == kfk::Kfk_Errc::kDeadlineExceeded);
  EXPECT_TRUE(std::chrono::steady_clock::now() - start < 5s);
  EXPECT_EQ(1, full.size());

  auto canceled = kfk::Kfk_Context::withCancel(kfk::Kfk_Context::background());
  canceled->cancel();
  EXPECT_TRUE(full.push(3, canceled) == kfk::Kfk_Errc::kContextCanceled);

  // close wakes up a blocked consumer
  kfk::Kfk_Buffer<int> empty{};
  std::thread closer{[&empty]() {
    std::this_thread::sleep_for(100ms);
    empty.close();
  }};

  EXPECT_FALSE(empty.pop().has_value());
  closer.join();

  return RUN_ALL_TESTS();
}
