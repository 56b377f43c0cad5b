/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-test-producer.cpp
 * @brief The unit test for Kfk_Producer against a librdkafka mock cluster.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "kafka/kfk-config.hpp"
#include "kafka/kfk-message.hpp"
#include "kafka/kfk-producer.hpp"
#include "kfk-context.hpp"
#include "kfk-error.hpp"
#include "kfk-test-helper.hpp"
#include "proto/kfk-config.pb.h"

using namespace std::chrono_literals;

class Kfk_ProducerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(m_cluster.createTopic("orders"));
    ASSERT_TRUE(m_cluster.createTopic("payments", 3));

    m_config.brokers = m_cluster.bootstraps();
    m_config.defaultTopic = "orders";
    m_config.requestTimeout = 10s;
  }

  auto open() -> std::unique_ptr<kfk::Kfk_Producer> {
    auto producer = kfk::Kfk_Producer::create(&m_config, m_logger);
    EXPECT_TRUE(producer.has_value());

    return producer ? std::move(*producer) : nullptr;
  }

  kfk::test::MockCluster m_cluster{};
  kfk::Kfk_ProducerConfig m_config{};
  std::shared_ptr<kfk::test::RecordingLogger> m_logger{
      std::make_shared<kfk::test::RecordingLogger>()};
};

TEST(Kfk_Producer, InvalidConfig) {
  auto producer = kfk::Kfk_Producer::create(nullptr);
  ASSERT_FALSE(producer.has_value());
  EXPECT_TRUE(producer.error() == kfk::Kfk_Errc::kMissingBrokers);

  kfk::Kfk_ProducerConfig config{};
  config.brokers = "localhost:9092";
  config.acks = "sometimes";

  producer = kfk::Kfk_Producer::create(&config);
  ASSERT_FALSE(producer.has_value());
  EXPECT_TRUE(producer.error() == kfk::Kfk_Errc::kInvalidAcks);
}

TEST_F(Kfk_ProducerTest, ProduceInOrder) {
  auto producer = open();
  ASSERT_NE(nullptr, producer);
  EXPECT_TRUE(producer->isConnected());
  EXPECT_EQ("orders", producer->config().defaultTopic);
  EXPECT_TRUE(m_logger->find("kafka producer opened").has_value());

  auto ctx = kfk::test::testContext();
  std::vector<kfk::Kfk_Record> records{
      kfk::Kfk_Record::of("one").withKey("k"),
      kfk::Kfk_Record::of("two").withKey("k"),
      kfk::Kfk_Record::of("three").withKey("k").withHeader("trace-id", "t3")};

  auto results = producer->produce(ctx, records);
  ASSERT_TRUE(results.has_value());
  ASSERT_EQ(3, results->size());

  for (std::size_t idx = 0; idx < results->size(); idx++) {
    const auto &result = (*results)[idx];

    EXPECT_FALSE(result.err) << result.err.message();
    EXPECT_EQ("orders", result.topic);
    EXPECT_EQ(0, result.partition);
    EXPECT_EQ(static_cast<std::int64_t>(idx), result.offset);
    EXPECT_EQ(records[idx].value, result.record.value);
  }

  EXPECT_EQ(3, m_logger->count("kafka record sent"));

  auto sent = m_logger->find("kafka record sent");
  ASSERT_TRUE(sent.has_value());
  EXPECT_EQ("kafka-producer", sent->field("component").value_or(""));
  EXPECT_EQ("orders", sent->field("kafka_topic").value_or(""));

  // an explicit topic and partition win over the default
  results = producer->produce(
      ctx, {kfk::Kfk_Record::of("paid").withTopic("payments").withPartition(2)});
  ASSERT_TRUE(results.has_value());
  ASSERT_EQ(1, results->size());
  EXPECT_FALSE(results->front().err);
  EXPECT_EQ("payments", results->front().topic);
  EXPECT_EQ(2, results->front().partition);
  EXPECT_EQ(0, results->front().offset);

  results = producer->produce(ctx, {});
  ASSERT_TRUE(results.has_value());
  EXPECT_TRUE(results->empty());
}

TEST_F(Kfk_ProducerTest, MissingTopicIsPerRecord) {
  m_config.defaultTopic.clear();

  auto producer = open();
  ASSERT_NE(nullptr, producer);

  auto results = producer->produce(
      kfk::test::testContext(),
      {kfk::Kfk_Record::of("no topic"),
       kfk::Kfk_Record::of("has topic").withTopic("orders")});
  ASSERT_TRUE(results.has_value());
  ASSERT_EQ(2, results->size());
  EXPECT_TRUE((*results)[0].err == kfk::Kfk_Errc::kMissingTopic);
  EXPECT_FALSE((*results)[1].err);
  EXPECT_EQ(0, (*results)[1].offset);
  EXPECT_TRUE(m_logger->find("failed to produce record").has_value());
}

TEST_F(Kfk_ProducerTest, Preconditions) {
  auto producer = open();
  ASSERT_NE(nullptr, producer);

  auto results = producer->produce(nullptr, {kfk::Kfk_Record::of("x")});
  ASSERT_FALSE(results.has_value());
  EXPECT_TRUE(results.error() == kfk::Kfk_Errc::kNilContext);

  EXPECT_TRUE(producer->flush(nullptr) == kfk::Kfk_Errc::kNilContext);

  auto txn = producer->beginTransaction(kfk::test::testContext());
  ASSERT_FALSE(txn.has_value());
  EXPECT_TRUE(txn.error() == kfk::Kfk_Errc::kNoTransactionalId);

  EXPECT_TRUE(producer->transactRecords(kfk::test::testContext(),
                                        {kfk::Kfk_Record::of("x")}) ==
              kfk::Kfk_Errc::kNoTransactionalId);
}

TEST_F(Kfk_ProducerTest, ProduceAsyncCallsBackOnce) {
  auto producer = open();
  ASSERT_NE(nullptr, producer);

  std::atomic<int> calls{};
  std::promise<kfk::Kfk_ProduceResult> delivered{};
  auto future = delivered.get_future();

  producer->produceAsync(kfk::test::testContext(),
                         kfk::Kfk_Record::of("async").withKey("a"),
                         [&](const kfk::Kfk_ProduceResult &result) {
                           if (1 == ++calls) {
                             delivered.set_value(result);
                           }
                         });

  ASSERT_EQ(std::future_status::ready, future.wait_for(30s));

  auto result = future.get();
  EXPECT_FALSE(result.err) << result.err.message();
  EXPECT_EQ("orders", result.topic);
  EXPECT_EQ(0, result.offset);
  EXPECT_EQ("async", result.record.value.value_or(""));

  // an empty callback is allowed
  producer->produceAsync(kfk::test::testContext(), kfk::Kfk_Record::of("quiet"),
                         {});
  EXPECT_FALSE(producer->flush(kfk::test::testContext()));

  producer->close();
  EXPECT_EQ(1, calls.load());
}

TEST_F(Kfk_ProducerTest, ProduceAsyncPreconditionFailures) {
  auto producer = open();
  ASSERT_NE(nullptr, producer);

  std::promise<std::error_code> nilCtx{};
  auto nilFuture = nilCtx.get_future();

  producer->produceAsync(nullptr, kfk::Kfk_Record::of("x"),
                         [&](const kfk::Kfk_ProduceResult &result) {
                           nilCtx.set_value(result.err);
                         });

  ASSERT_EQ(std::future_status::ready, nilFuture.wait_for(10s));
  EXPECT_TRUE(nilFuture.get() == kfk::Kfk_Errc::kNilContext);

  producer->close();

  std::atomic<int> calls{};
  std::error_code closedEc{};

  producer->produceAsync(kfk::test::testContext(), kfk::Kfk_Record::of("x"),
                         [&](const kfk::Kfk_ProduceResult &result) {
                           closedEc = result.err;
                           calls++;
                         });

  // the destructor drains the callbacks still queued
  producer.reset();
  EXPECT_EQ(1, calls.load());
  EXPECT_TRUE(closedEc == kfk::Kfk_Errc::kClientClosed);
}

TEST_F(Kfk_ProducerTest, CloseFromCallback) {
  auto producer = open();
  ASSERT_NE(nullptr, producer);

  std::atomic<int> calls{};
  std::promise<void> closed{};
  auto future = closed.get_future();

  auto callback = [&](const kfk::Kfk_ProduceResult &) {
    if (1 == ++calls) {
      producer->close();
      closed.set_value();
    }
  };

  producer->produceAsync(kfk::test::testContext(), kfk::Kfk_Record::of("a"),
                         callback);
  producer->produceAsync(kfk::test::testContext(), kfk::Kfk_Record::of("b"),
                         callback);

  ASSERT_EQ(std::future_status::ready, future.wait_for(30s));
  EXPECT_FALSE(producer->isConnected());
  EXPECT_EQ(1, m_logger->count("kafka producer closed"));

  // the second callback still runs exactly once
  producer.reset();
  EXPECT_EQ(2, calls.load());
}

TEST_F(Kfk_ProducerTest, DestroyFromCallback) {
  auto producer = open();
  ASSERT_NE(nullptr, producer);

  std::promise<void> destroyed{};
  auto future = destroyed.get_future();

  producer->produceAsync(kfk::test::testContext(), kfk::Kfk_Record::of("a"),
                         [&](const kfk::Kfk_ProduceResult &) {
                           producer.reset();
                           destroyed.set_value();
                         });

  ASSERT_EQ(std::future_status::ready, future.wait_for(30s));
  EXPECT_EQ(nullptr, producer);
  EXPECT_EQ(1, m_logger->count("kafka producer closed"));
}

TEST_F(Kfk_ProducerTest, ProduceJson) {
  auto producer = open();
  ASSERT_NE(nullptr, producer);

  kfk::pb::AdminConfigPb message{};
  message.mutable_base()->set_brokers("b1:9092");
  message.mutable_base()->set_max_retries(5);

  auto result = producer->produceJson(kfk::test::testContext(), "payments",
                                      "json-key", message);
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ("payments", result->topic);
  EXPECT_EQ("json-key", result->record.key.value_or(""));

  const auto &json = result->record.value.value_or("");
  EXPECT_NE(std::string::npos, json.find("\"brokers\""));
  EXPECT_NE(std::string::npos, json.find("b1:9092"));

  // an empty topic goes to the default one
  result = producer->produceJson(kfk::test::testContext(), "", std::nullopt,
                                 message);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ("orders", result->topic);
  EXPECT_FALSE(result->record.key.has_value());

  // a duration beyond the protobuf JSON range can not be marshaled
  kfk::pb::ProducerConfigPb invalid{};
  invalid.mutable_linger()->set_seconds(400000000000LL);

  result = producer->produceJson(kfk::test::testContext(), "orders",
                                 std::nullopt, invalid);
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error() == kfk::Kfk_Errc::kMarshal);

  // marshaling comes before the context check
  result = producer->produceJson(nullptr, "orders", std::nullopt, invalid);
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error() == kfk::Kfk_Errc::kMarshal);

  std::promise<kfk::Kfk_ProduceResult> delivered{};
  auto future = delivered.get_future();

  producer->produceJsonAsync(
      kfk::test::testContext(), "orders", "async-json", message,
      [&](const kfk::Kfk_ProduceResult &res) { delivered.set_value(res); });

  ASSERT_EQ(std::future_status::ready, future.wait_for(30s));
  auto asyncResult = future.get();
  EXPECT_FALSE(asyncResult.err);
  EXPECT_EQ("orders", asyncResult.topic);
}

TEST_F(Kfk_ProducerTest, CanceledContext) {
  auto producer = open();
  ASSERT_NE(nullptr, producer);

  auto ctx = kfk::Kfk_Context::withCancel(kfk::Kfk_Context::background());
  ctx->cancel();

  EXPECT_TRUE(producer->flush(ctx) == kfk::Kfk_Errc::kContextCanceled);

  auto results = producer->produce(ctx, {kfk::Kfk_Record::of("late")});
  ASSERT_TRUE(results.has_value());
  ASSERT_EQ(1, results->size());
  EXPECT_TRUE(results->front().err == kfk::Kfk_Errc::kContextCanceled);
}

TEST_F(Kfk_ProducerTest, Close) {
  auto producer = open();
  ASSERT_NE(nullptr, producer);

  auto results =
      producer->produce(kfk::test::testContext(), {kfk::Kfk_Record::of("x")});
  ASSERT_TRUE(results.has_value());

  producer->close();
  producer->close();

  EXPECT_FALSE(producer->isConnected());
  EXPECT_EQ(1, m_logger->count("kafka producer closed"));

  results =
      producer->produce(kfk::test::testContext(), {kfk::Kfk_Record::of("x")});
  ASSERT_FALSE(results.has_value());
  EXPECT_TRUE(results.error() == kfk::Kfk_Errc::kClientClosed);
  EXPECT_TRUE(kfk::isClosedError(results.error()));

  EXPECT_TRUE(producer->flush(kfk::test::testContext()) ==
              kfk::Kfk_Errc::kClientClosed);
}

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
