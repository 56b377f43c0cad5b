/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-test-admin.cpp
 * @brief The unit test for Kfk_Admin. The cluster inspection calls run
 *        against a librdkafka mock cluster, which does not serve the topic
 *        and group management requests, so those are covered for their
 *        argument and lifecycle handling.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "kafka/kfk-admin.hpp"
#include "kafka/kfk-config.hpp"
#include "kfk-context.hpp"
#include "kfk-error.hpp"
#include "kfk-test-helper.hpp"

using namespace std::chrono_literals;

class Kfk_AdminTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(m_cluster.createTopic("orders", 3));
    ASSERT_TRUE(m_cluster.createTopic("payments"));

    kfk::Kfk_AdminConfig config{};
    config.brokers = m_cluster.bootstraps();
    config.requestTimeout = 10s;

    auto admin = kfk::Kfk_Admin::create(&config, m_logger);
    ASSERT_TRUE(admin.has_value()) << admin.error().message();

    m_admin = std::move(*admin);
  }

  kfk::test::MockCluster m_cluster{3};
  std::shared_ptr<kfk::test::RecordingLogger> m_logger{
      std::make_shared<kfk::test::RecordingLogger>()};
  std::unique_ptr<kfk::Kfk_Admin> m_admin{};
};

TEST(Kfk_Admin, InvalidConfig) {
  auto admin = kfk::Kfk_Admin::create(nullptr);
  ASSERT_FALSE(admin.has_value());
  EXPECT_TRUE(admin.error() == kfk::Kfk_Errc::kMissingBrokers);

  kfk::Kfk_AdminConfig config{};
  config.brokers = "localhost:9092";
  config.authType = "aws-msk-iam";

  admin = kfk::Kfk_Admin::create(&config);
  ASSERT_FALSE(admin.has_value());
  EXPECT_TRUE(admin.error() == kfk::Kfk_Errc::kMissingAwsRegion);
}

TEST(Kfk_Admin, TopicConfigBuilder) {
  auto topic = kfk::Kfk_TopicConfig::of("audit", 6, 3);
  topic.withConfig("retention.ms", "3600000")
      .withConfig("cleanup.policy", "compact")
      .withConfig("retention.ms", "7200000");

  EXPECT_EQ("audit", topic.name);
  EXPECT_EQ(6, topic.partitions);
  EXPECT_EQ(3, topic.replicationFactor);
  ASSERT_EQ(2, topic.configs.size());
  EXPECT_EQ("7200000", topic.configs.at("retention.ms"));

  kfk::Kfk_TopicConfig defaults{};
  EXPECT_EQ(1, defaults.partitions);
  EXPECT_EQ(1, defaults.replicationFactor);
}

TEST_F(Kfk_AdminTest, ListAndDescribeTopics) {
  EXPECT_TRUE(m_admin->isConnected());
  EXPECT_TRUE(m_logger->find("kafka admin opened").has_value());

  auto ctx = kfk::test::testContext();

  auto topics = m_admin->listTopics(ctx);
  ASSERT_TRUE(topics.has_value()) << topics.error().message();
  ASSERT_TRUE(topics->contains("orders"));
  ASSERT_TRUE(topics->contains("payments"));

  const auto &orders = topics->at("orders");
  EXPECT_EQ("orders", orders.name);
  EXPECT_FALSE(orders.internal);
  ASSERT_EQ(3, orders.partitions.size());

  std::set<std::int32_t> ids{};
  for (const auto &partition : orders.partitions) {
    ids.insert(partition.id);
    EXPECT_GE(partition.leader, 0);
    EXPECT_EQ(1, partition.replicas.size());
  }
  EXPECT_EQ((std::set<std::int32_t>{0, 1, 2}), ids);

  // missing topics are left out, the rest keep the order asked for
  auto described =
      m_admin->describeTopics(ctx, {"payments", "missing", "orders"});
  ASSERT_TRUE(described.has_value());
  ASSERT_EQ(2, described->size());
  EXPECT_EQ("payments", (*described)[0].name);
  EXPECT_EQ(1, (*described)[0].partitions.size());
  EXPECT_EQ("orders", (*described)[1].name);

  auto none = m_admin->describeTopics(ctx, {});
  ASSERT_TRUE(none.has_value());
  EXPECT_TRUE(none->empty());

  EXPECT_TRUE(m_admin->topicExists(ctx, "orders").value_or(false));
  EXPECT_FALSE(m_admin->topicExists(ctx, "missing").value_or(true));
}

TEST_F(Kfk_AdminTest, ListBrokers) {
  auto brokers = m_admin->listBrokers(kfk::test::testContext());
  ASSERT_TRUE(brokers.has_value()) << brokers.error().message();
  ASSERT_EQ(3, brokers->size());

  std::set<std::int32_t> ids{};
  for (const auto &broker : *brokers) {
    ids.insert(broker.id);
    EXPECT_FALSE(broker.host.empty());
    EXPECT_GT(broker.port, 0);
  }

  EXPECT_EQ(3, ids.size());
}

TEST_F(Kfk_AdminTest, NilContext) {
  EXPECT_TRUE(m_admin->createTopics(nullptr, {kfk::Kfk_TopicConfig::of(
                                                 "audit", 1, 1)}) ==
              kfk::Kfk_Errc::kNilContext);
  EXPECT_TRUE(m_admin->deleteTopics(nullptr, {"orders"}) ==
              kfk::Kfk_Errc::kNilContext);
  EXPECT_TRUE(m_admin->listTopics(nullptr).error() ==
              kfk::Kfk_Errc::kNilContext);
  EXPECT_TRUE(m_admin->describeTopics(nullptr, {"orders"}).error() ==
              kfk::Kfk_Errc::kNilContext);
  EXPECT_TRUE(m_admin->topicExists(nullptr, "orders").error() ==
              kfk::Kfk_Errc::kNilContext);
  EXPECT_TRUE(m_admin->listBrokers(nullptr).error() ==
              kfk::Kfk_Errc::kNilContext);
  EXPECT_TRUE(m_admin->listGroups(nullptr).error() ==
              kfk::Kfk_Errc::kNilContext);
  EXPECT_TRUE(m_admin->describeGroups(nullptr, {"workers"}).error() ==
              kfk::Kfk_Errc::kNilContext);
  EXPECT_TRUE(m_admin->deleteGroups(nullptr, {"workers"}) ==
              kfk::Kfk_Errc::kNilContext);
}

TEST_F(Kfk_AdminTest, EmptyRequests) {
  auto ctx = kfk::test::testContext();

  EXPECT_FALSE(m_admin->createTopics(ctx, {}));
  EXPECT_FALSE(m_admin->deleteTopics(ctx, {}));
  EXPECT_FALSE(m_admin->deleteGroups(ctx, {}));

  auto groups = m_admin->describeGroups(ctx, {});
  ASSERT_TRUE(groups.has_value());
  EXPECT_TRUE(groups->empty());

  EXPECT_FALSE(m_logger->find("creating kafka topic").has_value());
  EXPECT_FALSE(m_logger->find("deleting kafka topics").has_value());
}

TEST_F(Kfk_AdminTest, DescribeGroupsFailsOnFailingGroup) {
  m_cluster.pushRequestErrors(
      kfk::test::kApiDescribeGroups,
      {RD_KAFKA_RESP_ERR_GROUP_AUTHORIZATION_FAILED,
       RD_KAFKA_RESP_ERR_GROUP_AUTHORIZATION_FAILED});

  auto groups =
      m_admin->describeGroups(kfk::test::testContext(), {"workers", "audit"});
  ASSERT_FALSE(groups.has_value());
  EXPECT_TRUE(groups.error());

  auto perGroup = m_logger->find("failed to describe kafka consumer group");
  auto whole = m_logger->find("failed to describe kafka consumer groups");
  ASSERT_TRUE(perGroup.has_value() || whole.has_value());

  if (perGroup) {
    auto group = perGroup->field("kafka_group");
    ASSERT_TRUE(group.has_value());
    EXPECT_TRUE("workers" == *group || "audit" == *group);
    EXPECT_TRUE(perGroup->field("error").has_value());
  }
}

TEST_F(Kfk_AdminTest, InvalidTopic) {
  auto ec = m_admin->createTopics(kfk::test::testContext(),
                                  {kfk::Kfk_TopicConfig::of("audit", -5, 1)});
  EXPECT_TRUE(ec == kfk::Kfk_Errc::kConfiguration);
  EXPECT_TRUE(m_logger->find("invalid kafka topic").has_value());
}

TEST_F(Kfk_AdminTest, Close) {
  m_admin->close();
  m_admin->close();

  EXPECT_FALSE(m_admin->isConnected());
  EXPECT_EQ(1, m_logger->count("kafka admin closed"));

  auto ctx = kfk::test::testContext();

  EXPECT_TRUE(m_admin->createTopics(ctx, {}) == kfk::Kfk_Errc::kClientClosed);
  EXPECT_TRUE(m_admin->deleteTopics(ctx, {"orders"}) ==
              kfk::Kfk_Errc::kClientClosed);
  EXPECT_TRUE(m_admin->listTopics(ctx).error() ==
              kfk::Kfk_Errc::kClientClosed);
  EXPECT_TRUE(m_admin->listBrokers(ctx).error() ==
              kfk::Kfk_Errc::kClientClosed);
  EXPECT_TRUE(m_admin->listGroups(ctx).error() ==
              kfk::Kfk_Errc::kClientClosed);
  EXPECT_TRUE(m_admin->describeGroups(ctx, {}).error() ==
              kfk::Kfk_Errc::kClientClosed);
  EXPECT_TRUE(m_admin->deleteGroups(ctx, {"workers"}) ==
              kfk::Kfk_Errc::kClientClosed);
}

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
