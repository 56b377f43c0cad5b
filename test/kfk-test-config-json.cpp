/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-test-config-json.cpp
 * @brief The unit test for loading and dumping client configs as JSON.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "kafka/kfk-config-json.hpp"
#include "kafka/kfk-config.hpp"
#include "kfk-error.hpp"

using namespace std::chrono_literals;

TEST(Kfk_ConfigJson, LoadProducer) {
  auto config = kfk::loadProducerConfigJson(R"({
    "base": {
      "brokers": "b1:9092,b2:9092",
      "clientId": "orders-service",
      "requestTimeout": "10s",
      "credential": {"passwordEnvVar": "KAFKA_PASSWORD"}
    },
    "defaultTopic": "orders",
    "acks": "all",
    "linger": "0.100s",
    "idempotent": true
  })");

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ("b1:9092,b2:9092", config->brokers);
  EXPECT_EQ("orders-service", config->clientId);
  EXPECT_EQ(10s, config->requestTimeout);
  EXPECT_EQ("KAFKA_PASSWORD", config->credential.passwordEnvVar);
  EXPECT_EQ("orders", config->defaultTopic);
  EXPECT_EQ("all", config->acks);
  EXPECT_EQ(100ms, config->linger);
  EXPECT_TRUE(config->idempotent);

  // absent fields keep their defaults
  EXPECT_EQ(30s, config->dialTimeout);
  EXPECT_EQ(3, config->maxRetries);
  EXPECT_EQ("none", config->compression);
  EXPECT_EQ(10000, config->batchMaxRecords);
  EXPECT_FALSE(config->tls.has_value());
  EXPECT_FALSE(config->validate());
}

TEST(Kfk_ConfigJson, LoadConsumer) {
  auto config = kfk::loadConsumerConfigJson(R"({
    "base": {
      "brokers": "localhost:9092",
      "tls": {"enable": true, "caFile": "/etc/ssl/ca.pem"}
    },
    "topics": ["orders", "payments"],
    "group": "workers",
    "startOffset": "earliest",
    "autoCommit": false,
    "sessionTimeout": "20s"
  })");

  ASSERT_TRUE(config.has_value());
  ASSERT_EQ(2, config->topics.size());
  EXPECT_EQ("payments", config->topics[1]);
  EXPECT_EQ("workers", config->group);
  EXPECT_EQ("earliest", config->startOffset);
  EXPECT_EQ("read-committed", config->isolationLevel);
  EXPECT_FALSE(config->autoCommit);
  EXPECT_EQ(20s, config->sessionTimeout);
  EXPECT_EQ(3s, config->heartbeatInterval);
  ASSERT_TRUE(config->tls.has_value());
  EXPECT_TRUE(config->tls->enable);
  EXPECT_EQ("/etc/ssl/ca.pem", config->tls->caFile);
}

TEST(Kfk_ConfigJson, LoadDoesNotValidate) {
  auto config = kfk::loadAdminConfigJson(R"({"base": {"authType": "oauth"}})");

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ("oauth", config->authType);
  EXPECT_TRUE(config->validate() == kfk::Kfk_Errc::kMissingBrokers);

  config = kfk::loadAdminConfigJson("{}");
  ASSERT_TRUE(config.has_value());
  EXPECT_TRUE(config->brokers.empty());
}

TEST(Kfk_ConfigJson, MalformedJson) {
  auto unknown = kfk::loadProducerConfigJson(R"({"brokerz": "localhost"})");
  ASSERT_FALSE(unknown.has_value());
  EXPECT_TRUE(unknown.error() == kfk::Kfk_Errc::kConfiguration);

  auto wrongType =
      kfk::loadConsumerConfigJson(R"({"topics": "orders"})");
  ASSERT_FALSE(wrongType.has_value());
  EXPECT_TRUE(wrongType.error() == kfk::Kfk_Errc::kConfiguration);

  auto badDuration = kfk::loadConsumerConfigJson(
      R"({"sessionTimeout": "twenty seconds"})");
  ASSERT_FALSE(badDuration.has_value());
  EXPECT_TRUE(badDuration.error() == kfk::Kfk_Errc::kConfiguration);

  auto truncated = kfk::loadAdminConfigJson(R"({"base": {)");
  ASSERT_FALSE(truncated.has_value());
  EXPECT_TRUE(truncated.error() == kfk::Kfk_Errc::kConfiguration);
}

TEST(Kfk_ConfigJson, DumpOmitsLiteralPasswords) {
  kfk::Kfk_ProducerConfig config{};
  config.brokers = "localhost:9092";
  config.authType = "plain";
  config.username = "alice";
  config.credential.password = "do-not-print";
  config.credential.passwordFile = "/run/secrets/kafka";
  config.linger = 250ms;

  auto json = kfk::dumpConfigJson(config);
  ASSERT_TRUE(json.has_value());
  EXPECT_EQ(std::string::npos, json->find("do-not-print"));
  EXPECT_NE(std::string::npos, json->find("/run/secrets/kafka"));

  auto reloaded = kfk::loadProducerConfigJson(*json);
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ("localhost:9092", reloaded->brokers);
  EXPECT_EQ("plain", reloaded->authType);
  EXPECT_EQ("alice", reloaded->username);
  EXPECT_TRUE(reloaded->credential.password.empty());
  EXPECT_EQ("/run/secrets/kafka", reloaded->credential.passwordFile);
  EXPECT_EQ(250ms, reloaded->linger);
  EXPECT_EQ(config.requestTimeout, reloaded->requestTimeout);
}

TEST(Kfk_ConfigJson, DumpConsumerAndAdmin) {
  kfk::Kfk_ConsumerConfig consumer{};
  consumer.brokers = "localhost:9092";
  consumer.topics = {"orders"};
  consumer.group = "workers";
  consumer.fetchMaxWait = 500ms;

  auto json = kfk::dumpConfigJson(consumer);
  ASSERT_TRUE(json.has_value());

  auto reloaded = kfk::loadConsumerConfigJson(*json);
  ASSERT_TRUE(reloaded.has_value());
  ASSERT_EQ(1, reloaded->topics.size());
  EXPECT_EQ("orders", reloaded->topics[0]);
  EXPECT_EQ("workers", reloaded->group);
  EXPECT_EQ(500ms, reloaded->fetchMaxWait);
  EXPECT_FALSE(reloaded->validate());

  kfk::Kfk_AdminConfig admin{};
  admin.brokers = "localhost:9092";
  admin.authType = "oauth";
  admin.oauthTokenUrl = "https://idp.example.com/token";
  admin.oauthSecret.password = "client-secret";

  json = kfk::dumpConfigJson(admin);
  ASSERT_TRUE(json.has_value());
  EXPECT_EQ(std::string::npos, json->find("client-secret"));

  auto adminReloaded = kfk::loadAdminConfigJson(*json);
  ASSERT_TRUE(adminReloaded.has_value());
  EXPECT_EQ("https://idp.example.com/token", adminReloaded->oauthTokenUrl);
  EXPECT_FALSE(adminReloaded->validate());
}

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
