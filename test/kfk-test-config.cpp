/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-test-config.cpp
 * @brief The unit test for config validation, option normalization,
 *        credential sources and the translation to librdkafka properties.
 */

#include <gtest/gtest.h>

#include <stdlib.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

#include "kafka/kfk-config.hpp"
#include "kfk-error.hpp"
#include "kfk-test-helper.hpp"

using namespace std::chrono_literals;

namespace {

auto property(const kfk::Kfk_ConfigProperties &properties, std::string_view key)
    -> std::string {
  return kfk::findProperty(properties, key).value_or("<unset>");
}

} // namespace

TEST(Kfk_Config, BaseValidationOrder) {
  kfk::Kfk_BaseConfig config{};
  EXPECT_TRUE(config.validate() == kfk::Kfk_Errc::kMissingBrokers);

  config.brokers = " , ";
  EXPECT_TRUE(config.validate() == kfk::Kfk_Errc::kMissingBrokers);

  config.brokers = "localhost:9092";
  EXPECT_FALSE(config.validate());

  config.authType = "kerberos";
  EXPECT_TRUE(config.validate() == kfk::Kfk_Errc::kInvalidAuthType);

  config.authType = "AWS-MSK-IAM";
  EXPECT_TRUE(config.validate() == kfk::Kfk_Errc::kMissingAwsRegion);

  config.awsRegion = "eu-west-1";
  EXPECT_FALSE(config.validate());

  config.authType = "oauth";
  EXPECT_TRUE(config.validate() == kfk::Kfk_Errc::kMissingOAuthTokenUrl);

  // brokers are checked before the auth type
  config.brokers.clear();
  EXPECT_TRUE(config.validate() == kfk::Kfk_Errc::kMissingBrokers);
}

TEST(Kfk_Config, Normalization) {
  EXPECT_EQ(kfk::kAuthScram256, kfk::normalizeAuthType("scram256").value());
  EXPECT_EQ(kfk::kAuthScram512, kfk::normalizeAuthType("SCRAM-512").value());
  EXPECT_EQ(kfk::kAuthNone, kfk::normalizeAuthType("").value());
  EXPECT_FALSE(kfk::normalizeAuthType("gssapi").has_value());

  EXPECT_EQ(kfk::kAcksLeader, kfk::normalizeAcks("").value());
  EXPECT_EQ(kfk::kAcksAll, kfk::normalizeAcks("ALL").value());
  EXPECT_FALSE(kfk::normalizeAcks("-1").has_value());

  EXPECT_EQ(kfk::kCompressionZstd, kfk::normalizeCompression("zstd").value());
  EXPECT_FALSE(kfk::normalizeCompression("brotli").has_value());

  EXPECT_EQ(kfk::kOffsetEarliest, kfk::normalizeStartOffset("start").value());
  EXPECT_EQ(kfk::kOffsetLatest, kfk::normalizeStartOffset("end").value());
  EXPECT_EQ(kfk::kOffsetLatest, kfk::normalizeStartOffset("").value());
  EXPECT_FALSE(kfk::normalizeStartOffset("middle").has_value());

  EXPECT_EQ(kfk::kIsolationReadUncommitted,
            kfk::normalizeIsolationLevel("uncommitted").value());
  EXPECT_EQ(kfk::kIsolationReadCommitted,
            kfk::normalizeIsolationLevel("").value());
  EXPECT_FALSE(kfk::normalizeIsolationLevel("serializable").has_value());
}

TEST(Kfk_Config, ProducerAndConsumerValidation) {
  kfk::Kfk_ProducerConfig producer{};
  producer.brokers = "localhost:9092";
  EXPECT_FALSE(producer.validate());

  producer.acks = "maybe";
  producer.compression = "brotli";
  EXPECT_TRUE(producer.validate() == kfk::Kfk_Errc::kInvalidAcks);

  producer.acks = "all";
  EXPECT_TRUE(producer.validate() == kfk::Kfk_Errc::kInvalidCompression);

  kfk::Kfk_ConsumerConfig consumer{};
  consumer.brokers = "localhost:9092";
  EXPECT_TRUE(consumer.validate() == kfk::Kfk_Errc::kMissingTopic);

  consumer.topics = {"orders"};
  EXPECT_FALSE(consumer.validate());

  consumer.startOffset = "middle";
  consumer.isolationLevel = "serializable";
  EXPECT_TRUE(consumer.validate() == kfk::Kfk_Errc::kInvalidOffset);

  consumer.startOffset = "earliest";
  EXPECT_TRUE(consumer.validate() == kfk::Kfk_Errc::kInvalidIsolation);
}

TEST(Kfk_Config, ProducerProperties) {
  kfk::Kfk_ProducerConfig config{};
  config.brokers = "b1:9092, b2:9092";
  config.clientId = "orders-service";
  config.acks = "none";
  config.compression = "LZ4";
  config.linger = 5ms;

  auto properties = kfk::producerProperties(config);
  ASSERT_TRUE(properties.has_value());
  EXPECT_EQ("b1:9092,b2:9092", property(*properties, "bootstrap.servers"));
  EXPECT_EQ("orders-service", property(*properties, "client.id"));
  EXPECT_EQ("0", property(*properties, "acks"));
  EXPECT_EQ("lz4", property(*properties, "compression.type"));
  EXPECT_EQ("5", property(*properties, "linger.ms"));
  EXPECT_EQ("10000", property(*properties, "batch.num.messages"));
  EXPECT_EQ("1048576", property(*properties, "batch.size"));
  EXPECT_EQ("30000", property(*properties, "socket.timeout.ms"));
  EXPECT_EQ("100", property(*properties, "retry.backoff.ms"));
  EXPECT_EQ("3", property(*properties, "retries"));
  EXPECT_EQ("plaintext", property(*properties, "security.protocol"));
  EXPECT_EQ("<unset>", property(*properties, "enable.idempotence"));

  // idempotence forces acks=all
  config.idempotent = true;
  properties = kfk::producerProperties(config);
  ASSERT_TRUE(properties.has_value());
  EXPECT_EQ("all", property(*properties, "acks"));
  EXPECT_EQ("true", property(*properties, "enable.idempotence"));
  EXPECT_EQ("1",
            property(*properties, "max.in.flight.requests.per.connection"));

  config.idempotent = false;
  config.transactionalId = "orders-txn";
  properties = kfk::producerProperties(config);
  ASSERT_TRUE(properties.has_value());
  EXPECT_EQ("orders-txn", property(*properties, "transactional.id"));
  EXPECT_EQ("all", property(*properties, "acks"));

  config.acks = "bogus";
  EXPECT_TRUE(kfk::producerProperties(config).error() ==
              kfk::Kfk_Errc::kInvalidAcks);
}

TEST(Kfk_Config, ConsumerProperties) {
  kfk::Kfk_ConsumerConfig config{};
  config.brokers = "localhost:9092";
  config.topics = {"orders"};
  config.group = "workers";
  config.startOffset = "start";
  config.isolationLevel = "uncommitted";
  config.autoCommit = false;

  auto properties = kfk::consumerProperties(config);
  ASSERT_TRUE(properties.has_value());
  EXPECT_EQ("workers", property(*properties, "group.id"));
  EXPECT_EQ("earliest", property(*properties, "auto.offset.reset"));
  EXPECT_EQ("read_uncommitted", property(*properties, "isolation.level"));
  EXPECT_EQ("false", property(*properties, "enable.auto.commit"));
  EXPECT_EQ("45000", property(*properties, "session.timeout.ms"));
  EXPECT_EQ("3000", property(*properties, "heartbeat.interval.ms"));
  EXPECT_EQ("60000", property(*properties, "max.poll.interval.ms"));
  EXPECT_EQ("5000", property(*properties, "fetch.wait.max.ms"));
  EXPECT_EQ("<unset>", property(*properties, "auto.commit.interval.ms"));

  // without a group there is nothing to commit to
  config.group.clear();
  config.autoCommit = true;
  properties = kfk::consumerProperties(config);
  ASSERT_TRUE(properties.has_value());
  EXPECT_EQ("<unset>", property(*properties, "group.id"));
  EXPECT_EQ("false", property(*properties, "enable.auto.commit"));
  EXPECT_EQ("false", property(*properties, "enable.auto.offset.store"));
}

TEST(Kfk_Config, SaslAndTls) {
  kfk::Kfk_AdminConfig config{};
  config.brokers = "localhost:9093";
  config.authType = "scram512";
  config.username = "alice";
  config.credential.password = "s3cret";
  config.tls = kfk::Kfk_TlsConfig{};
  config.tls->enable = true;
  config.tls->caFile = "/etc/ssl/ca.pem";
  config.tls->insecureSkipVerify = true;

  auto properties = kfk::adminProperties(config);
  ASSERT_TRUE(properties.has_value());
  EXPECT_EQ("sasl_ssl", property(*properties, "security.protocol"));
  EXPECT_EQ("SCRAM-SHA-512", property(*properties, "sasl.mechanisms"));
  EXPECT_EQ("alice", property(*properties, "sasl.username"));
  EXPECT_EQ("s3cret", property(*properties, "sasl.password"));
  EXPECT_EQ("/etc/ssl/ca.pem", property(*properties, "ssl.ca.location"));
  EXPECT_EQ("false",
            property(*properties, "enable.ssl.certificate.verification"));

  // oauth without a token provider uses the OIDC client credentials flow
  config.authType = "oauth";
  config.tls.reset();
  config.oauthTokenUrl = "https://idp.example.com/token";
  config.oauthClientId = "svc";
  config.oauthSecret.password = "client-secret";
  config.oauthScope = "kafka";

  properties = kfk::adminProperties(config);
  ASSERT_TRUE(properties.has_value());
  EXPECT_EQ("sasl_plaintext", property(*properties, "security.protocol"));
  EXPECT_EQ("OAUTHBEARER", property(*properties, "sasl.mechanisms"));
  EXPECT_EQ("oidc", property(*properties, "sasl.oauthbearer.method"));
  EXPECT_EQ("https://idp.example.com/token",
            property(*properties, "sasl.oauthbearer.token.endpoint.url"));
  EXPECT_EQ("client-secret",
            property(*properties, "sasl.oauthbearer.client.secret"));
  EXPECT_EQ("kafka", property(*properties, "sasl.oauthbearer.scope"));

  // aws-msk-iam needs a token provider to sign its tokens
  config.authType = "aws-msk-iam";
  config.awsRegion = "eu-west-1";
  EXPECT_TRUE(kfk::adminProperties(config).error() ==
              kfk::Kfk_Errc::kMissingTokenProvider);

  config.tokenProvider = []() -> std::expected<kfk::Kfk_OAuthToken, std::string> {
    return kfk::Kfk_OAuthToken{"token", std::chrono::system_clock::now() + 1h,
                               "alice"};
  };
  properties = kfk::adminProperties(config);
  ASSERT_TRUE(properties.has_value());
  EXPECT_EQ("OAUTHBEARER", property(*properties, "sasl.mechanisms"));
  EXPECT_EQ("<unset>", property(*properties, "sasl.oauthbearer.method"));
}

TEST(Kfk_Config, CredentialSources) {
  kfk::Kfk_Credential literal{};
  EXPECT_FALSE(literal.isSet());
  EXPECT_EQ("", literal.fetch().value());

  literal.password = "inline";
  EXPECT_TRUE(literal.isSet());
  EXPECT_EQ("inline", literal.fetch().value());

  // an environment variable is read once and then removed
  setenv("KFK_TEST_PASSWORD", "from-env", 1);
  kfk::Kfk_Credential env{};
  env.passwordEnvVar = "KFK_TEST_PASSWORD";
  EXPECT_EQ("from-env", env.fetch().value());
  EXPECT_EQ(nullptr, getenv("KFK_TEST_PASSWORD"));
  EXPECT_TRUE(env.fetch().error() == kfk::Kfk_Errc::kCredential);

  char path[] = "/tmp/kfk-test-credential-XXXXXX";
  int fd = mkstemp(path);
  ASSERT_TRUE(fd >= 0);
  close(fd);

  {
    std::ofstream file{path};
    file << "from-file\n";
  }

  kfk::Kfk_Credential file{};
  file.passwordFile = path;
  EXPECT_EQ("from-file", file.fetch().value());
  std::remove(path);

  EXPECT_TRUE(file.fetch().error() == kfk::Kfk_Errc::kCredential);

  // a credential that can not be read fails the translation
  kfk::Kfk_ProducerConfig config{};
  config.brokers = "localhost:9092";
  config.authType = "plain";
  config.credential.passwordEnvVar = "KFK_TEST_PASSWORD_MISSING";
  EXPECT_TRUE(kfk::producerProperties(config).error() ==
              kfk::Kfk_Errc::kCredential);
}

TEST(Kfk_Config, BuildKafkaConf) {
  kfk::test::RecordingLogger logger{};

  kfk::Kfk_ConfigProperties properties{{"bootstrap.servers", "localhost:9092"},
                                       {"linger.ms", "5"}};
  auto conf = kfk::buildKafkaConf(properties, logger);
  EXPECT_TRUE(conf.has_value());

  kfk::Kfk_ConfigProperties bad{{"no.such.property", "1"}};
  auto failed = kfk::buildKafkaConf(bad, logger);
  ASSERT_FALSE(failed.has_value());
  EXPECT_TRUE(failed.error() == kfk::Kfk_Errc::kConfiguration);
  EXPECT_FALSE(logger.entries().empty());
}

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
