/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-config.cpp
 * @brief Validation of the kfk configs and their translation into
 *        librdkafka properties.
 */

#include "kafka/kfk-config.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <expected>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "rdkafka.h"

#include "kafka/kfk-kafka-util.hpp"
#include "kfk-error.hpp"
#include "kfk-log.hpp"
#include "kfk-util.hpp"

namespace kfk {

namespace {

constexpr std::string_view kSecretProperties[]{
    "sasl.password", "sasl.oauthbearer.client.secret", "ssl.key.password"};

auto normalize(std::string_view value, std::string_view defaultValue,
               std::initializer_list<std::pair<std::string_view,
                                               std::string_view>> accepted)
    -> std::optional<std::string_view> {
  if (value.empty()) {
    return defaultValue;
  }

  auto lowered = toLower(value);
  for (const auto &[spelling, canonical] : accepted) {
    if (lowered == spelling) {
      return canonical;
    }
  }

  return std::nullopt;
}

auto toMs(std::chrono::milliseconds duration) -> std::string {
  return std::to_string(duration.count());
}

void add(Kfk_ConfigProperties &properties, std::string key,
         std::string value) {
  properties.emplace_back(std::move(key), std::move(value));
}

} // namespace

auto Kfk_Credential::isSet() const -> bool {
  return !password.empty() || !passwordEnvVar.empty() ||
         !passwordFile.empty();
}

auto Kfk_Credential::fetch() const
    -> std::expected<std::string, std::error_code> {
  if (!password.empty()) {
    return password;
  }

  if (!passwordEnvVar.empty()) {
    const char *value = std::getenv(passwordEnvVar.c_str());
    if (nullptr == value) {
      return std::unexpected(make_error_code(Kfk_Errc::kCredential));
    }

    std::string secret{value};
    unsetenv(passwordEnvVar.c_str());

    return secret;
  }

  if (!passwordFile.empty()) {
    std::ifstream file{passwordFile, std::ios::binary};
    if (!file) {
      return std::unexpected(make_error_code(Kfk_Errc::kCredential));
    }

    std::string secret{std::istreambuf_iterator<char>{file},
                       std::istreambuf_iterator<char>{}};
    if (file.bad()) {
      secureZero(secret);

      return std::unexpected(make_error_code(Kfk_Errc::kCredential));
    }

    if (!secret.empty() && '\n' == secret.back()) {
      secret.pop_back();

      if (!secret.empty() && '\r' == secret.back()) {
        secret.pop_back();
      }
    }

    return secret;
  }

  return std::string{};
}

auto normalizeAuthType(std::string_view authType)
    -> std::optional<std::string_view> {
  return normalize(authType, kAuthNone,
                   {{"none", kAuthNone},
                    {"plain", kAuthPlain},
                    {"scram-256", kAuthScram256},
                    {"scram256", kAuthScram256},
                    {"scram-512", kAuthScram512},
                    {"scram512", kAuthScram512},
                    {"aws-msk-iam", kAuthAwsMskIam},
                    {"oauth", kAuthOAuth}});
}

auto normalizeAcks(std::string_view acks) -> std::optional<std::string_view> {
  return normalize(acks, kAcksLeader,
                   {{"none", kAcksNone},
                    {"leader", kAcksLeader},
                    {"all", kAcksAll}});
}

auto normalizeCompression(std::string_view compression)
    -> std::optional<std::string_view> {
  return normalize(compression, kCompressionNone,
                   {{"none", kCompressionNone},
                    {"gzip", kCompressionGzip},
                    {"snappy", kCompressionSnappy},
                    {"lz4", kCompressionLz4},
                    {"zstd", kCompressionZstd}});
}

auto normalizeStartOffset(std::string_view offset)
    -> std::optional<std::string_view> {
  return normalize(offset, kOffsetLatest,
                   {{"earliest", kOffsetEarliest},
                    {"start", kOffsetEarliest},
                    {"latest", kOffsetLatest},
                    {"end", kOffsetLatest}});
}

auto normalizeIsolationLevel(std::string_view isolation)
    -> std::optional<std::string_view> {
  return normalize(isolation, kIsolationReadCommitted,
                   {{"read-uncommitted", kIsolationReadUncommitted},
                    {"uncommitted", kIsolationReadUncommitted},
                    {"read-committed", kIsolationReadCommitted},
                    {"committed", kIsolationReadCommitted}});
}

auto Kfk_BaseConfig::validate() const -> std::error_code {
  if (brokerList().empty()) {
    return Kfk_Errc::kMissingBrokers;
  }

  auto auth = normalizeAuthType(authType);
  if (!auth) {
    return Kfk_Errc::kInvalidAuthType;
  }

  if (kAuthAwsMskIam == *auth && awsRegion.empty()) {
    return Kfk_Errc::kMissingAwsRegion;
  }

  if (kAuthOAuth == *auth && oauthTokenUrl.empty()) {
    return Kfk_Errc::kMissingOAuthTokenUrl;
  }

  return {};
}

auto Kfk_BaseConfig::brokerList() const -> std::vector<std::string> {
  return split(brokers, ',');
}

auto Kfk_ProducerConfig::validate() const -> std::error_code {
  if (auto ec = Kfk_BaseConfig::validate(); ec) {
    return ec;
  }

  if (!normalizeAcks(acks)) {
    return Kfk_Errc::kInvalidAcks;
  }

  if (!normalizeCompression(compression)) {
    return Kfk_Errc::kInvalidCompression;
  }

  return {};
}

auto Kfk_ConsumerConfig::validate() const -> std::error_code {
  if (auto ec = Kfk_BaseConfig::validate(); ec) {
    return ec;
  }

  bool has_topic{};
  for (const auto &topic : topics) {
    has_topic = has_topic || !trim(topic).empty();
  }

  if (!has_topic) {
    return Kfk_Errc::kMissingTopic;
  }

  if (!normalizeStartOffset(startOffset)) {
    return Kfk_Errc::kInvalidOffset;
  }

  if (!normalizeIsolationLevel(isolationLevel)) {
    return Kfk_Errc::kInvalidIsolation;
  }

  return {};
}

auto baseProperties(const Kfk_BaseConfig &config)
    -> std::expected<Kfk_ConfigProperties, std::error_code> {
  Kfk_ConfigProperties properties{};

  if (auto ec = config.validate(); ec) {
    return std::unexpected(ec);
  }

  auto auth = *normalizeAuthType(config.authType);
  bool tls_enabled = config.tls && config.tls->enable;

  if (kAuthAwsMskIam == auth && !config.tokenProvider) {
    return std::unexpected(make_error_code(Kfk_Errc::kMissingTokenProvider));
  }

  add(properties, "bootstrap.servers", join(config.brokerList(), ","));

  if (!config.clientId.empty()) {
    add(properties, "client.id", config.clientId);
  }

  add(properties, "socket.connection.setup.timeout.ms",
      toMs(config.dialTimeout));
  add(properties, "socket.timeout.ms", toMs(config.requestTimeout));
  add(properties, "retry.backoff.ms", toMs(config.retryBackoff));

  if (kAuthNone == auth) {
    add(properties, "security.protocol", tls_enabled ? "ssl" : "plaintext");
  } else {
    add(properties, "security.protocol",
        tls_enabled ? "sasl_ssl" : "sasl_plaintext");
  }

  if (kAuthPlain == auth || kAuthScram256 == auth || kAuthScram512 == auth) {
    std::string mechanism{"PLAIN"};

    if (kAuthScram256 == auth) {
      mechanism = "SCRAM-SHA-256";
    } else if (kAuthScram512 == auth) {
      mechanism = "SCRAM-SHA-512";
    }

    add(properties, "sasl.mechanisms", mechanism);
    add(properties, "sasl.username", config.username);

    auto password = config.credential.fetch();
    if (!password) {
      return std::unexpected(password.error());
    }

    add(properties, "sasl.password", std::move(*password));
  } else if (kAuthAwsMskIam == auth) {
    add(properties, "sasl.mechanisms", "OAUTHBEARER");
  } else if (kAuthOAuth == auth) {
    add(properties, "sasl.mechanisms", "OAUTHBEARER");

    if (!config.tokenProvider) {
      add(properties, "sasl.oauthbearer.method", "oidc");
      add(properties, "sasl.oauthbearer.token.endpoint.url",
          config.oauthTokenUrl);
      add(properties, "sasl.oauthbearer.client.id", config.oauthClientId);

      auto secret = config.oauthSecret.fetch();
      if (!secret) {
        return std::unexpected(secret.error());
      }

      add(properties, "sasl.oauthbearer.client.secret", std::move(*secret));

      if (!config.oauthScope.empty()) {
        add(properties, "sasl.oauthbearer.scope", config.oauthScope);
      }
    }
  }

  if (tls_enabled) {
    const auto &tls = *config.tls;

    if (!tls.caFile.empty()) {
      add(properties, "ssl.ca.location", tls.caFile);
    }

    if (!tls.certFile.empty()) {
      add(properties, "ssl.certificate.location", tls.certFile);
    }

    if (!tls.keyFile.empty()) {
      add(properties, "ssl.key.location", tls.keyFile);
    }

    if (tls.keyPassword.isSet()) {
      auto key_password = tls.keyPassword.fetch();
      if (!key_password) {
        return std::unexpected(key_password.error());
      }

      add(properties, "ssl.key.password", std::move(*key_password));
    }

    if (tls.insecureSkipVerify) {
      add(properties, "enable.ssl.certificate.verification", "false");
      add(properties, "ssl.endpoint.identification.algorithm", "none");
    }
  }

  return properties;
}

auto producerProperties(const Kfk_ProducerConfig &config)
    -> std::expected<Kfk_ConfigProperties, std::error_code> {
  if (auto ec = config.validate(); ec) {
    return std::unexpected(ec);
  }

  auto properties = baseProperties(config);
  if (!properties) {
    return properties;
  }

  auto acks = *normalizeAcks(config.acks);
  bool idempotent = config.idempotent || !config.transactionalId.empty();

  // librdkafka refuses idempotence with anything but acks=all
  if (idempotent) {
    acks = kAcksAll;
  }

  add(*properties, "retries", std::to_string(config.maxRetries));

  if (kAcksNone == acks) {
    add(*properties, "acks", "0");
  } else if (kAcksLeader == acks) {
    add(*properties, "acks", "1");
  } else {
    add(*properties, "acks", "all");
  }

  add(*properties, "compression.type",
      std::string{*normalizeCompression(config.compression)});
  add(*properties, "batch.num.messages",
      std::to_string(config.batchMaxRecords));
  add(*properties, "batch.size", std::to_string(config.batchMaxBytes));
  add(*properties, "linger.ms", toMs(config.linger));

  if (idempotent) {
    add(*properties, "enable.idempotence", "true");
  }

  if (config.idempotent) {
    add(*properties, "max.in.flight.requests.per.connection", "1");
  }

  if (!config.transactionalId.empty()) {
    add(*properties, "transactional.id", config.transactionalId);
    add(*properties, "transaction.timeout.ms",
        toMs(std::max(config.requestTimeout,
                      std::chrono::milliseconds{std::chrono::seconds(60)})));
  }

  return properties;
}

auto consumerProperties(const Kfk_ConsumerConfig &config)
    -> std::expected<Kfk_ConfigProperties, std::error_code> {
  if (auto ec = config.validate(); ec) {
    return std::unexpected(ec);
  }

  auto properties = baseProperties(config);
  if (!properties) {
    return properties;
  }

  if (!config.group.empty()) {
    add(*properties, "group.id", config.group);
    add(*properties, "session.timeout.ms", toMs(config.sessionTimeout));
    add(*properties, "heartbeat.interval.ms", toMs(config.heartbeatInterval));
    add(*properties, "max.poll.interval.ms", toMs(config.rebalanceTimeout));
    add(*properties, "enable.auto.commit",
        config.autoCommit ? "true" : "false");

    if (config.autoCommit) {
      add(*properties, "auto.commit.interval.ms",
          toMs(config.autoCommitInterval));
    }
  } else {
    // without a group there is no broker side offset storage
    add(*properties, "enable.auto.commit", "false");
    add(*properties, "enable.auto.offset.store", "false");
  }

  auto offset = *normalizeStartOffset(config.startOffset);
  add(*properties, "auto.offset.reset",
      kOffsetEarliest == offset ? "earliest" : "latest");

  auto isolation = *normalizeIsolationLevel(config.isolationLevel);
  add(*properties, "isolation.level",
      kIsolationReadUncommitted == isolation ? "read_uncommitted"
                                             : "read_committed");

  if (config.fetchMinBytes > 0) {
    add(*properties, "fetch.min.bytes", std::to_string(config.fetchMinBytes));
  }

  if (config.fetchMaxBytes > 0) {
    add(*properties, "fetch.max.bytes", std::to_string(config.fetchMaxBytes));
  }

  if (config.fetchMaxWait.count() > 0) {
    add(*properties, "fetch.wait.max.ms", toMs(config.fetchMaxWait));
  }

  add(*properties, "enable.partition.eof", "false");

  return properties;
}

auto adminProperties(const Kfk_AdminConfig &config)
    -> std::expected<Kfk_ConfigProperties, std::error_code> {
  return baseProperties(config);
}

auto findProperty(const Kfk_ConfigProperties &properties, std::string_view key)
    -> std::optional<std::string> {
  for (const auto &[name, value] : properties) {
    if (name == key) {
      return value;
    }
  }

  return std::nullopt;
}

auto buildKafkaConf(Kfk_ConfigProperties &properties, Kfk_Logger &logger)
    -> std::expected<Kfk_KafkaPtr<rd_kafka_conf_t>, std::error_code> {
  Kfk_KafkaPtr<rd_kafka_conf_t> conf{rd_kafka_conf_new()};
  std::error_code ec{};

  for (const auto &[key, value] : properties) {
    auto res = set_config(conf.get(), key, value);
    if (!res) {
      logger.error("invalid kafka configuration property",
                   {{"property", key}, {"error", res.error()}});
      ec = Kfk_Errc::kConfiguration;

      break;
    }
  }

  for (auto &[key, value] : properties) {
    for (auto secret : kSecretProperties) {
      if (key == secret) {
        secureZero(value);
      }
    }
  }

  if (ec) {
    return std::unexpected(ec);
  }

  return conf;
}

} // namespace kfk
