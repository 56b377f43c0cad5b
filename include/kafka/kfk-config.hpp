/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-config.hpp
 * @brief Declarative configuration of the kfk producer, consumer and admin
 *        clients.
 *
 * The three config kinds share Kfk_BaseConfig (brokers, authentication,
 * timeouts, retries, TLS). Every enumerated option is a string so configs
 * can be loaded from JSON (see kfk-config-json.hpp) and validated after the
 * fact. An empty enumerated option means its default.
 *
 * validate() returns the first failing condition as a Kfk_Errc, in the
 * order documented on each method. Translation to librdkafka properties
 * happens once, when a client is created:
 *
 *   auto properties = kfk::producerProperties(config);
 *   auto conf = kfk::buildKafkaConf(*properties, *logger);
 *
 * Secrets (SASL password, OAuth client secret, TLS key password) are read
 * from their Kfk_Credential source once, during translation, and the
 * temporary copies are zeroed after they are handed to librdkafka.
 */

#ifndef KFK_CONFIG_HPP_
#define KFK_CONFIG_HPP_

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "rdkafka.h"

#include "kafka/kfk-kafka-util.hpp"
#include "kfk-log.hpp"

namespace kfk {

inline constexpr std::string_view kAuthNone{"none"};
inline constexpr std::string_view kAuthPlain{"plain"};
inline constexpr std::string_view kAuthScram256{"scram-256"};
inline constexpr std::string_view kAuthScram512{"scram-512"};
inline constexpr std::string_view kAuthAwsMskIam{"aws-msk-iam"};
inline constexpr std::string_view kAuthOAuth{"oauth"};

inline constexpr std::string_view kAcksNone{"none"};
inline constexpr std::string_view kAcksLeader{"leader"};
inline constexpr std::string_view kAcksAll{"all"};

inline constexpr std::string_view kCompressionNone{"none"};
inline constexpr std::string_view kCompressionGzip{"gzip"};
inline constexpr std::string_view kCompressionSnappy{"snappy"};
inline constexpr std::string_view kCompressionLz4{"lz4"};
inline constexpr std::string_view kCompressionZstd{"zstd"};

inline constexpr std::string_view kOffsetEarliest{"earliest"};
inline constexpr std::string_view kOffsetLatest{"latest"};

inline constexpr std::string_view kIsolationReadUncommitted{
    "read-uncommitted"};
inline constexpr std::string_view kIsolationReadCommitted{"read-committed"};

/**
 * @brief Where a secret comes from. The first non-empty source wins: the
 *        literal password, then the environment variable (cleared after it
 *        is read), then the file (one trailing newline trimmed).
 */
struct Kfk_Credential {
  std::string password{};
  std::string passwordEnvVar{};
  std::string passwordFile{};

  auto isSet() const -> bool;

  auto fetch() const -> std::expected<std::string, std::error_code>;
}; // struct Kfk_Credential

struct Kfk_TlsConfig {
  bool enable{};
  std::string caFile{};
  std::string certFile{};
  std::string keyFile{};
  Kfk_Credential keyPassword{};
  bool insecureSkipVerify{};
}; // struct Kfk_TlsConfig

/**
 * @brief A SASL/OAUTHBEARER token handed to librdkafka by a token provider.
 */
struct Kfk_OAuthToken {
  std::string value{};
  std::chrono::system_clock::time_point expiry{};
  std::string principal{};
}; // struct Kfk_OAuthToken

/**
 * Called by librdkafka's background thread whenever it needs a fresh
 * OAUTHBEARER token. It is mandatory for aws-msk-iam (the hook signs the
 * MSK IAM token with the AWS credentials) and optional for oauth, where
 * librdkafka's built-in OIDC client credentials flow is used otherwise.
 */
using Kfk_TokenProvider =
    std::function<std::expected<Kfk_OAuthToken, std::string>()>;

struct Kfk_BaseConfig {
  std::string brokers{};
  std::string clientId{};

  std::string authType{kAuthNone};
  std::string username{};
  Kfk_Credential credential{};

  std::chrono::milliseconds dialTimeout{std::chrono::seconds(30)};
  std::chrono::milliseconds requestTimeout{std::chrono::seconds(30)};
  std::chrono::milliseconds retryBackoff{100};
  int maxRetries{3};

  std::optional<Kfk_TlsConfig> tls{};

  // aws-msk-iam
  std::string awsRegion{};
  std::string awsAccessKey{};
  Kfk_Credential awsSecret{};

  // oauth
  std::string oauthTokenUrl{};
  std::string oauthClientId{};
  std::string oauthScope{};
  Kfk_Credential oauthSecret{};

  Kfk_TokenProvider tokenProvider{};

  /**
   * @brief Checks, in order: brokers non-empty, auth type valid,
   *        aws-msk-iam requires awsRegion, oauth requires oauthTokenUrl.
   */
  auto validate() const -> std::error_code;

  auto brokerList() const -> std::vector<std::string>;
}; // struct Kfk_BaseConfig

struct Kfk_ProducerConfig : public Kfk_BaseConfig {
  std::string defaultTopic{};
  std::string transactionalId{};
  std::string acks{kAcksLeader};
  std::string compression{kCompressionNone};
  int batchMaxRecords{10000};
  int batchMaxBytes{1048576};
  std::chrono::milliseconds linger{0};
  bool idempotent{};

  /**
   * @brief Checks the base config, then acks, then compression.
   */
  auto validate() const -> std::error_code;
}; // struct Kfk_ProducerConfig

struct Kfk_ConsumerConfig : public Kfk_BaseConfig {
  std::vector<std::string> topics{};
  std::string group{};
  std::string startOffset{kOffsetLatest};
  std::string isolationLevel{kIsolationReadCommitted};
  std::chrono::milliseconds sessionTimeout{std::chrono::seconds(45)};
  std::chrono::milliseconds rebalanceTimeout{std::chrono::seconds(60)};
  std::chrono::milliseconds heartbeatInterval{std::chrono::seconds(3)};
  bool autoCommit{true};
  std::chrono::milliseconds autoCommitInterval{std::chrono::seconds(5)};
  int fetchMinBytes{1};
  int fetchMaxBytes{52428800};
  std::chrono::milliseconds fetchMaxWait{std::chrono::seconds(5)};

  /**
   * @brief Checks the base config, then topics non-empty, then start offset,
   *        then isolation level. The group is not required here, it is only
   *        needed for offset commits.
   */
  auto validate() const -> std::error_code;
}; // struct Kfk_ConsumerConfig

struct Kfk_AdminConfig : public Kfk_BaseConfig {}; // struct Kfk_AdminConfig

/**
 * @brief Normalizers of enumerated options: they accept the canonical
 *        spelling, its alias (e.g. "scram256", "start", "committed") and the
 *        empty string (the default), case-insensitively, and return the
 *        canonical spelling or std::nullopt for an invalid value.
 */
auto normalizeAuthType(std::string_view authType)
    -> std::optional<std::string_view>;
auto normalizeAcks(std::string_view acks) -> std::optional<std::string_view>;
auto normalizeCompression(std::string_view compression)
    -> std::optional<std::string_view>;
auto normalizeStartOffset(std::string_view offset)
    -> std::optional<std::string_view>;
auto normalizeIsolationLevel(std::string_view isolation)
    -> std::optional<std::string_view>;

using Kfk_ConfigProperties = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Translate a config into librdkafka properties (validating it
 *        first). The result holds fetched secrets in clear text, pass it to
 *        buildKafkaConf() which zeroes them.
 */
auto baseProperties(const Kfk_BaseConfig &config)
    -> std::expected<Kfk_ConfigProperties, std::error_code>;
auto producerProperties(const Kfk_ProducerConfig &config)
    -> std::expected<Kfk_ConfigProperties, std::error_code>;
auto consumerProperties(const Kfk_ConsumerConfig &config)
    -> std::expected<Kfk_ConfigProperties, std::error_code>;
auto adminProperties(const Kfk_AdminConfig &config)
    -> std::expected<Kfk_ConfigProperties, std::error_code>;

/**
 * @brief Look a property up in a translated property list.
 */
auto findProperty(const Kfk_ConfigProperties &properties, std::string_view key)
    -> std::optional<std::string>;

/**
 * @brief Apply properties to a new rd_kafka_conf_t. A property librdkafka
 *        rejects is logged and reported as Kfk_Errc::kConfiguration. Secret
 *        values in properties are zeroed whatever the outcome.
 */
auto buildKafkaConf(Kfk_ConfigProperties &properties, Kfk_Logger &logger)
    -> std::expected<Kfk_KafkaPtr<rd_kafka_conf_t>, std::error_code>;

} // namespace kfk

#endif // KFK_CONFIG_HPP_
