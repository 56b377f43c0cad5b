/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-admin.hpp
 * @brief The kfk Kafka admin facade and the descriptors it reports.
 *
 * Kfk_Admin manages topics and consumer groups and inspects the cluster:
 *  - createTopics(), deleteTopics()
 *  - listTopics(), describeTopics(), topicExists() (from cluster metadata)
 *  - listBrokers()
 *  - listGroups(), describeGroups(), deleteGroups()
 *
 * Each operation makes one round trip bounded by the context and the
 * configured request timeout. A batched request reports the error of its
 * first failing item, e.g. creating three topics of which the second exists
 * returns RD_KAFKA_RESP_ERR_TOPIC_ALREADY_EXISTS.
 */

#ifndef KFK_ADMIN_HPP_

#define KFK_ADMIN_HPP_

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "rdkafka.h"

#include "kafka/kfk-client.hpp"
#include "kafka/kfk-config.hpp"
#include "kafka/kfk-kafka-util.hpp"
#include "kfk-context.hpp"
#include "kfk-log.hpp"

namespace kfk {

struct Kfk_TopicConfig {
  std::string name{};
  std::int32_t partitions{1};
  std::int16_t replicationFactor{1};
  std::map<std::string, std::string> configs{};

  static auto of(std::string name, std::int32_t partitions,
                 std::int16_t replicationFactor) -> Kfk_TopicConfig;

  /**
   * @brief Set a topic level config (e.g. "retention.ms").
   */
  auto withConfig(std::string key, std::string value) -> Kfk_TopicConfig &;
}; // struct Kfk_TopicConfig

struct Kfk_PartitionInfo {
  std::int32_t id{};
  std::int32_t leader{-1};
  std::vector<std::int32_t> replicas{};
  std::vector<std::int32_t> isr{};
}; // struct Kfk_PartitionInfo

struct Kfk_TopicInfo {
  std::string name{};
  std::vector<Kfk_PartitionInfo> partitions{};
  bool internal{};
}; // struct Kfk_TopicInfo

struct Kfk_BrokerInfo {
  std::int32_t id{};
  std::string host{};
  std::int32_t port{};
  std::optional<std::string> rack{};
}; // struct Kfk_BrokerInfo

struct Kfk_GroupMember {
  std::string id{};
  std::string clientId{};
  std::string clientHost{};
}; // struct Kfk_GroupMember

struct Kfk_GroupInfo {
  std::string name{};
  std::string state{};
  std::string protocolType{};
  std::string protocol{};
  std::vector<Kfk_GroupMember> members{};
}; // struct Kfk_GroupInfo

class Kfk_Admin {
public:
  /**
   * @brief Create an admin client. A null config means the default
   *        Kfk_AdminConfig, which fails validation for lack of brokers.
   */
  static auto create(const Kfk_AdminConfig *config,
                     std::shared_ptr<Kfk_Logger> logger = {})
      -> std::expected<std::unique_ptr<Kfk_Admin>, std::error_code>;

  ~Kfk_Admin() noexcept;

  Kfk_Admin(const Kfk_Admin &obj) = delete;
  const Kfk_Admin &operator=(const Kfk_Admin &obj) = delete;
  Kfk_Admin(Kfk_Admin &&obj) = delete;
  Kfk_Admin &operator=(Kfk_Admin &&obj) = delete;

  auto createTopics(const Kfk_Context::Ptr &ctx,
                    const std::vector<Kfk_TopicConfig> &topics)
      -> std::error_code;

  auto deleteTopics(const Kfk_Context::Ptr &ctx,
                    const std::vector<std::string> &topics) -> std::error_code;

  /**
   * @brief Every topic of the cluster, internal ones (named "__...")
   *        included and flagged.
   */
  auto listTopics(const Kfk_Context::Ptr &ctx)
      -> std::expected<std::map<std::string, Kfk_TopicInfo>, std::error_code>;

  /**
   * @brief The named topics that exist, in the order asked for.
   */
  auto describeTopics(const Kfk_Context::Ptr &ctx,
                      const std::vector<std::string> &topics)
      -> std::expected<std::vector<Kfk_TopicInfo>, std::error_code>;

  auto topicExists(const Kfk_Context::Ptr &ctx, std::string_view topic)
      -> std::expected<bool, std::error_code>;

  auto listBrokers(const Kfk_Context::Ptr &ctx)
      -> std::expected<std::vector<Kfk_BrokerInfo>, std::error_code>;

  auto listGroups(const Kfk_Context::Ptr &ctx)
      -> std::expected<std::vector<std::string>, std::error_code>;

  /**
   * @brief Describe the named groups, a group the broker reports an error
   *        for is left out.
   */
  auto describeGroups(const Kfk_Context::Ptr &ctx,
                      const std::vector<std::string> &groups)
      -> std::expected<std::vector<Kfk_GroupInfo>, std::error_code>;

  auto deleteGroups(const Kfk_Context::Ptr &ctx,
                    const std::vector<std::string> &groups) -> std::error_code;

  void close();

  auto isConnected() const -> bool;

  auto config() const -> const Kfk_AdminConfig &;

private:
  using Request = std::function<void(rd_kafka_t *handle,
                                     const rd_kafka_AdminOptions_t *options,
                                     rd_kafka_queue_t *queue)>;

  Kfk_Admin(Kfk_AdminConfig config, std::shared_ptr<Kfk_Logger> logger);

  auto open() -> std::error_code;

  auto snapshot() const
      -> std::expected<std::shared_ptr<Kfk_Client>, std::error_code>;

  /**
   * @brief Send one admin request and wait for its result event. A
   *        request-level error of the event is returned as the error.
   */
  auto roundTrip(const Kfk_Context::Ptr &ctx, rd_kafka_admin_op_t op,
                 std::string_view what, const Request &request)
      -> std::expected<Kfk_KafkaPtr<rd_kafka_event_t>, std::error_code>;

  auto fetchMetadata(const Kfk_Context::Ptr &ctx)
      -> std::expected<Kfk_KafkaPtr<const rd_kafka_metadata_t>,
                       std::error_code>;

  /**
   * data members for constructor to instantiate the object.
   */
  const Kfk_AdminConfig m_config{};
  std::shared_ptr<Kfk_Logger> m_logger{};

  /**
   * data members for internal logic.
   */
  mutable std::shared_mutex m_mutex{};
  bool m_closed{};
  std::shared_ptr<Kfk_Client> m_client{};
}; // class Kfk_Admin

} // namespace kfk

#endif // KFK_ADMIN_HPP_
