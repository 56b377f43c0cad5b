/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-admin.cpp
 * @brief Implementation of the kfk Kafka admin facade.
 *
 * Topic and group requests go through the librdkafka Admin API with a
 * private result queue per request, topic inspection reads the cluster
 * metadata.
 */

#include "kafka/kfk-admin.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "rdkafka.h"

#include "kafka/kfk-client.hpp"
#include "kafka/kfk-config.hpp"
#include "kafka/kfk-kafka-log.hpp"
#include "kafka/kfk-kafka-util.hpp"
#include "kfk-context.hpp"
#include "kfk-debug.hpp"
#include "kfk-error.hpp"
#include "kfk-log.hpp"
#include "kfk-util.hpp"

namespace kfk {

namespace {

auto toTopicInfo(const rd_kafka_metadata_topic_t &topic) -> Kfk_TopicInfo {
  Kfk_TopicInfo info{};

  info.name = topic.topic;
  info.internal = info.name.starts_with("__");

  for (int idx = 0; idx < topic.partition_cnt; idx++) {
    const auto &partition = topic.partitions[idx];

    info.partitions.push_back(Kfk_PartitionInfo{
        partition.id, partition.leader,
        std::vector<std::int32_t>(partition.replicas,
                                  partition.replicas + partition.replica_cnt),
        std::vector<std::int32_t>(partition.isrs,
                                  partition.isrs + partition.isr_cnt)});
  }

  return info;
}

auto toCStrings(const std::vector<std::string> &items)
    -> std::vector<const char *> {
  std::vector<const char *> cstrings{};

  for (const auto &item : items) {
    cstrings.push_back(item.c_str());
  }

  return cstrings;
}

/**
 * The first failing item of a topic level result, as an error code plus
 * the log entry describing it.
 */
auto firstTopicError(const rd_kafka_topic_result_t **results, std::size_t count,
                     Kfk_Logger &logger, std::string_view what)
    -> std::error_code {
  for (std::size_t idx = 0; idx < count; idx++) {
    auto err = rd_kafka_topic_result_error(results[idx]);

    if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
      const char *detail = rd_kafka_topic_result_error_string(results[idx]);

      logger.error(what, {{"kafka_topic", rd_kafka_topic_result_name(results[idx])},
                          {"error", nullptr != detail ? detail
                                                      : rd_kafka_err2str(err)}});

      return toErrorCode(err);
    }
  }

  return {};
}

} // namespace

auto Kfk_TopicConfig::of(std::string name, std::int32_t partitions,
                         std::int16_t replicationFactor) -> Kfk_TopicConfig {
  Kfk_TopicConfig config{};

  config.name = std::move(name);
  config.partitions = partitions;
  config.replicationFactor = replicationFactor;

  return config;
}

auto Kfk_TopicConfig::withConfig(std::string key, std::string value)
    -> Kfk_TopicConfig & {
  configs[std::move(key)] = std::move(value);

  return *this;
}

Kfk_Admin::Kfk_Admin(Kfk_AdminConfig config, std::shared_ptr<Kfk_Logger> logger)
    : m_config{std::move(config)}, m_logger{std::move(logger)} {}

Kfk_Admin::~Kfk_Admin() noexcept try {
  close();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Kfk_Admin::create(const Kfk_AdminConfig *config,
                       std::shared_ptr<Kfk_Logger> logger)
    -> std::expected<std::unique_ptr<Kfk_Admin>, std::error_code> {
  auto adminConfig = nullptr == config ? Kfk_AdminConfig{} : *config;

  if (auto ec = adminConfig.validate(); ec) {
    return std::unexpected(ec);
  }

  auto brokers = adminConfig.brokers;

  std::unique_ptr<Kfk_Admin> admin{new Kfk_Admin(
      std::move(adminConfig), adminLogger(std::move(logger), brokers))};

  if (auto ec = admin->open(); ec) {
    return std::unexpected(ec);
  }

  return admin;
}

auto Kfk_Admin::open() -> std::error_code {
  auto properties = adminProperties(m_config);
  if (!properties) {
    m_logger->error("invalid kafka admin configuration",
                    {{"error", properties.error().message()}});

    return properties.error();
  }

  auto conf = buildKafkaConf(*properties, *m_logger);
  if (!conf) {
    return conf.error();
  }

  auto opaque = std::make_unique<Kfk_ClientOpaque>(
      Kfk_ClientOpaque{m_logger, m_config.tokenProvider, this});

  auto handle =
      createKafkaHandle(RD_KAFKA_PRODUCER, *conf, opaque.get(), *m_logger);
  if (!handle) {
    return handle.error();
  }

  m_client =
      std::make_shared<Kfk_Client>("kafka-admin", *handle, std::move(opaque));

  m_logger->info("kafka admin opened");

  return {};
}

auto Kfk_Admin::snapshot() const
    -> std::expected<std::shared_ptr<Kfk_Client>, std::error_code> {
  std::shared_lock lock{m_mutex};

  if (m_closed || !m_client) {
    return std::unexpected(make_error_code(Kfk_Errc::kClientClosed));
  }

  return m_client;
}

auto Kfk_Admin::roundTrip(const Kfk_Context::Ptr &ctx, rd_kafka_admin_op_t op,
                          std::string_view what, const Request &request)
    -> std::expected<Kfk_KafkaPtr<rd_kafka_event_t>, std::error_code> {
  auto client = snapshot();
  if (!client) {
    return std::unexpected(client.error());
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    return std::unexpected(make_error_code(Kfk_Errc::kClientClosed));
  }

  auto *rk = lease->handle();

  // nothing else polls an admin handle, serve its error callbacks
  rd_kafka_poll(rk, 0);

  Kfk_KafkaPtr<rd_kafka_AdminOptions_t> options{
      rd_kafka_AdminOptions_new(rk, op)};
  char errstr[kKafkaErrorStringLength]{};
  auto timeoutMs = toTimeoutMs(ctx->remaining(m_config.requestTimeout));

  if (RD_KAFKA_RESP_ERR_NO_ERROR !=
      rd_kafka_AdminOptions_set_request_timeout(options.get(), timeoutMs,
                                                errstr, sizeof(errstr))) {
    m_logger->warn("failed to set kafka admin request timeout",
                   {{"error", errstr}});
  }

  if (RD_KAFKA_ADMIN_OP_CREATETOPICS == op ||
      RD_KAFKA_ADMIN_OP_DELETETOPICS == op) {
    if (RD_KAFKA_RESP_ERR_NO_ERROR !=
        rd_kafka_AdminOptions_set_operation_timeout(options.get(), timeoutMs,
                                                    errstr, sizeof(errstr))) {
      m_logger->warn("failed to set kafka admin operation timeout",
                     {{"error", errstr}});
    }
  }

  Kfk_KafkaPtr<rd_kafka_queue_t> queue{rd_kafka_queue_new(rk)};

  request(rk, options.get(), queue.get());

  auto event = awaitEvent(*lease, queue.get(), ctx);
  if (!event) {
    m_logger->error(what, {{"error", event.error().message()}});

    return event;
  }

  auto err = rd_kafka_event_error(event->get());
  if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
    m_logger->error(what, {{"error", rd_kafka_event_error_string(event->get())}});

    return std::unexpected(toErrorCode(err));
  }

  return event;
}

auto Kfk_Admin::fetchMetadata(const Kfk_Context::Ptr &ctx)
    -> std::expected<Kfk_KafkaPtr<const rd_kafka_metadata_t>,
                     std::error_code> {
  auto client = snapshot();
  if (!client) {
    return std::unexpected(client.error());
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    return std::unexpected(make_error_code(Kfk_Errc::kClientClosed));
  }

  if (auto ec = ctx->err(); ec) {
    return std::unexpected(ec);
  }

  const rd_kafka_metadata_t *metadata{};
  auto err = rd_kafka_metadata(
      lease->handle(), 1, nullptr, &metadata,
      toTimeoutMs(ctx->remaining(m_config.requestTimeout)));
  if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
    m_logger->error("failed to fetch kafka metadata",
                    {{"error", rd_kafka_err2str(err)}});

    return std::unexpected(toErrorCode(err));
  }

  return Kfk_KafkaPtr<const rd_kafka_metadata_t>{metadata};
}

auto Kfk_Admin::createTopics(const Kfk_Context::Ptr &ctx,
                             const std::vector<Kfk_TopicConfig> &topics)
    -> std::error_code {
  if (!ctx) {
    return Kfk_Errc::kNilContext;
  }

  if (auto client = snapshot(); !client) {
    return client.error();
  }

  if (topics.empty()) {
    return {};
  }

  std::vector<Kfk_KafkaPtr<rd_kafka_NewTopic_t>> owned{};
  std::vector<rd_kafka_NewTopic_t *> newTopics{};

  for (const auto &topic : topics) {
    char errstr[kKafkaErrorStringLength]{};

    m_logger->info("creating kafka topic",
                   {{"kafka_topic", topic.name},
                    {"partitions", std::to_string(topic.partitions)},
                    {"replication_factor",
                     std::to_string(topic.replicationFactor)}});

    Kfk_KafkaPtr<rd_kafka_NewTopic_t> newTopic{
        rd_kafka_NewTopic_new(topic.name.c_str(), topic.partitions,
                              topic.replicationFactor, errstr, sizeof(errstr))};
    if (!newTopic) {
      m_logger->error("invalid kafka topic",
                      {{"kafka_topic", topic.name}, {"error", errstr}});

      return Kfk_Errc::kConfiguration;
    }

    for (const auto &[key, value] : topic.configs) {
      auto err =
          rd_kafka_NewTopic_set_config(newTopic.get(), key.c_str(), value.c_str());
      if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
        m_logger->error("invalid kafka topic config",
                        {{"kafka_topic", topic.name},
                         {"key", key},
                         {"error", rd_kafka_err2str(err)}});

        return toErrorCode(err);
      }
    }

    newTopics.push_back(newTopic.get());
    owned.push_back(std::move(newTopic));
  }

  auto event = roundTrip(
      ctx, RD_KAFKA_ADMIN_OP_CREATETOPICS, "failed to create kafka topics",
      [&newTopics](rd_kafka_t *handle, const rd_kafka_AdminOptions_t *options,
                   rd_kafka_queue_t *queue) {
        rd_kafka_CreateTopics(handle, newTopics.data(), newTopics.size(),
                              options, queue);
      });
  if (!event) {
    return event.error();
  }

  std::size_t count{};
  const auto *result = rd_kafka_event_CreateTopics_result(event->get());
  const auto **results = rd_kafka_CreateTopics_result_topics(result, &count);

  return firstTopicError(results, count, *m_logger,
                         "failed to create kafka topic");
}

auto Kfk_Admin::deleteTopics(const Kfk_Context::Ptr &ctx,
                             const std::vector<std::string> &topics)
    -> std::error_code {
  if (!ctx) {
    return Kfk_Errc::kNilContext;
  }

  if (auto client = snapshot(); !client) {
    return client.error();
  }

  if (topics.empty()) {
    return {};
  }

  m_logger->info("deleting kafka topics", {{"kafka_topics", join(topics)}});

  std::vector<Kfk_KafkaPtr<rd_kafka_DeleteTopic_t>> owned{};
  std::vector<rd_kafka_DeleteTopic_t *> deleteTopics{};

  for (const auto &topic : topics) {
    owned.emplace_back(rd_kafka_DeleteTopic_new(topic.c_str()));
    deleteTopics.push_back(owned.back().get());
  }

  auto event = roundTrip(
      ctx, RD_KAFKA_ADMIN_OP_DELETETOPICS, "failed to delete kafka topics",
      [&deleteTopics](rd_kafka_t *handle,
                      const rd_kafka_AdminOptions_t *options,
                      rd_kafka_queue_t *queue) {
        rd_kafka_DeleteTopics(handle, deleteTopics.data(), deleteTopics.size(),
                              options, queue);
      });
  if (!event) {
    return event.error();
  }

  std::size_t count{};
  const auto *result = rd_kafka_event_DeleteTopics_result(event->get());
  const auto **results = rd_kafka_DeleteTopics_result_topics(result, &count);

  return firstTopicError(results, count, *m_logger,
                         "failed to delete kafka topic");
}

auto Kfk_Admin::listTopics(const Kfk_Context::Ptr &ctx)
    -> std::expected<std::map<std::string, Kfk_TopicInfo>, std::error_code> {
  if (!ctx) {
    return std::unexpected(make_error_code(Kfk_Errc::kNilContext));
  }

  auto metadata = fetchMetadata(ctx);
  if (!metadata) {
    return std::unexpected(metadata.error());
  }

  std::map<std::string, Kfk_TopicInfo> topics{};

  for (int idx = 0; idx < (*metadata)->topic_cnt; idx++) {
    const auto &topic = (*metadata)->topics[idx];

    if (RD_KAFKA_RESP_ERR_NO_ERROR != topic.err) {
      KFK_DEBUG_PRINT(std::cerr << "skip topic " << topic.topic << ": "
                                << rd_kafka_err2str(topic.err) << '\n');

      continue;
    }

    topics.emplace(topic.topic, toTopicInfo(topic));
  }

  return topics;
}

auto Kfk_Admin::describeTopics(const Kfk_Context::Ptr &ctx,
                               const std::vector<std::string> &topics)
    -> std::expected<std::vector<Kfk_TopicInfo>, std::error_code> {
  auto all = listTopics(ctx);
  if (!all) {
    return std::unexpected(all.error());
  }

  std::vector<Kfk_TopicInfo> described{};

  for (const auto &topic : topics) {
    if (auto found = all->find(topic); found != all->end()) {
      described.push_back(found->second);
    }
  }

  return described;
}

auto Kfk_Admin::topicExists(const Kfk_Context::Ptr &ctx,
                            std::string_view topic)
    -> std::expected<bool, std::error_code> {
  auto all = listTopics(ctx);
  if (!all) {
    return std::unexpected(all.error());
  }

  return all->contains(std::string{topic});
}

auto Kfk_Admin::listBrokers(const Kfk_Context::Ptr &ctx)
    -> std::expected<std::vector<Kfk_BrokerInfo>, std::error_code> {
  if (!ctx) {
    return std::unexpected(make_error_code(Kfk_Errc::kNilContext));
  }

  auto event = roundTrip(
      ctx, RD_KAFKA_ADMIN_OP_DESCRIBECLUSTER, "failed to describe kafka cluster",
      [](rd_kafka_t *handle, const rd_kafka_AdminOptions_t *options,
         rd_kafka_queue_t *queue) {
        rd_kafka_DescribeCluster(handle, options, queue);
      });
  if (!event) {
    return std::unexpected(event.error());
  }

  std::size_t count{};
  const auto *result = rd_kafka_event_DescribeCluster_result(event->get());
  const auto **nodes = rd_kafka_DescribeCluster_result_nodes(result, &count);

  std::vector<Kfk_BrokerInfo> brokers{};

  for (std::size_t idx = 0; idx < count; idx++) {
    Kfk_BrokerInfo broker{};

    broker.id = rd_kafka_Node_id(nodes[idx]);
    broker.host = rd_kafka_Node_host(nodes[idx]);
    broker.port = rd_kafka_Node_port(nodes[idx]);

    if (const char *rack = rd_kafka_Node_rack(nodes[idx]); nullptr != rack) {
      broker.rack = rack;
    }

    brokers.push_back(std::move(broker));
  }

  return brokers;
}

auto Kfk_Admin::listGroups(const Kfk_Context::Ptr &ctx)
    -> std::expected<std::vector<std::string>, std::error_code> {
  if (!ctx) {
    return std::unexpected(make_error_code(Kfk_Errc::kNilContext));
  }

  auto event = roundTrip(
      ctx, RD_KAFKA_ADMIN_OP_LISTCONSUMERGROUPS,
      "failed to list kafka consumer groups",
      [](rd_kafka_t *handle, const rd_kafka_AdminOptions_t *options,
         rd_kafka_queue_t *queue) {
        rd_kafka_ListConsumerGroups(handle, options, queue);
      });
  if (!event) {
    return std::unexpected(event.error());
  }

  const auto *result = rd_kafka_event_ListConsumerGroups_result(event->get());

  std::size_t errorCount{};
  const auto **errors =
      rd_kafka_ListConsumerGroups_result_errors(result, &errorCount);
  for (std::size_t idx = 0; idx < errorCount; idx++) {
    m_logger->warn("kafka broker failed to list consumer groups",
                   {{"error", rd_kafka_error_string(errors[idx])}});
  }

  std::size_t count{};
  const auto **listings =
      rd_kafka_ListConsumerGroups_result_valid(result, &count);

  std::vector<std::string> groups{};

  for (std::size_t idx = 0; idx < count; idx++) {
    groups.emplace_back(rd_kafka_ConsumerGroupListing_group_id(listings[idx]));
  }

  return groups;
}

auto Kfk_Admin::describeGroups(const Kfk_Context::Ptr &ctx,
                               const std::vector<std::string> &groups)
    -> std::expected<std::vector<Kfk_GroupInfo>, std::error_code> {
  if (!ctx) {
    return std::unexpected(make_error_code(Kfk_Errc::kNilContext));
  }

  if (auto client = snapshot(); !client) {
    return std::unexpected(client.error());
  }

  if (groups.empty()) {
    return std::vector<Kfk_GroupInfo>{};
  }

  auto names = toCStrings(groups);

  auto event = roundTrip(
      ctx, RD_KAFKA_ADMIN_OP_DESCRIBECONSUMERGROUPS,
      "failed to describe kafka consumer groups",
      [&names](rd_kafka_t *handle, const rd_kafka_AdminOptions_t *options,
               rd_kafka_queue_t *queue) {
        rd_kafka_DescribeConsumerGroups(handle, names.data(), names.size(),
                                        options, queue);
      });
  if (!event) {
    return std::unexpected(event.error());
  }

  std::size_t count{};
  const auto *result =
      rd_kafka_event_DescribeConsumerGroups_result(event->get());
  const auto **descriptions =
      rd_kafka_DescribeConsumerGroups_result_groups(result, &count);

  std::vector<Kfk_GroupInfo> described{};

  for (std::size_t idx = 0; idx < count; idx++) {
    const auto *description = descriptions[idx];

    if (const auto *error = rd_kafka_ConsumerGroupDescription_error(description);
        nullptr != error) {
      m_logger->error(
          "failed to describe kafka consumer group",
          {{"kafka_group",
            rd_kafka_ConsumerGroupDescription_group_id(description)},
           {"error", rd_kafka_error_string(error)}});

      return std::unexpected(toErrorCode(error));
    }

    Kfk_GroupInfo info{};

    info.name = rd_kafka_ConsumerGroupDescription_group_id(description);
    info.state = rd_kafka_consumer_group_state_name(
        rd_kafka_ConsumerGroupDescription_state(description));
    info.protocolType =
        rd_kafka_ConsumerGroupDescription_is_simple_consumer_group(description)
            ? ""
            : "consumer";

    if (const char *assignor =
            rd_kafka_ConsumerGroupDescription_partition_assignor(description);
        nullptr != assignor) {
      info.protocol = assignor;
    }

    auto memberCount = rd_kafka_ConsumerGroupDescription_member_count(description);
    for (std::size_t member = 0; member < memberCount; member++) {
      const auto *desc =
          rd_kafka_ConsumerGroupDescription_member(description, member);

      info.members.push_back(
          Kfk_GroupMember{rd_kafka_MemberDescription_consumer_id(desc),
                          rd_kafka_MemberDescription_client_id(desc),
                          rd_kafka_MemberDescription_host(desc)});
    }

    described.push_back(std::move(info));
  }

  return described;
}

auto Kfk_Admin::deleteGroups(const Kfk_Context::Ptr &ctx,
                             const std::vector<std::string> &groups)
    -> std::error_code {
  if (!ctx) {
    return Kfk_Errc::kNilContext;
  }

  if (auto client = snapshot(); !client) {
    return client.error();
  }

  if (groups.empty()) {
    return {};
  }

  m_logger->info("deleting kafka consumer groups",
                 {{"kafka_groups", join(groups)}});

  std::vector<Kfk_KafkaPtr<rd_kafka_DeleteGroup_t>> owned{};
  std::vector<rd_kafka_DeleteGroup_t *> deleteGroups{};

  for (const auto &group : groups) {
    owned.emplace_back(rd_kafka_DeleteGroup_new(group.c_str()));
    deleteGroups.push_back(owned.back().get());
  }

  auto event = roundTrip(
      ctx, RD_KAFKA_ADMIN_OP_DELETEGROUPS,
      "failed to delete kafka consumer groups",
      [&deleteGroups](rd_kafka_t *handle,
                      const rd_kafka_AdminOptions_t *options,
                      rd_kafka_queue_t *queue) {
        rd_kafka_DeleteGroups(handle, deleteGroups.data(), deleteGroups.size(),
                              options, queue);
      });
  if (!event) {
    return event.error();
  }

  std::size_t count{};
  const auto *result = rd_kafka_event_DeleteGroups_result(event->get());
  const auto **results = rd_kafka_DeleteGroups_result_groups(result, &count);

  for (std::size_t idx = 0; idx < count; idx++) {
    if (const auto *error = rd_kafka_group_result_error(results[idx]);
        nullptr != error) {
      m_logger->error("failed to delete kafka consumer group",
                      {{"kafka_group", rd_kafka_group_result_name(results[idx])},
                       {"error", rd_kafka_error_string(error)}});

      return toErrorCode(error);
    }
  }

  return {};
}

void Kfk_Admin::close() {
  std::shared_ptr<Kfk_Client> client{};

  {
    std::unique_lock lock{m_mutex};

    if (m_closed) {
      return;
    }

    m_closed = true;
    client = std::move(m_client);
  }

  if (client) {
    client->close();
    m_logger->info("kafka admin closed");
  }
}

auto Kfk_Admin::isConnected() const -> bool {
  std::shared_lock lock{m_mutex};

  return !m_closed && m_client;
}

auto Kfk_Admin::config() const -> const Kfk_AdminConfig & {
  return m_config;
}

} // namespace kfk
