/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-consumer.cpp
 * @brief Implementation of the kfk Kafka consumer facade.
 *
 * With a group the consumer queue is read by rd_kafka_consumer_poll() and
 * the main queue is forwarded to it, so log, error and rebalance callbacks
 * are served by the polling thread. Without a group the legacy simple
 * consumer API feeds every partition into one queue owned by the consumer.
 */

#include "kafka/kfk-consumer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
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
#include "kafka/kfk-message.hpp"
#include "kfk-context.hpp"
#include "kfk-debug.hpp"
#include "kfk-error.hpp"
#include "kfk-log.hpp"
#include "kfk-util.hpp"

namespace kfk {

namespace {

/**
 * Bound of one metadata lookup of the partitions of a topic read without a
 * group, a topic not found in time is looked up again on the next poll.
 */
constexpr std::chrono::milliseconds kMetadataSlice{1000};

auto toPartitionList(const std::vector<std::pair<std::string, std::int32_t>>
                         &partitions)
    -> Kfk_KafkaPtr<rd_kafka_topic_partition_list_t> {
  Kfk_KafkaPtr<rd_kafka_topic_partition_list_t> list{
      rd_kafka_topic_partition_list_new(static_cast<int>(partitions.size()))};

  for (const auto &[topic, partition] : partitions) {
    rd_kafka_topic_partition_list_add(list.get(), topic.c_str(), partition);
  }

  return list;
}

auto topicsOf(const Kfk_Consumer::PartitionMap &partitions)
    -> std::vector<std::string> {
  std::vector<std::string> topics{};

  for (const auto &[topic, ids] : partitions) {
    topics.push_back(topic);
  }

  return topics;
}

} // namespace

Kfk_Consumer::Kfk_Consumer(Kfk_ConsumerConfig config,
                           std::shared_ptr<Kfk_Logger> logger)
    : m_config{std::move(config)}, m_logger{std::move(logger)} {}

Kfk_Consumer::~Kfk_Consumer() noexcept try {
  close();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Kfk_Consumer::create(const Kfk_ConsumerConfig *config,
                          std::shared_ptr<Kfk_Logger> logger)
    -> std::expected<std::unique_ptr<Kfk_Consumer>, std::error_code> {
  if (nullptr == config) {
    return std::unexpected(make_error_code(Kfk_Errc::kNilConfig));
  }

  if (auto ec = config->validate(); ec) {
    return std::unexpected(ec);
  }

  std::unique_ptr<Kfk_Consumer> consumer{new Kfk_Consumer(
      *config,
      consumerLogger(std::move(logger), config->topics, config->group))};

  if (auto ec = consumer->open(); ec) {
    return std::unexpected(ec);
  }

  return consumer;
}

auto Kfk_Consumer::open() -> std::error_code {
  auto properties = consumerProperties(m_config);
  if (!properties) {
    m_logger->error("invalid kafka consumer configuration",
                    {{"error", properties.error().message()}});

    return properties.error();
  }

  auto conf = buildKafkaConf(*properties, *m_logger);
  if (!conf) {
    return conf.error();
  }

  if (isGroupMode()) {
    rd_kafka_conf_set_rebalance_cb(conf->get(), &Kfk_Consumer::rebalance);
  }

  auto opaque = std::make_unique<Kfk_ClientOpaque>(
      Kfk_ClientOpaque{m_logger, m_config.tokenProvider, this});

  auto handle =
      createKafkaHandle(RD_KAFKA_CONSUMER, *conf, opaque.get(), *m_logger);
  if (!handle) {
    return handle.error();
  }

  auto *rk = *handle;
  m_client =
      std::make_shared<Kfk_Client>("kafka-consumer", rk, std::move(opaque));

  if (isGroupMode()) {
    auto err = rd_kafka_poll_set_consumer(rk);
    if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
      m_logger->error("failed to redirect kafka main queue",
                      {{"error", rd_kafka_err2str(err)}});
    }

    Kfk_KafkaPtr<rd_kafka_topic_partition_list_t> topics{
        rd_kafka_topic_partition_list_new(
            static_cast<int>(m_config.topics.size()))};

    for (const auto &topic : m_config.topics) {
      rd_kafka_topic_partition_list_add(topics.get(), topic.c_str(),
                                        RD_KAFKA_PARTITION_UA);
    }

    err = rd_kafka_subscribe(rk, topics.get());
    if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
      m_logger->error("failed to subscribe kafka topics",
                      {{"error", rd_kafka_err2str(err)}});
      close();

      return toErrorCode(err);
    }
  } else {
    m_queue.reset(rd_kafka_queue_new(rk));
  }

  m_logger->info("kafka consumer opened", {{"brokers", m_config.brokers}});

  return {};
}

auto Kfk_Consumer::snapshot() const
    -> std::expected<std::shared_ptr<Kfk_Client>, std::error_code> {
  std::shared_lock lock{m_mutex};

  if (m_closed || !m_client) {
    return std::unexpected(make_error_code(Kfk_Errc::kClientClosed));
  }

  return m_client;
}

auto Kfk_Consumer::isGroupMode() const -> bool {
  return !m_config.group.empty();
}

auto Kfk_Consumer::nextMessage(rd_kafka_t *handle, int timeoutMs)
    -> rd_kafka_message_t * {
  if (isGroupMode()) {
    return rd_kafka_consumer_poll(handle, timeoutMs);
  }

  // serve error callbacks, nothing else reads the main queue
  rd_kafka_poll(handle, 0);

  return rd_kafka_consume_queue(m_queue.get(), timeoutMs);
}

void Kfk_Consumer::startPendingTopics(const Kfk_Lease &lease,
                                      const Kfk_Context::Ptr &ctx) {
  std::vector<std::string> pending{};

  {
    std::unique_lock lock{m_state_mutex};

    for (const auto &topic : m_config.topics) {
      if (!m_topics.contains(topic)) {
        pending.push_back(topic);
      }
    }
  }

  auto *rk = lease.handle();
  auto offset = normalizeStartOffset(m_config.startOffset);
  auto startOffset = offset && kOffsetEarliest == *offset
                         ? RD_KAFKA_OFFSET_BEGINNING
                         : RD_KAFKA_OFFSET_END;

  for (const auto &topic : pending) {
    if (ctx->done() || lease.isClosing()) {
      return;
    }

    auto *rkt = rd_kafka_topic_new(rk, topic.c_str(), nullptr);
    if (nullptr == rkt) {
      m_logger->error("failed to create kafka topic handle",
                      {{"kafka_topic", topic},
                       {"error", rd_kafka_err2str(rd_kafka_last_error())}});

      continue;
    }

    const rd_kafka_metadata_t *metadata{};
    auto err = rd_kafka_metadata(rk, 0, rkt, &metadata,
                                 toTimeoutMs(ctx->remaining(kMetadataSlice)));
    Kfk_KafkaPtr<const rd_kafka_metadata_t> owned{metadata};

    if (RD_KAFKA_RESP_ERR_NO_ERROR != err || 0 == metadata->topic_cnt ||
        RD_KAFKA_RESP_ERR_NO_ERROR != metadata->topics[0].err ||
        0 == metadata->topics[0].partition_cnt) {
      KFK_DEBUG_PRINT(std::cerr << "kafka topic not available yet: " << topic
                                << '\n');
      rd_kafka_topic_destroy(rkt);

      continue;
    }

    std::vector<TopicPartition> started{};

    {
      std::unique_lock lock{m_state_mutex};

      if (m_topics.contains(topic)) {
        rd_kafka_topic_destroy(rkt);

        continue;
      }

      const auto &topicMetadata = metadata->topics[0];
      for (int idx = 0; idx < topicMetadata.partition_cnt; idx++) {
        auto partition = topicMetadata.partitions[idx].id;

        if (-1 == rd_kafka_consume_start_queue(rkt, partition, startOffset,
                                               m_queue.get())) {
          m_logger->error(
              "failed to start kafka partition",
              {{"kafka_topic", topic},
               {"kafka_partition", std::to_string(partition)},
               {"error", rd_kafka_err2str(rd_kafka_last_error())}});

          continue;
        }

        m_partitions.emplace_back(topic, partition);
        started.emplace_back(topic, partition);
      }

      m_topics.emplace(topic, rkt);

      if (!m_paused_topics.contains(topic)) {
        started.clear();
      }
    }

    m_logger->info("kafka topic partitions started",
                   {{"kafka_topic", topic},
                    {"partitions",
                     std::to_string(metadata->topics[0].partition_cnt)}});

    if (auto ec = applyPause(rk, started, true); ec) {
      m_logger->warn("failed to pause kafka topic",
                     {{"kafka_topic", topic}, {"error", ec.message()}});
    }
  }
}

auto Kfk_Consumer::pollWith(const Kfk_Lease &lease, const Kfk_Context::Ptr &ctx,
                            std::size_t max)
    -> std::expected<Kfk_FetchResult, std::error_code> {
  auto *rk = lease.handle();

  if (!isGroupMode()) {
    startPendingTopics(lease, ctx);
  }

  std::vector<Kfk_KafkaPtr<rd_kafka_message_t>> messages{};

  while (messages.empty()) {
    if (ctx->err()) {
      break;
    }

    if (lease.isClosing()) {
      return std::unexpected(make_error_code(Kfk_Errc::kClientClosed));
    }

    Kfk_KafkaPtr<rd_kafka_message_t> message{
        nextMessage(rk, toTimeoutMs(ctx->remaining(kPollSlice)))};
    if (message) {
      messages.push_back(std::move(message));
    } else if (!isGroupMode()) {
      startPendingTopics(lease, ctx);
    }
  }

  while (!messages.empty() && messages.size() < max) {
    Kfk_KafkaPtr<rd_kafka_message_t> message{nextMessage(rk, 0)};
    if (!message) {
      break;
    }

    messages.push_back(std::move(message));
  }

  return fetchesToResult(messages, m_logger.get());
}

auto Kfk_Consumer::poll(const Kfk_Context::Ptr &ctx)
    -> std::expected<Kfk_FetchResult, std::error_code> {
  if (!ctx) {
    return std::unexpected(make_error_code(Kfk_Errc::kNilContext));
  }

  auto client = snapshot();
  if (!client) {
    return std::unexpected(client.error());
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    return std::unexpected(make_error_code(Kfk_Errc::kClientClosed));
  }

  return pollWith(*lease, ctx, kMaxPollRecords);
}

auto Kfk_Consumer::pollRecords(const Kfk_Context::Ptr &ctx, std::size_t max)
    -> std::expected<std::vector<Kfk_ConsumedRecord>, std::error_code> {
  if (!ctx) {
    return std::unexpected(make_error_code(Kfk_Errc::kNilContext));
  }

  auto client = snapshot();
  if (!client) {
    return std::unexpected(client.error());
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    return std::unexpected(make_error_code(Kfk_Errc::kClientClosed));
  }

  if (0 == max) {
    return std::vector<Kfk_ConsumedRecord>{};
  }

  auto result = pollWith(*lease, ctx, max);
  if (!result) {
    return std::unexpected(result.error());
  }

  if (result->hasErrors()) {
    return std::unexpected(result->firstError());
  }

  return result->records();
}

auto Kfk_Consumer::checkFetchErrors(const Kfk_FetchResult &result)
    -> std::optional<std::error_code> {
  if (!result.hasErrors()) {
    return std::nullopt;
  }

  const auto &error = result.errors.front();

  if (isClosedError(error.err, error.detail)) {
    m_logger->info("kafka consumer connection closed",
                   {{"kafka_topic", error.topic},
                    {"kafka_partition", std::to_string(error.partition)},
                    {"reason", error.detail}});

    return std::error_code{};
  }

  m_logger->error("kafka fetch error",
                  {{"kafka_topic", error.topic},
                   {"kafka_partition", std::to_string(error.partition)},
                   {"error", error.err.message()},
                   {"detail", error.detail}});

  return error.err;
}

auto Kfk_Consumer::consumeLoop(const Kfk_Context::Ptr &ctx,
                               bool stopOnFetchError,
                               const FetchHandler &deliver) -> std::error_code {
  while (true) {
    auto result = poll(ctx);
    if (!result) {
      if (isClosedError(result.error())) {
        m_logger->info("kafka consumer stopped",
                       {{"reason", result.error().message()}});

        return {};
      }

      m_logger->error("failed to poll kafka",
                      {{"error", result.error().message()}});

      return result.error();
    }

    // what was fetched is handed over before a finished ctx ends the loop
    if (result->isEmpty() && !result->hasErrors()) {
      if (ctx->err()) {
        return {};
      }

      continue;
    }

    if (stopOnFetchError) {
      if (auto ec = checkFetchErrors(*result); ec) {
        return *ec;
      }
    }

    if (auto ec = deliver(*result); ec) {
      return ec;
    }

    if (ctx->err()) {
      return {};
    }
  }
}

auto Kfk_Consumer::consume(const Kfk_Context::Ptr &ctx,
                           const RecordHandler &handler) -> std::error_code {
  if (!ctx) {
    return Kfk_Errc::kNilContext;
  }

  if (!handler) {
    return Kfk_Errc::kNilHandler;
  }

  return consumeLoop(
      ctx, true, [this, &handler](const Kfk_FetchResult &result) {
        for (const auto &batch : result.batches) {
          for (const auto &record : batch.records) {
            logRecordReceived(*m_logger, record);

            if (auto ec = handler(record); ec) {
              m_logger->error("kafka record handler failed",
                              {{"kafka_topic", record.topic},
                               {"kafka_partition",
                                std::to_string(record.partition)},
                               {"kafka_offset", std::to_string(record.offset)},
                               {"error", ec.message()}});

              return ec;
            }
          }
        }

        return std::error_code{};
      });
}

auto Kfk_Consumer::consumeBatches(const Kfk_Context::Ptr &ctx,
                                  const BatchHandler &handler)
    -> std::error_code {
  if (!ctx) {
    return Kfk_Errc::kNilContext;
  }

  if (!handler) {
    return Kfk_Errc::kNilHandler;
  }

  return consumeLoop(
      ctx, true, [this, &handler](const Kfk_FetchResult &result) {
        for (const auto &batch : result.batches) {
          logBatchReceived(*m_logger, batch);

          if (auto ec = handler(batch); ec) {
            m_logger->error(
                "kafka batch handler failed",
                {{"kafka_topic", batch.topic},
                 {"kafka_partition", std::to_string(batch.partition)},
                 {"kafka_offset", std::to_string(batch.firstOffset())},
                 {"error", ec.message()}});

            return ec;
          }
        }

        return std::error_code{};
      });
}

auto Kfk_Consumer::consumeFetches(const Kfk_Context::Ptr &ctx,
                                  const FetchHandler &handler)
    -> std::error_code {
  if (!ctx) {
    return Kfk_Errc::kNilContext;
  }

  if (!handler) {
    return Kfk_Errc::kNilHandler;
  }

  return consumeLoop(
      ctx, false, [this, &handler](const Kfk_FetchResult &result) {
        auto ec = handler(result);
        if (ec) {
          Kfk_LogFields fields{{"error", ec.message()}};

          if (!result.batches.empty()) {
            const auto &batch = result.batches.front();

            fields.emplace_back("kafka_topic", batch.topic);
            fields.emplace_back("kafka_partition",
                                std::to_string(batch.partition));
            fields.emplace_back("kafka_offset",
                                std::to_string(batch.firstOffset()));
          }

          m_logger->error("kafka fetch handler failed", fields);
        }

        return ec;
      });
}

auto Kfk_Consumer::consumeChannel(const Kfk_Context::Ptr &ctx, Channel channel)
    -> std::error_code {
  if (!ctx) {
    return Kfk_Errc::kNilContext;
  }

  if (!channel) {
    return Kfk_Errc::kNilHandler;
  }

  return consumeLoop(
      ctx, true, [this, &ctx, &channel](const Kfk_FetchResult &result) {
        for (auto &record : result.records()) {
          logRecordReceived(*m_logger, record);

          Kfk_LogFields fields{
              {"kafka_topic", record.topic},
              {"kafka_partition", std::to_string(record.partition)},
              {"kafka_offset", std::to_string(record.offset)}};

          if (auto ec = channel->push(std::move(record), ctx); ec) {
            if (ctx->err()) {
              return std::error_code{};
            }

            fields.emplace_back("error", ec.message());
            m_logger->error("failed to send kafka record to channel", fields);

            return ec;
          }
        }

        return std::error_code{};
      });
}

auto Kfk_Consumer::commitList(const Kfk_Context::Ptr &ctx,
                              rd_kafka_topic_partition_list_t *offsets)
    -> std::error_code {
  auto client = snapshot();
  if (!client) {
    return client.error();
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    return Kfk_Errc::kClientClosed;
  }

  Kfk_KafkaPtr<rd_kafka_queue_t> queue{rd_kafka_queue_new(lease->handle())};

  auto err = rd_kafka_commit_queue(lease->handle(), offsets, queue.get(),
                                   nullptr, nullptr);
  if (RD_KAFKA_RESP_ERR__NO_OFFSET == err) {
    return {};
  }

  if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
    m_logger->error("failed to commit kafka offsets",
                    {{"error", rd_kafka_err2str(err)}});

    return toErrorCode(err);
  }

  auto event = awaitEvent(*lease, queue.get(), ctx);
  if (!event) {
    return event.error();
  }

  err = rd_kafka_event_error(event->get());
  if (RD_KAFKA_RESP_ERR__NO_OFFSET == err) {
    return {};
  }

  if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
    m_logger->error("failed to commit kafka offsets",
                    {{"error", rd_kafka_err2str(err)}});

    return toErrorCode(err);
  }

  const auto *committed = rd_kafka_event_topic_partition_list(event->get());
  if (nullptr != committed) {
    for (int idx = 0; idx < committed->cnt; idx++) {
      const auto &elem = committed->elems[idx];

      if (RD_KAFKA_RESP_ERR_NO_ERROR != elem.err) {
        m_logger->error("failed to commit kafka offset",
                        {{"kafka_topic", elem.topic},
                         {"kafka_partition", std::to_string(elem.partition)},
                         {"kafka_offset", std::to_string(elem.offset)},
                         {"error", rd_kafka_err2str(elem.err)}});

        return toErrorCode(elem.err);
      }
    }
  }

  return {};
}

auto Kfk_Consumer::commitOffsets(const Kfk_Context::Ptr &ctx)
    -> std::error_code {
  if (!ctx) {
    return Kfk_Errc::kNilContext;
  }

  if (!isGroupMode()) {
    return Kfk_Errc::kMissingGroup;
  }

  return commitList(ctx, nullptr);
}

auto Kfk_Consumer::commitRecord(const Kfk_Context::Ptr &ctx,
                                const Kfk_ConsumedRecord &record)
    -> std::error_code {
  if (!ctx) {
    return Kfk_Errc::kNilContext;
  }

  if (!isGroupMode()) {
    return Kfk_Errc::kMissingGroup;
  }

  Kfk_KafkaPtr<rd_kafka_topic_partition_list_t> offsets{
      rd_kafka_topic_partition_list_new(1)};

  auto *elem = rd_kafka_topic_partition_list_add(
      offsets.get(), record.topic.c_str(), record.partition);
  elem->offset = record.offset + 1;

  if (record.leaderEpoch >= 0) {
    rd_kafka_topic_partition_set_leader_epoch(elem, record.leaderEpoch);
  }

  return commitList(ctx, offsets.get());
}

auto Kfk_Consumer::commitBatch(const Kfk_Context::Ptr &ctx,
                               const Kfk_Batch &batch) -> std::error_code {
  if (!ctx) {
    return Kfk_Errc::kNilContext;
  }

  if (!isGroupMode()) {
    return Kfk_Errc::kMissingGroup;
  }

  if (batch.isEmpty()) {
    return {};
  }

  return commitRecord(ctx, batch.records.back());
}

auto Kfk_Consumer::currentPartitions(rd_kafka_t *handle)
    -> std::vector<TopicPartition> {
  std::vector<TopicPartition> partitions{};

  if (!isGroupMode()) {
    std::unique_lock lock{m_state_mutex};

    return m_partitions;
  }

  rd_kafka_topic_partition_list_t *assignment{};
  auto err = rd_kafka_assignment(handle, &assignment);
  Kfk_KafkaPtr<rd_kafka_topic_partition_list_t> owned{assignment};

  if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
    m_logger->warn("failed to read kafka assignment",
                   {{"error", rd_kafka_err2str(err)}});

    return partitions;
  }

  for (int idx = 0; idx < assignment->cnt; idx++) {
    partitions.emplace_back(assignment->elems[idx].topic,
                            assignment->elems[idx].partition);
  }

  return partitions;
}

auto Kfk_Consumer::applyPause(rd_kafka_t *handle,
                              const std::vector<TopicPartition> &partitions,
                              bool pause) -> std::error_code {
  if (partitions.empty()) {
    return {};
  }

  auto list = toPartitionList(partitions);

  auto err = pause ? rd_kafka_pause_partitions(handle, list.get())
                   : rd_kafka_resume_partitions(handle, list.get());
  if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
    return toErrorCode(err);
  }

  for (int idx = 0; idx < list->cnt; idx++) {
    const auto &elem = list->elems[idx];

    if (RD_KAFKA_RESP_ERR_NO_ERROR != elem.err) {
      m_logger->warn(pause ? "failed to pause kafka partition"
                           : "failed to resume kafka partition",
                     {{"kafka_topic", elem.topic},
                      {"kafka_partition", std::to_string(elem.partition)},
                      {"error", rd_kafka_err2str(elem.err)}});
    }
  }

  return {};
}

auto Kfk_Consumer::pause(const std::vector<std::string> &topics)
    -> std::error_code {
  auto client = snapshot();
  if (!client) {
    return {};
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    return {};
  }

  {
    std::unique_lock lock{m_state_mutex};

    m_paused_topics.insert(topics.begin(), topics.end());
  }

  const std::set<std::string> wanted{topics.begin(), topics.end()};
  std::vector<TopicPartition> selected{};

  for (auto &partition : currentPartitions(lease->handle())) {
    if (wanted.contains(partition.first)) {
      selected.push_back(std::move(partition));
    }
  }

  m_logger->info("kafka topics paused", {{"kafka_topics", join(topics)}});

  return applyPause(lease->handle(), selected, true);
}

auto Kfk_Consumer::resume(const std::vector<std::string> &topics)
    -> std::error_code {
  auto client = snapshot();
  if (!client) {
    return {};
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    return {};
  }

  const std::set<std::string> wanted{topics.begin(), topics.end()};

  {
    std::unique_lock lock{m_state_mutex};

    for (const auto &topic : topics) {
      m_paused_topics.erase(topic);
    }

    std::erase_if(m_paused_partitions, [&wanted](const auto &partition) {
      return wanted.contains(partition.first);
    });
  }

  std::vector<TopicPartition> selected{};

  for (auto &partition : currentPartitions(lease->handle())) {
    if (wanted.contains(partition.first)) {
      selected.push_back(std::move(partition));
    }
  }

  m_logger->info("kafka topics resumed", {{"kafka_topics", join(topics)}});

  return applyPause(lease->handle(), selected, false);
}

auto Kfk_Consumer::pausePartitions(const PartitionMap &partitions)
    -> std::error_code {
  auto client = snapshot();
  if (!client) {
    return {};
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    return {};
  }

  std::vector<TopicPartition> selected{};

  {
    std::unique_lock lock{m_state_mutex};

    for (const auto &[topic, ids] : partitions) {
      for (auto id : ids) {
        m_paused_partitions.emplace(topic, id);
        selected.emplace_back(topic, id);
      }
    }
  }

  m_logger->info("kafka partitions paused",
                 {{"kafka_topics", join(topicsOf(partitions))}});

  return applyPause(lease->handle(), selected, true);
}

auto Kfk_Consumer::resumePartitions(const PartitionMap &partitions)
    -> std::error_code {
  auto client = snapshot();
  if (!client) {
    return {};
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    return {};
  }

  std::vector<TopicPartition> selected{};

  {
    std::unique_lock lock{m_state_mutex};

    for (const auto &[topic, ids] : partitions) {
      for (auto id : ids) {
        m_paused_partitions.erase({topic, id});
        selected.emplace_back(topic, id);
      }
    }
  }

  m_logger->info("kafka partitions resumed",
                 {{"kafka_topics", join(topicsOf(partitions))}});

  return applyPause(lease->handle(), selected, false);
}

void Kfk_Consumer::repause(rd_kafka_t *handle,
                           const rd_kafka_topic_partition_list_t *assigned) {
  std::vector<TopicPartition> selected{};

  {
    std::unique_lock lock{m_state_mutex};

    for (int idx = 0; idx < assigned->cnt; idx++) {
      TopicPartition partition{assigned->elems[idx].topic,
                               assigned->elems[idx].partition};

      if (m_paused_topics.contains(partition.first) ||
          m_paused_partitions.contains(partition)) {
        selected.push_back(std::move(partition));
      }
    }
  }

  if (auto ec = applyPause(handle, selected, true); ec) {
    m_logger->warn("failed to pause reassigned kafka partitions",
                   {{"error", ec.message()}});
  }
}

void Kfk_Consumer::rebalance(rd_kafka_t *handle, rd_kafka_resp_err_t err,
                             rd_kafka_topic_partition_list_t *partitions,
                             void *opaque) {
  auto *consumer = static_cast<Kfk_Consumer *>(
      static_cast<Kfk_ClientOpaque *>(opaque)->owner);
  auto &logger = *consumer->m_logger;

  const char *protocol = rd_kafka_rebalance_protocol(handle);
  const bool cooperative =
      nullptr != protocol && std::string_view{protocol} == "COOPERATIVE";

  KFK_DEBUG_PRINT(std::cerr << "rebalance (" << rd_kafka_err2name(err)
                            << "): " << partitions->cnt << " partitions\n");

  switch (err) {
  case RD_KAFKA_RESP_ERR__ASSIGN_PARTITIONS:
    if (cooperative) {
      Kfk_KafkaPtr<rd_kafka_error_t> error{
          rd_kafka_incremental_assign(handle, partitions)};
      if (error) {
        logger.error("failed to assign kafka partitions",
                     {{"error", rd_kafka_error_string(error.get())}});
      }
    } else if (auto assignErr = rd_kafka_assign(handle, partitions);
               RD_KAFKA_RESP_ERR_NO_ERROR != assignErr) {
      logger.error("failed to assign kafka partitions",
                   {{"error", rd_kafka_err2str(assignErr)}});
    }

    consumer->repause(handle, partitions);

    logger.info("kafka partitions assigned",
                {{"partitions", std::to_string(partitions->cnt)}});
    break;

  case RD_KAFKA_RESP_ERR__REVOKE_PARTITIONS:
    if (cooperative) {
      Kfk_KafkaPtr<rd_kafka_error_t> error{
          rd_kafka_incremental_unassign(handle, partitions)};
      if (error) {
        logger.error("failed to revoke kafka partitions",
                     {{"error", rd_kafka_error_string(error.get())}});
      }
    } else if (auto assignErr = rd_kafka_assign(handle, nullptr);
               RD_KAFKA_RESP_ERR_NO_ERROR != assignErr) {
      logger.error("failed to revoke kafka partitions",
                   {{"error", rd_kafka_err2str(assignErr)}});
    }

    logger.info("kafka partitions revoked",
                {{"partitions", std::to_string(partitions->cnt)}});
    break;

  default:
    logger.error("kafka rebalance failed", {{"error", rd_kafka_err2str(err)}});

    if (auto assignErr = rd_kafka_assign(handle, nullptr);
        RD_KAFKA_RESP_ERR_NO_ERROR != assignErr) {
      logger.error("failed to clear kafka assignment",
                   {{"error", rd_kafka_err2str(assignErr)}});
    }
    break;
  }
}

void Kfk_Consumer::shutdown(rd_kafka_t *handle) {
  if (isGroupMode()) {
    auto err = rd_kafka_consumer_close(handle);
    if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
      m_logger->warn("failed to leave kafka consumer group",
                     {{"error", rd_kafka_err2str(err)}});
    }

    return;
  }

  std::map<std::string, rd_kafka_topic_t *> topics{};
  std::vector<TopicPartition> partitions{};

  {
    std::unique_lock lock{m_state_mutex};

    topics.swap(m_topics);
    partitions.swap(m_partitions);
  }

  for (const auto &[topic, partition] : partitions) {
    if (-1 == rd_kafka_consume_stop(topics[topic], partition)) {
      m_logger->warn("failed to stop kafka partition",
                     {{"kafka_topic", topic},
                      {"kafka_partition", std::to_string(partition)},
                      {"error", rd_kafka_err2str(rd_kafka_last_error())}});
    }
  }

  m_queue.reset();

  for (const auto &[topic, rkt] : topics) {
    rd_kafka_topic_destroy(rkt);
  }
}

void Kfk_Consumer::close() {
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
    client->close([this](rd_kafka_t *handle) { shutdown(handle); });
    m_logger->info("kafka consumer closed");
  }
}

auto Kfk_Consumer::isConnected() const -> bool {
  std::shared_lock lock{m_mutex};

  return !m_closed && m_client;
}

auto Kfk_Consumer::config() const -> const Kfk_ConsumerConfig & {
  return m_config;
}

} // namespace kfk
