/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-consumer.hpp
 * @brief The kfk Kafka consumer facade.
 *
 * Kfk_Consumer reads the configured topics in one of two modes:
 *  - with a group, it subscribes as a member of the consumer group and
 *    librdkafka balances the partitions among the members. Rebalances are
 *    handled with the eager or the cooperative protocol, whichever the group
 *    uses, and partitions of paused topics stay paused across them.
 *  - without a group, it reads every partition of the topics directly from
 *    the configured start offset. Partitions are discovered on the first
 *    poll (and retried on later polls for topics not found yet). Offsets
 *    can not be committed, commits fail with Kfk_Errc::kMissingGroup.
 *
 * Reading:
 *  - poll() returns one round as a Kfk_FetchResult: per partition batches
 *    in offset order plus the fetch errors of the round.
 *  - pollRecords() caps the round and turns a fetch error into the call's
 *    error.
 *  - consume(), consumeBatches(), consumeFetches() and consumeChannel()
 *    loop over poll() and hand records, batches, whole fetch results or
 *    channel pushes to the caller. They return success when ctx is done or
 *    the consumer is closed (from any thread), a handler error ends the
 *    loop and is returned.
 *
 * Example:
 *
 *   auto ec = consumer->consume(ctx, [&](const kfk::Kfk_ConsumedRecord &r) {
 *     process(r);
 *
 *     return consumer->commitRecord(ctx, r);
 *   });
 *
 * Handlers run on the calling thread without any consumer lock held, so they
 * may call back into the consumer (commit, pause, close).
 */

#ifndef KFK_CONSUMER_HPP_

#define KFK_CONSUMER_HPP_

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "rdkafka.h"

#include "kafka/kfk-client.hpp"
#include "kafka/kfk-config.hpp"
#include "kafka/kfk-kafka-util.hpp"
#include "kafka/kfk-message.hpp"
#include "kfk-buffer.hpp"
#include "kfk-context.hpp"
#include "kfk-log.hpp"

namespace kfk {

class Kfk_Consumer {
public:
  using RecordHandler =
      std::function<std::error_code(const Kfk_ConsumedRecord &record)>;
  using BatchHandler = std::function<std::error_code(const Kfk_Batch &batch)>;
  using FetchHandler =
      std::function<std::error_code(const Kfk_FetchResult &result)>;
  using Channel = std::shared_ptr<Kfk_Buffer<Kfk_ConsumedRecord>>;
  using PartitionMap = std::map<std::string, std::vector<std::int32_t>>;

  /**
   * The most messages one poll() drains after the first one arrived.
   */
  static constexpr std::size_t kMaxPollRecords{500};

  /**
   * @brief Create a consumer and, with a group, subscribe to its topics.
   *        A null config fails with Kfk_Errc::kNilConfig.
   */
  static auto create(const Kfk_ConsumerConfig *config,
                     std::shared_ptr<Kfk_Logger> logger = {})
      -> std::expected<std::unique_ptr<Kfk_Consumer>, std::error_code>;

  ~Kfk_Consumer() noexcept;

  Kfk_Consumer(const Kfk_Consumer &obj) = delete;
  const Kfk_Consumer &operator=(const Kfk_Consumer &obj) = delete;
  Kfk_Consumer(Kfk_Consumer &&obj) = delete;
  Kfk_Consumer &operator=(Kfk_Consumer &&obj) = delete;

  /**
   * @brief Block until a record or fetch error arrives, or ctx is done (an
   *        empty result then), and return the round.
   */
  auto poll(const Kfk_Context::Ptr &ctx)
      -> std::expected<Kfk_FetchResult, std::error_code>;

  auto pollRecords(const Kfk_Context::Ptr &ctx, std::size_t max)
      -> std::expected<std::vector<Kfk_ConsumedRecord>, std::error_code>;

  auto consume(const Kfk_Context::Ptr &ctx, const RecordHandler &handler)
      -> std::error_code;

  auto consumeBatches(const Kfk_Context::Ptr &ctx, const BatchHandler &handler)
      -> std::error_code;

  /**
   * @brief Hand every round to handler, fetch errors included. The loop ends
   *        with the handler's first error.
   */
  auto consumeFetches(const Kfk_Context::Ptr &ctx, const FetchHandler &handler)
      -> std::error_code;

  /**
   * @brief Push every record into channel, in Kfk_FetchResult::records()
   *        order. A push blocked on a full channel gives up when ctx is done.
   */
  auto consumeChannel(const Kfk_Context::Ptr &ctx, Channel channel)
      -> std::error_code;

  /**
   * @brief Commit the positions of everything consumed so far.
   */
  auto commitOffsets(const Kfk_Context::Ptr &ctx) -> std::error_code;

  /**
   * @brief Commit record as consumed, the committed offset is the next one
   *        to read (record.offset + 1).
   */
  auto commitRecord(const Kfk_Context::Ptr &ctx,
                    const Kfk_ConsumedRecord &record) -> std::error_code;

  /**
   * @brief Commit the last record of batch, an empty batch commits nothing.
   */
  auto commitBatch(const Kfk_Context::Ptr &ctx, const Kfk_Batch &batch)
      -> std::error_code;

  /**
   * @brief Stop fetching the assigned partitions of topics. Records already
   *        fetched for them are discarded by librdkafka and fetched again
   *        after resume. A closed consumer ignores the call.
   */
  auto pause(const std::vector<std::string> &topics) -> std::error_code;

  auto resume(const std::vector<std::string> &topics) -> std::error_code;

  auto pausePartitions(const PartitionMap &partitions) -> std::error_code;

  auto resumePartitions(const PartitionMap &partitions) -> std::error_code;

  void close();

  auto isConnected() const -> bool;

  auto config() const -> const Kfk_ConsumerConfig &;

private:
  using TopicPartition = std::pair<std::string, std::int32_t>;

  Kfk_Consumer(Kfk_ConsumerConfig config, std::shared_ptr<Kfk_Logger> logger);

  auto open() -> std::error_code;

  auto snapshot() const
      -> std::expected<std::shared_ptr<Kfk_Client>, std::error_code>;

  auto isGroupMode() const -> bool;

  auto pollWith(const Kfk_Lease &lease, const Kfk_Context::Ptr &ctx,
                std::size_t max)
      -> std::expected<Kfk_FetchResult, std::error_code>;

  auto nextMessage(rd_kafka_t *handle, int timeoutMs) -> rd_kafka_message_t *;

  void startPendingTopics(const Kfk_Lease &lease, const Kfk_Context::Ptr &ctx);

  auto commitList(const Kfk_Context::Ptr &ctx,
                  rd_kafka_topic_partition_list_t *offsets) -> std::error_code;

  auto consumeLoop(const Kfk_Context::Ptr &ctx, bool stopOnFetchError,
                   const FetchHandler &deliver) -> std::error_code;

  /**
   * @brief Log and classify the fetch errors of a round. std::nullopt lets
   *        the loop go on, otherwise the loop returns the value (empty for
   *        an error classified as closed).
   */
  auto checkFetchErrors(const Kfk_FetchResult &result)
      -> std::optional<std::error_code>;

  auto currentPartitions(rd_kafka_t *handle) -> std::vector<TopicPartition>;

  auto applyPause(rd_kafka_t *handle,
                  const std::vector<TopicPartition> &partitions, bool pause)
      -> std::error_code;

  void repause(rd_kafka_t *handle,
               const rd_kafka_topic_partition_list_t *assigned);

  void shutdown(rd_kafka_t *handle);

  static void rebalance(rd_kafka_t *handle, rd_kafka_resp_err_t err,
                        rd_kafka_topic_partition_list_t *partitions,
                        void *opaque);

  /**
   * data members for constructor to instantiate the object.
   */
  const Kfk_ConsumerConfig m_config{};
  std::shared_ptr<Kfk_Logger> m_logger{};

  /**
   * data members for internal logic.
   */
  mutable std::shared_mutex m_mutex{};
  bool m_closed{};
  std::shared_ptr<Kfk_Client> m_client{};

  // pause bookkeeping, and the partitions read without a group
  std::mutex m_state_mutex{};
  std::set<std::string> m_paused_topics{};
  std::set<TopicPartition> m_paused_partitions{};
  Kfk_KafkaPtr<rd_kafka_queue_t> m_queue{};
  std::map<std::string, rd_kafka_topic_t *> m_topics{};
  std::vector<TopicPartition> m_partitions{};
}; // class Kfk_Consumer

} // namespace kfk

#endif // KFK_CONSUMER_HPP_
