/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-message.hpp
 * @brief The record model of the kfk facade and its conversion to and from
 *        librdkafka messages.
 *
 * Outbound:
 *  - Kfk_Record is built fluently and handed to Kfk_Producer, e.g.
 *
 *      auto record = kfk::Kfk_Record::of("hello")
 *                        .withKey("k")
 *                        .withHeader("trace", "abc");
 *
 *  - Kfk_ProduceResult reports where a record landed or why it failed.
 *
 * Inbound:
 *  - Kfk_ConsumedRecord owns copies of the payload, key and headers, so it
 *    stays valid after the librdkafka message is destroyed.
 *  - Kfk_Batch holds the records of one topic partition from one poll, in
 *    strictly increasing offset order.
 *  - Kfk_FetchResult is the outcome of one poll: the batches, in the order
 *    their partitions first appeared, and the per-partition fetch errors.
 */

#ifndef KFK_MESSAGE_HPP_

#define KFK_MESSAGE_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "rdkafka.h"

#include "kafka/kfk-kafka-util.hpp"
#include "kfk-context.hpp"
#include "kfk-log.hpp"

namespace kfk {

struct Kfk_Header {
  std::string key{};
  std::string value{};
}; // struct Kfk_Header

using Kfk_Headers = std::vector<Kfk_Header>;

constexpr std::int32_t kAnyPartition = -1;

/**
 * Context values the producers carry into record headers.
 */
inline constexpr std::string_view kTraceIdKey{"trace_id"};
inline constexpr std::string_view kRequestIdKey{"request_id"};
inline constexpr std::string_view kTraceIdHeader{"X-Trace-ID"};
inline constexpr std::string_view kRequestIdHeader{"X-Request-ID"};

struct Kfk_Record {
  std::string topic{};
  std::optional<std::string> key{};
  std::optional<std::string> value{};
  Kfk_Headers headers{};
  std::int32_t partition{kAnyPartition};

  /**
   * The epoch (zero) timestamp lets the broker assign the record time.
   */
  std::chrono::system_clock::time_point timestamp{};

  static auto of(std::string_view value) -> Kfk_Record;

  auto withKey(std::string_view key) -> Kfk_Record &;
  auto withTopic(std::string_view topic) -> Kfk_Record &;
  auto withPartition(std::int32_t partition) -> Kfk_Record &;
  auto withTimestamp(std::chrono::system_clock::time_point timestamp)
      -> Kfk_Record &;
  auto withHeader(std::string_view key, std::string_view value)
      -> Kfk_Record &;
  auto withHeaders(const Kfk_Headers &headers) -> Kfk_Record &;
}; // struct Kfk_Record

struct Kfk_ProduceResult {
  Kfk_Record record{};

  /**
   * The topic the record was sent to, record.topic or the default topic.
   */
  std::string topic{};
  std::int32_t partition{kAnyPartition};
  std::int64_t offset{-1};
  std::error_code err{};
}; // struct Kfk_ProduceResult

enum class Kfk_TimestampType { kNotAvailable, kCreateTime, kLogAppendTime };

struct Kfk_ConsumedRecord {
  std::string topic{};
  std::int32_t partition{};
  std::int64_t offset{};
  std::optional<std::string> key{};
  std::optional<std::string> value{};
  Kfk_Headers headers{};
  std::chrono::system_clock::time_point timestamp{};
  Kfk_TimestampType timestampType{Kfk_TimestampType::kNotAvailable};
  std::int32_t leaderEpoch{-1};

  /**
   * @brief The value of the first header named key, if any.
   */
  auto header(std::string_view key) const -> std::optional<std::string>;
}; // struct Kfk_ConsumedRecord

struct Kfk_Batch {
  std::string topic{};
  std::int32_t partition{};
  std::vector<Kfk_ConsumedRecord> records{};

  /**
   * @brief Offsets of the first and last record, -1 for an empty batch.
   */
  auto firstOffset() const -> std::int64_t;
  auto lastOffset() const -> std::int64_t;
  auto isEmpty() const -> bool;
}; // struct Kfk_Batch

struct Kfk_FetchError {
  std::string topic{};
  std::int32_t partition{};
  std::error_code err{};
  std::string detail{};
}; // struct Kfk_FetchError

struct Kfk_FetchResult {
  std::vector<Kfk_Batch> batches{};
  std::vector<Kfk_FetchError> errors{};

  auto recordCount() const -> std::size_t;

  /**
   * @brief All records flattened, batch by batch.
   */
  auto records() const -> std::vector<Kfk_ConsumedRecord>;
  auto hasErrors() const -> bool;

  /**
   * @brief The error of the first fetch error, empty if there is none.
   */
  auto firstError() const -> std::error_code;
  auto isEmpty() const -> bool;
}; // struct Kfk_FetchResult

/**
 * A record lowered to the arguments of rd_kafka_produceva(). The key and
 * value point into the source Kfk_Record, which must outlive it.
 */
struct Kfk_OutboundMessage {
  std::string topic{};
  std::int32_t partition{RD_KAFKA_PARTITION_UA};
  const std::string *key{};
  const std::string *value{};
  Kfk_KafkaPtr<rd_kafka_headers_t> headers{};
  std::int64_t timestampMs{};
}; // struct Kfk_OutboundMessage

/**
 * @brief Lower a record for librdkafka. The topic falls back to defaultTopic
 *        when empty, the partition is kept only when explicit (>= 0) and
 *        the timestamp only when non-zero. Headers keep their order.
 */
auto recordToKafka(const Kfk_Record &record, std::string_view defaultTopic)
    -> Kfk_OutboundMessage;

/**
 * @brief Append the X-Trace-ID and X-Request-ID headers of the trace_id and
 *        request_id values ctx carries. A header the record already has is
 *        left alone.
 */
void addContextHeaders(Kfk_Record &record, const Kfk_Context &ctx);

/**
 * @brief Deep-copy a successfully fetched librdkafka message.
 */
auto toConsumedRecord(rd_kafka_message_t *message) -> Kfk_ConsumedRecord;

/**
 * @brief The fetch error carried by a librdkafka message with err set.
 */
auto toFetchError(const rd_kafka_message_t *message) -> Kfk_FetchError;

/**
 * @brief Group records into one batch per topic partition, in the order the
 *        partitions first appear. A record whose offset is not above the
 *        last one kept for its partition is dropped, and logged at debug
 *        level when a logger is given.
 */
auto assembleFetchResult(std::vector<Kfk_ConsumedRecord> records,
                         std::vector<Kfk_FetchError> errors,
                         Kfk_Logger *logger = nullptr) -> Kfk_FetchResult;

/**
 * @brief Convert the messages of one poll into a Kfk_FetchResult. Partition
 *        EOF events are skipped.
 */
auto fetchesToResult(const std::vector<Kfk_KafkaPtr<rd_kafka_message_t>> &messages,
                     Kfk_Logger *logger = nullptr) -> Kfk_FetchResult;

} // namespace kfk

#endif // KFK_MESSAGE_HPP_
