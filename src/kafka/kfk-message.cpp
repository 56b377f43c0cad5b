/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-message.cpp
 * @brief Implementation of the kfk record model.
 */

#include "kafka/kfk-message.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "rdkafka.h"

#include "kafka/kfk-kafka-util.hpp"
#include "kfk-context.hpp"
#include "kfk-log.hpp"

namespace kfk {

auto Kfk_Record::of(std::string_view value) -> Kfk_Record {
  Kfk_Record record{};
  record.value = std::string{value};

  return record;
}

auto Kfk_Record::withKey(std::string_view key) -> Kfk_Record & {
  this->key = std::string{key};

  return *this;
}

auto Kfk_Record::withTopic(std::string_view topic) -> Kfk_Record & {
  this->topic = topic;

  return *this;
}

auto Kfk_Record::withPartition(std::int32_t partition) -> Kfk_Record & {
  this->partition = partition;

  return *this;
}

auto Kfk_Record::withTimestamp(std::chrono::system_clock::time_point timestamp)
    -> Kfk_Record & {
  this->timestamp = timestamp;

  return *this;
}

auto Kfk_Record::withHeader(std::string_view key, std::string_view value)
    -> Kfk_Record & {
  headers.push_back(Kfk_Header{std::string{key}, std::string{value}});

  return *this;
}

auto Kfk_Record::withHeaders(const Kfk_Headers &headers) -> Kfk_Record & {
  this->headers.insert(this->headers.end(), headers.begin(), headers.end());

  return *this;
}

void addContextHeaders(Kfk_Record &record, const Kfk_Context &ctx) {
  auto add = [&record, &ctx](std::string_view key, std::string_view header) {
    auto value = ctx.value(key);
    if (!value || value->empty()) {
      return;
    }

    for (const auto &existing : record.headers) {
      if (existing.key == header) {
        return;
      }
    }

    record.withHeader(header, *value);
  };

  add(kTraceIdKey, kTraceIdHeader);
  add(kRequestIdKey, kRequestIdHeader);
}

auto Kfk_ConsumedRecord::header(std::string_view key) const
    -> std::optional<std::string> {
  for (const auto &header : headers) {
    if (header.key == key) {
      return header.value;
    }
  }

  return std::nullopt;
}

auto Kfk_Batch::firstOffset() const -> std::int64_t {
  return records.empty() ? -1 : records.front().offset;
}

auto Kfk_Batch::lastOffset() const -> std::int64_t {
  return records.empty() ? -1 : records.back().offset;
}

auto Kfk_Batch::isEmpty() const -> bool { return records.empty(); }

auto Kfk_FetchResult::recordCount() const -> std::size_t {
  std::size_t count{};

  for (const auto &batch : batches) {
    count += batch.records.size();
  }

  return count;
}

auto Kfk_FetchResult::records() const -> std::vector<Kfk_ConsumedRecord> {
  std::vector<Kfk_ConsumedRecord> all{};
  all.reserve(recordCount());

  for (const auto &batch : batches) {
    all.insert(all.end(), batch.records.begin(), batch.records.end());
  }

  return all;
}

auto Kfk_FetchResult::hasErrors() const -> bool { return !errors.empty(); }

auto Kfk_FetchResult::firstError() const -> std::error_code {
  return errors.empty() ? std::error_code{} : errors.front().err;
}

auto Kfk_FetchResult::isEmpty() const -> bool { return batches.empty(); }

auto recordToKafka(const Kfk_Record &record, std::string_view defaultTopic)
    -> Kfk_OutboundMessage {
  Kfk_OutboundMessage message{};

  message.topic = record.topic.empty() ? std::string{defaultTopic}
                                       : record.topic;

  if (record.partition >= 0) {
    message.partition = record.partition;
  }

  if (record.key) {
    message.key = &(*record.key);
  }

  if (record.value) {
    message.value = &(*record.value);
  }

  if (!record.headers.empty()) {
    message.headers.reset(rd_kafka_headers_new(record.headers.size()));

    for (const auto &header : record.headers) {
      rd_kafka_header_add(message.headers.get(), header.key.data(),
                          static_cast<ssize_t>(header.key.size()),
                          header.value.data(),
                          static_cast<ssize_t>(header.value.size()));
    }
  }

  auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(
      record.timestamp.time_since_epoch());
  if (sinceEpoch.count() != 0) {
    message.timestampMs = sinceEpoch.count();
  }

  return message;
}

auto toConsumedRecord(rd_kafka_message_t *message) -> Kfk_ConsumedRecord {
  Kfk_ConsumedRecord record{};

  if (nullptr != message->rkt) {
    record.topic = rd_kafka_topic_name(message->rkt);
  }

  record.partition = message->partition;
  record.offset = message->offset;

  if (nullptr != message->key) {
    record.key = std::string{static_cast<const char *>(message->key),
                             message->key_len};
  }

  if (nullptr != message->payload) {
    record.value = std::string{static_cast<const char *>(message->payload),
                               message->len};
  }

  rd_kafka_headers_t *headers{};
  if (RD_KAFKA_RESP_ERR_NO_ERROR ==
      rd_kafka_message_headers(message, &headers)) {
    const char *name{};
    const void *value{};
    std::size_t size{};

    for (std::size_t idx = 0; RD_KAFKA_RESP_ERR_NO_ERROR ==
                              rd_kafka_header_get_all(headers, idx, &name,
                                                      &value, &size);
         idx++) {
      record.headers.push_back(Kfk_Header{
          std::string{name},
          nullptr == value
              ? std::string{}
              : std::string{static_cast<const char *>(value), size}});
    }
  }

  rd_kafka_timestamp_type_t tsType{RD_KAFKA_TIMESTAMP_NOT_AVAILABLE};
  auto tsMs = rd_kafka_message_timestamp(message, &tsType);

  switch (tsType) {
  case RD_KAFKA_TIMESTAMP_CREATE_TIME:
    record.timestampType = Kfk_TimestampType::kCreateTime;
    break;

  case RD_KAFKA_TIMESTAMP_LOG_APPEND_TIME:
    record.timestampType = Kfk_TimestampType::kLogAppendTime;
    break;

  default:
    record.timestampType = Kfk_TimestampType::kNotAvailable;
    break;
  }

  if (tsMs >= 0) {
    record.timestamp = std::chrono::system_clock::time_point{
        std::chrono::milliseconds{tsMs}};
  }

  record.leaderEpoch = rd_kafka_message_leader_epoch(message);

  return record;
}

auto toFetchError(const rd_kafka_message_t *message) -> Kfk_FetchError {
  Kfk_FetchError error{};

  if (nullptr != message->rkt) {
    error.topic = rd_kafka_topic_name(message->rkt);
  }

  error.partition = message->partition;
  error.err = toErrorCode(message->err);

  const char *detail = rd_kafka_message_errstr(message);
  error.detail = nullptr == detail ? std::string{} : std::string{detail};

  return error;
}

auto assembleFetchResult(std::vector<Kfk_ConsumedRecord> records,
                         std::vector<Kfk_FetchError> errors,
                         Kfk_Logger *logger) -> Kfk_FetchResult {
  Kfk_FetchResult result{};
  result.errors = std::move(errors);

  for (auto &record : records) {
    Kfk_Batch *batch{};

    for (auto &candidate : result.batches) {
      if (candidate.partition == record.partition &&
          candidate.topic == record.topic) {
        batch = &candidate;

        break;
      }
    }

    if (nullptr == batch) {
      result.batches.push_back(
          Kfk_Batch{record.topic, record.partition, {}});
      batch = &result.batches.back();
    }

    if (!batch->records.empty() && record.offset <= batch->lastOffset()) {
      if (nullptr != logger) {
        logger->debug(
            "kafka record dropped, offset not after batch",
            {{"kafka_topic", record.topic},
             {"kafka_partition", std::to_string(record.partition)},
             {"kafka_offset", std::to_string(record.offset)},
             {"kafka_last_offset", std::to_string(batch->lastOffset())}});
      }

      continue;
    }

    batch->records.push_back(std::move(record));
  }

  return result;
}

auto fetchesToResult(const std::vector<Kfk_KafkaPtr<rd_kafka_message_t>> &messages,
                     Kfk_Logger *logger) -> Kfk_FetchResult {
  std::vector<Kfk_ConsumedRecord> records{};
  std::vector<Kfk_FetchError> errors{};

  for (const auto &message : messages) {
    if (RD_KAFKA_RESP_ERR__PARTITION_EOF == message->err) {
      continue;
    }

    if (RD_KAFKA_RESP_ERR_NO_ERROR != message->err) {
      errors.push_back(toFetchError(message.get()));
    } else {
      records.push_back(toConsumedRecord(message.get()));
    }
  }

  return assembleFetchResult(std::move(records), std::move(errors), logger);
}

} // namespace kfk
