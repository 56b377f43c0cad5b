/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-kafka-log.cpp
 * @brief Implementation of the kafka logging helpers.
 */

#include "kafka/kfk-kafka-log.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kafka/kfk-message.hpp"
#include "kfk-log.hpp"
#include "kfk-util.hpp"

namespace kfk {

auto producerLogger(std::shared_ptr<Kfk_Logger> base, std::string_view topic)
    -> std::shared_ptr<Kfk_Logger> {
  return withFields(std::move(base), {{"component", "kafka-producer"},
                                      {"kafka_topic", std::string{topic}}});
}

auto consumerLogger(std::shared_ptr<Kfk_Logger> base,
                    const std::vector<std::string> &topics,
                    std::string_view group) -> std::shared_ptr<Kfk_Logger> {
  return withFields(std::move(base), {{"component", "kafka-consumer"},
                                      {"kafka_topics", join(topics, ",")},
                                      {"kafka_group", std::string{group}}});
}

auto adminLogger(std::shared_ptr<Kfk_Logger> base, std::string_view brokers)
    -> std::shared_ptr<Kfk_Logger> {
  return withFields(std::move(base), {{"component", "kafka-admin"},
                                      {"kafka_broker", std::string{brokers}}});
}

void logRecordReceived(Kfk_Logger &logger, const Kfk_ConsumedRecord &record) {
  Kfk_LogFields fields{{"kafka_topic", record.topic},
                       {"kafka_partition", std::to_string(record.partition)},
                       {"kafka_offset", std::to_string(record.offset)},
                       {"kafka_key", record.key.value_or("")}};

  for (const auto &header : record.headers) {
    fields.emplace_back("header_" + toLower(header.key), header.value);
  }

  logger.debug("kafka record received", fields);
}

void logRecordSent(Kfk_Logger &logger, const Kfk_ProduceResult &result) {
  Kfk_LogFields fields{{"kafka_topic", result.topic},
                       {"kafka_partition", std::to_string(result.partition)},
                       {"kafka_offset", std::to_string(result.offset)},
                       {"kafka_key", result.record.key.value_or("")}};

  if (result.err) {
    fields.emplace_back("error", result.err.message());
    logger.error("failed to produce record", fields);
  } else {
    logger.debug("kafka record sent", fields);
  }
}

void logBatchReceived(Kfk_Logger &logger, const Kfk_Batch &batch) {
  logger.debug("kafka batch received",
               {{"kafka_topic", batch.topic},
                {"kafka_partition", std::to_string(batch.partition)},
                {"recordCount", std::to_string(batch.records.size())},
                {"firstOffset", std::to_string(batch.firstOffset())},
                {"lastOffset", std::to_string(batch.lastOffset())}});
}

auto fromSyslogLevel(int level) -> Kfk_LogLevel {
  if (level <= 3) {
    return Kfk_LogLevel::kError;
  } else if (level == 4) {
    return Kfk_LogLevel::kWarn;
  } else if (level <= 6) {
    return Kfk_LogLevel::kInfo;
  }

  return Kfk_LogLevel::kDebug;
}

} // namespace kfk
