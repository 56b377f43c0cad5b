/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-kafka-log.hpp
 * @brief Kafka specific logging helpers on top of Kfk_Logger.
 *
 * The component loggers tag every entry of a facade, e.g. a producer of
 * topic "orders" logs with component=kafka-producer kafka_topic=orders.
 * The record helpers log one record or batch at debug level with its
 * coordinates, so they are cheap to leave in a hot loop.
 */

#ifndef KFK_KAFKA_LOG_HPP_

#define KFK_KAFKA_LOG_HPP_

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "kafka/kfk-message.hpp"
#include "kfk-log.hpp"

namespace kfk {

auto producerLogger(std::shared_ptr<Kfk_Logger> base, std::string_view topic)
    -> std::shared_ptr<Kfk_Logger>;

auto consumerLogger(std::shared_ptr<Kfk_Logger> base,
                    const std::vector<std::string> &topics,
                    std::string_view group) -> std::shared_ptr<Kfk_Logger>;

auto adminLogger(std::shared_ptr<Kfk_Logger> base, std::string_view brokers)
    -> std::shared_ptr<Kfk_Logger>;

/**
 * @brief Log a consumed record with its topic, partition, offset, key and
 *        one header_<lowercased key> field per header.
 */
void logRecordReceived(Kfk_Logger &logger, const Kfk_ConsumedRecord &record);

/**
 * @brief Log a produce result, at error level if it failed.
 */
void logRecordSent(Kfk_Logger &logger, const Kfk_ProduceResult &result);

void logBatchReceived(Kfk_Logger &logger, const Kfk_Batch &batch);

/**
 * @brief Map a syslog severity reported by librdkafka's log_cb (0 emergency
 *        to 7 debug) onto a Kfk_LogLevel.
 */
auto fromSyslogLevel(int level) -> Kfk_LogLevel;

} // namespace kfk

#endif // KFK_KAFKA_LOG_HPP_
