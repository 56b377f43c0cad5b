/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-kafka-util.hpp
 * @brief Utility helpers around the librdkafka C API.
 *
 *  - set_config(): a type-safe wrapper around rd_kafka_conf_set() that
 *    returns a std::expected value instead of relying on an output
 *    error-string buffer.
 *  - Kfk_KafkaPtr<T>: std::unique_ptr with a deleter for every librdkafka
 *    object kfk owns (messages, events, queues, partition lists, ...).
 *  - rdkafka_category() and toErrorCode(): librdkafka error codes as
 *    std::error_code values of the "rdkafka" category.
 *  - isClosedError(): the graceful-shutdown classification used by the
 *    consume loops.
 *  - toTimeoutMs(): a std::chrono duration as the int millisecond timeout
 *    librdkafka calls take.
 */

#ifndef KFK_KAFKA_UTIL_HPP_

#define KFK_KAFKA_UTIL_HPP_

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include "rdkafka.h"

namespace kfk {

constexpr size_t kKafkaErrorStringLength = 512;

/**
 * The slice by which kfk bounds every blocking librdkafka call, so that
 * close() and context cancellation are noticed within one slice.
 */
constexpr std::chrono::milliseconds kPollSlice{100};

/**
 * @brief The method sets kafka configuration to key value.
 *
 * @param conf  The rd_kafka_conf_t object to set the configuration' key value
 * @param key   The configuration key
 * @param value The configuration value
 *
 * @return It returns the RD_KAFKA_CONF_OK if everything is ok, else a string
 *         describing the kafka error
 */
auto set_config(rd_kafka_conf_t *conf, std::string_view key,
                std::string_view value)
    -> std::expected<rd_kafka_conf_res_t, std::string>;

struct Kfk_KafkaDeleter {
  void operator()(rd_kafka_conf_t *p) const noexcept { rd_kafka_conf_destroy(p); }
  void operator()(rd_kafka_error_t *p) const noexcept {
    rd_kafka_error_destroy(p);
  }
  void operator()(rd_kafka_message_t *p) const noexcept {
    rd_kafka_message_destroy(p);
  }
  void operator()(rd_kafka_event_t *p) const noexcept {
    rd_kafka_event_destroy(p);
  }
  void operator()(rd_kafka_queue_t *p) const noexcept {
    rd_kafka_queue_destroy(p);
  }
  void operator()(rd_kafka_headers_t *p) const noexcept {
    rd_kafka_headers_destroy(p);
  }
  void operator()(rd_kafka_topic_partition_list_t *p) const noexcept {
    rd_kafka_topic_partition_list_destroy(p);
  }
  void operator()(const rd_kafka_metadata_t *p) const noexcept {
    rd_kafka_metadata_destroy(p);
  }
  void operator()(rd_kafka_AdminOptions_t *p) const noexcept {
    rd_kafka_AdminOptions_destroy(p);
  }
  void operator()(rd_kafka_NewTopic_t *p) const noexcept {
    rd_kafka_NewTopic_destroy(p);
  }
  void operator()(rd_kafka_DeleteTopic_t *p) const noexcept {
    rd_kafka_DeleteTopic_destroy(p);
  }
  void operator()(rd_kafka_DeleteGroup_t *p) const noexcept {
    rd_kafka_DeleteGroup_destroy(p);
  }
}; // struct Kfk_KafkaDeleter

template <typename T> using Kfk_KafkaPtr = std::unique_ptr<T, Kfk_KafkaDeleter>;

/**
 * @brief The error category of rd_kafka_resp_err_t values, its name() is
 *        "rdkafka" and messages come from rd_kafka_err2str().
 */
auto rdkafka_category() noexcept -> const std::error_category &;

/**
 * @brief Convert a librdkafka response code, RD_KAFKA_RESP_ERR_NO_ERROR maps
 *        to an empty error_code.
 */
auto toErrorCode(rd_kafka_resp_err_t err) noexcept -> std::error_code;

/**
 * @brief Convert a librdkafka error object (not consumed), nullptr maps to
 *        an empty error_code.
 */
auto toErrorCode(const rd_kafka_error_t *error) noexcept -> std::error_code;

/**
 * @brief True if ec (or the free-form detail text reported alongside it)
 *        denotes a graceful end of the connection: end of stream, a closed
 *        pipe or connection, a cancelled context, a closed client, or text
 *        containing "use of closed network connection", "broken pipe",
 *        "connection reset by peer" or "client closed".
 */
auto isClosedError(const std::error_code &ec, std::string_view detail = {})
    -> bool;

template <class Rep, class Period>
auto toTimeoutMs(const std::chrono::duration<Rep, Period> &duration) -> int {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(duration);

  return ms.count() < 0 ? 0 : static_cast<int>(ms.count());
}

} // namespace kfk

#endif // KFK_KAFKA_UTIL_HPP_
