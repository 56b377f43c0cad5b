/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-kafka-util.cpp
 * @brief Implementation of the librdkafka helpers.
 */

#include "kafka/kfk-kafka-util.hpp"

#include <array>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

#include "rdkafka.h"

#include "kfk-error.hpp"

namespace kfk {

namespace {

class Kfk_RdKafkaCategory : public std::error_category {
public:
  auto name() const noexcept -> const char * override { return "rdkafka"; }

  auto message(int ev) const -> std::string override {
    return rd_kafka_err2str(static_cast<rd_kafka_resp_err_t>(ev));
  }

  auto default_error_condition(int ev) const noexcept
      -> std::error_condition override {
    switch (static_cast<rd_kafka_resp_err_t>(ev)) {
    case RD_KAFKA_RESP_ERR__TIMED_OUT:
    case RD_KAFKA_RESP_ERR_REQUEST_TIMED_OUT:
      return std::errc::timed_out;
    case RD_KAFKA_RESP_ERR__TRANSPORT:
      return std::errc::connection_reset;
    default:
      return {ev, *this};
    }
  }
}; // class Kfk_RdKafkaCategory

constexpr std::array<std::string_view, 4> kClosedErrorPatterns{
    "use of closed network connection", "broken pipe",
    "connection reset by peer", "client closed"};

auto containsClosedPattern(std::string_view text) -> bool {
  for (auto pattern : kClosedErrorPatterns) {
    if (text.find(pattern) != std::string_view::npos) {
      return true;
    }
  }

  return false;
}

} // namespace

auto set_config(rd_kafka_conf_t *config, std::string_view key,
                std::string_view value)
    -> std::expected<rd_kafka_conf_res_t, std::string> {
  char err_str[kKafkaErrorStringLength]{};

  if (nullptr == config) {
    return std::unexpected(std::string{"config parameter must not be nullptr"});
  }

  // string_view is not guaranteed to be NUL terminated
  const std::string key_str{key};
  const std::string value_str{value};

  auto res = rd_kafka_conf_set(config, key_str.c_str(), value_str.c_str(),
                               err_str, sizeof(err_str));
  if (RD_KAFKA_CONF_OK != res) {
    std::string unexpected_err_str{err_str};

    return std::unexpected(unexpected_err_str);
  }

  return res;
}

auto rdkafka_category() noexcept -> const std::error_category & {
  static const Kfk_RdKafkaCategory category{};

  return category;
}

auto toErrorCode(rd_kafka_resp_err_t err) noexcept -> std::error_code {
  if (RD_KAFKA_RESP_ERR_NO_ERROR == err) {
    return {};
  }

  return {static_cast<int>(err), rdkafka_category()};
}

auto toErrorCode(const rd_kafka_error_t *error) noexcept -> std::error_code {
  if (nullptr == error) {
    return {};
  }

  return toErrorCode(rd_kafka_error_code(error));
}

auto isClosedError(const std::error_code &ec, std::string_view detail)
    -> bool {
  if (!ec) {
    return false;
  }

  if (ec == Kfk_Errc::kEndOfStream || ec == Kfk_Errc::kContextCanceled ||
      ec == Kfk_Errc::kClientClosed) {
    return true;
  }

  if (ec == std::errc::broken_pipe || ec == std::errc::connection_aborted ||
      ec == std::errc::not_connected) {
    return true;
  }

  if (ec.category() == rdkafka_category() &&
      RD_KAFKA_RESP_ERR__DESTROY == ec.value()) {
    return true;
  }

  return containsClosedPattern(ec.message()) || containsClosedPattern(detail);
}

} // namespace kfk
