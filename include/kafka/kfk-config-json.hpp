/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-config-json.hpp
 * @brief JSON load and dump of the kfk client configs.
 *
 * The JSON layout is defined by proto/kfk-config.proto and parsed with the
 * protobuf JSON utilities, e.g.
 *
 *   {
 *     "base": {"brokers": "b1:9092,b2:9092", "requestTimeout": "10s"},
 *     "defaultTopic": "orders",
 *     "acks": "all"
 *   }
 *
 * Fields absent from the JSON keep the defaults of the C++ config structs.
 * Unknown fields and malformed values fail with Kfk_Errc::kConfiguration.
 * Loading does not validate, call validate() on the result. Dumping never
 * writes a literal password, only environment variable and file references.
 */

#ifndef KFK_CONFIG_JSON_HPP_
#define KFK_CONFIG_JSON_HPP_

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

#include "kafka/kfk-config.hpp"

namespace kfk {

auto loadProducerConfigJson(std::string_view json)
    -> std::expected<Kfk_ProducerConfig, std::error_code>;

auto loadConsumerConfigJson(std::string_view json)
    -> std::expected<Kfk_ConsumerConfig, std::error_code>;

auto loadAdminConfigJson(std::string_view json)
    -> std::expected<Kfk_AdminConfig, std::error_code>;

auto dumpConfigJson(const Kfk_ProducerConfig &config)
    -> std::expected<std::string, std::error_code>;

auto dumpConfigJson(const Kfk_ConsumerConfig &config)
    -> std::expected<std::string, std::error_code>;

auto dumpConfigJson(const Kfk_AdminConfig &config)
    -> std::expected<std::string, std::error_code>;

} // namespace kfk

#endif // KFK_CONFIG_JSON_HPP_
