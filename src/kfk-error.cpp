/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-error.cpp
 * @brief The error category implementation of Kfk_Errc.
 */

#include "kfk-error.hpp"

#include <string>
#include <system_error>

namespace kfk {

namespace {

class Kfk_ErrorCategory : public std::error_category {
public:
  auto name() const noexcept -> const char * override { return "kfk"; }

  auto message(int ev) const -> std::string override {
    switch (static_cast<Kfk_Errc>(ev)) {
    case Kfk_Errc::kOk:
      return "success";
    case Kfk_Errc::kNilConfig:
      return "config is nil";
    case Kfk_Errc::kMissingBrokers:
      return "brokers address is required";
    case Kfk_Errc::kMissingTopic:
      return "topic is required";
    case Kfk_Errc::kMissingGroup:
      return "consumer group is required for group consumption";
    case Kfk_Errc::kInvalidAuthType:
      return "invalid authentication type";
    case Kfk_Errc::kInvalidAcks:
      return "invalid acks value";
    case Kfk_Errc::kInvalidCompression:
      return "invalid compression type";
    case Kfk_Errc::kInvalidOffset:
      return "invalid start offset value";
    case Kfk_Errc::kInvalidIsolation:
      return "invalid isolation level";
    case Kfk_Errc::kMissingAwsRegion:
      return "AWS region is required for MSK IAM authentication";
    case Kfk_Errc::kMissingOAuthTokenUrl:
      return "OAuth token URL is required for OAuth authentication";
    case Kfk_Errc::kMissingTokenProvider:
      return "token provider is required for MSK IAM authentication";
    case Kfk_Errc::kConfiguration:
      return "invalid client configuration";
    case Kfk_Errc::kCredential:
      return "failed to read credential";
    case Kfk_Errc::kClientClosed:
      return "client is closed";
    case Kfk_Errc::kNilHandler:
      return "handler function is nil";
    case Kfk_Errc::kNilContext:
      return "context is nil";
    case Kfk_Errc::kTransactionAborted:
      return "transaction was aborted";
    case Kfk_Errc::kNoTransactionalId:
      return "transactional ID required for transactions";
    case Kfk_Errc::kContextCanceled:
      return "context canceled";
    case Kfk_Errc::kDeadlineExceeded:
      return "context deadline exceeded";
    case Kfk_Errc::kEndOfStream:
      return "end of stream";
    case Kfk_Errc::kChannelClosed:
      return "channel is closed";
    case Kfk_Errc::kMarshal:
      return "failed to marshal message to JSON";
    }

    return "unknown kfk error " + std::to_string(ev);
  }

  auto default_error_condition(int ev) const noexcept
      -> std::error_condition override {
    switch (static_cast<Kfk_Errc>(ev)) {
    case Kfk_Errc::kDeadlineExceeded:
      return std::errc::timed_out;
    case Kfk_Errc::kContextCanceled:
      return std::errc::operation_canceled;
    default:
      return {ev, *this};
    }
  }
}; // class Kfk_ErrorCategory

} // namespace

auto kfk_category() noexcept -> const std::error_category & {
  static const Kfk_ErrorCategory category{};

  return category;
}

auto make_error_code(Kfk_Errc errc) noexcept -> std::error_code {
  return {static_cast<int>(errc), kfk_category()};
}

} // namespace kfk
