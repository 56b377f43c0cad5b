/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-error.hpp
 * @brief The error vocabulary of the kfk client facade.
 *
 * Every fallible kfk operation reports failure through std::error_code,
 * either directly (status-only operations) or as the error alternative of a
 * std::expected<T, std::error_code>. Kfk_Errc lists the conditions raised by
 * the facade itself, the codes surfaced by librdkafka live in the "rdkafka"
 * category declared in kafka/kfk-kafka-util.hpp.
 *
 * Kfk_Errc is registered with std::is_error_code_enum so that a Kfk_Errc
 * value converts implicitly into a std::error_code and compares equal to a
 * code of the "kfk" category:
 *
 *   std::error_code ec = consumer->poll(ctx).error();
 *   if (ec == kfk::Kfk_Errc::kClientClosed) { ... }
 */

#ifndef KFK_ERROR_HPP_
#define KFK_ERROR_HPP_

#include <string>
#include <system_error>
#include <type_traits>

namespace kfk {

enum class Kfk_Errc {
  kOk = 0,

  // configuration
  kNilConfig,
  kMissingBrokers,
  kMissingTopic,
  kMissingGroup,
  kInvalidAuthType,
  kInvalidAcks,
  kInvalidCompression,
  kInvalidOffset,
  kInvalidIsolation,
  kMissingAwsRegion,
  kMissingOAuthTokenUrl,
  kMissingTokenProvider,
  kConfiguration,
  kCredential,

  // preconditions
  kClientClosed,
  kNilHandler,
  kNilContext,

  // transactions
  kTransactionAborted,
  kNoTransactionalId,

  // cancellation and streams
  kContextCanceled,
  kDeadlineExceeded,
  kEndOfStream,
  kChannelClosed,

  // payloads
  kMarshal,
}; // enum class Kfk_Errc

/**
 * @brief The singleton error category of Kfk_Errc, its name() is "kfk".
 */
auto kfk_category() noexcept -> const std::error_category &;

auto make_error_code(Kfk_Errc errc) noexcept -> std::error_code;

} // namespace kfk

namespace std {

template <> struct is_error_code_enum<kfk::Kfk_Errc> : true_type {};

} // namespace std

#endif // KFK_ERROR_HPP_
