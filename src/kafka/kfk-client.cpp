/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-client.cpp
 * @brief Implementation of the shared librdkafka handle owner.
 */

#include "kafka/kfk-client.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "rdkafka.h"

#include "kafka/kfk-config.hpp"
#include "kafka/kfk-kafka-log.hpp"
#include "kafka/kfk-kafka-util.hpp"
#include "kfk-context.hpp"
#include "kfk-debug.hpp"
#include "kfk-error.hpp"
#include "kfk-log.hpp"
#include "kfk-util.hpp"

namespace kfk {

namespace {

void logCallback(const rd_kafka_t *rk, int level, const char *facility,
                 const char *buf) {
  auto *opaque = static_cast<Kfk_ClientOpaque *>(rd_kafka_opaque(rk));
  if (nullptr == opaque || !opaque->logger) {
    return;
  }

  opaque->logger->log(fromSyslogLevel(level), buf,
                      {{"facility", nullptr == facility ? "" : facility},
                       {"client", rd_kafka_name(rk)}});
}

void errorCallback(rd_kafka_t *rk, int err, const char *reason,
                   void *opaqueArg) {
  auto *opaque = static_cast<Kfk_ClientOpaque *>(opaqueArg);
  if (nullptr == opaque || !opaque->logger) {
    return;
  }

  auto ec = static_cast<rd_kafka_resp_err_t>(err);

  // the broker transport errors librdkafka retries are not worth an error
  auto level = (RD_KAFKA_RESP_ERR__TRANSPORT == ec ||
                RD_KAFKA_RESP_ERR__ALL_BROKERS_DOWN == ec)
                   ? Kfk_LogLevel::kWarn
                   : Kfk_LogLevel::kError;

  opaque->logger->log(level, "kafka client error",
                      {{"error", rd_kafka_err2name(ec)},
                       {"reason", nullptr == reason ? "" : reason},
                       {"client", rd_kafka_name(rk)}});
}

void oauthRefreshCallback(rd_kafka_t *rk, const char *oauthbearerConfig,
                          void *opaqueArg) {
  auto *opaque = static_cast<Kfk_ClientOpaque *>(opaqueArg);
  if (nullptr == opaque || !opaque->tokenProvider) {
    rd_kafka_oauthbearer_set_token_failure(rk, "no token provider");

    return;
  }

  auto token = opaque->tokenProvider();
  if (!token) {
    if (opaque->logger) {
      opaque->logger->error("failed to fetch oauth token",
                            {{"error", token.error()}});
    }

    rd_kafka_oauthbearer_set_token_failure(rk, token.error().c_str());

    return;
  }

  auto lifetimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                        token->expiry.time_since_epoch())
                        .count();
  char errstr[kKafkaErrorStringLength]{};

  auto err = rd_kafka_oauthbearer_set_token(
      rk, token->value.c_str(), lifetimeMs, token->principal.c_str(), nullptr,
      0, errstr, sizeof(errstr));
  if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
    if (opaque->logger) {
      opaque->logger->error("failed to set oauth token", {{"error", errstr}});
    }

    rd_kafka_oauthbearer_set_token_failure(rk, errstr);
  }

  secureZero(token->value);
}

} // namespace

Kfk_Lease::Kfk_Lease(Kfk_Client *client) : m_client{client} {}

Kfk_Lease::Kfk_Lease(Kfk_Lease &&obj) noexcept : m_client{obj.m_client} {
  obj.m_client = nullptr;
}

Kfk_Lease::~Kfk_Lease() noexcept try {
  if (nullptr != m_client) {
    m_client->release();
  }
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Kfk_Lease::handle() const -> rd_kafka_t * { return m_client->m_handle; }

auto Kfk_Lease::isClosing() const -> bool { return m_client->isClosing(); }

Kfk_Client::Kfk_Client(std::string_view name, rd_kafka_t *handle,
                       std::unique_ptr<Kfk_ClientOpaque> opaque)
    : m_name{name}, m_handle{handle}, m_opaque{std::move(opaque)} {}

Kfk_Client::~Kfk_Client() noexcept try {
  close();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Kfk_Client::acquire() -> std::optional<Kfk_Lease> {
  std::unique_lock lock{m_mutex};

  if (m_closing) {
    return std::nullopt;
  }

  m_in_flight++;

  return Kfk_Lease{this};
}

void Kfk_Client::release() {
  std::unique_lock lock{m_mutex};

  m_in_flight--;
  if (0 == m_in_flight) {
    m_cond.notify_all();
  }
}

auto Kfk_Client::isClosing() const -> bool {
  std::unique_lock lock{m_mutex};

  return m_closing;
}

auto Kfk_Client::name() const -> const std::string & { return m_name; }

void Kfk_Client::close(const ShutdownFn &shutdown) {
  rd_kafka_t *handle{};

  {
    std::unique_lock lock{m_mutex};

    if (m_closing) {
      return;
    }

    m_closing = true;
    m_cond.wait(lock, [this] { return 0 == m_in_flight; });

    handle = m_handle;
    m_handle = nullptr;
  }

  if (nullptr == handle) {
    return;
  }

  KFK_DEBUG_PRINT(std::cerr << "closing kafka client: " << m_name << '\n');

  if (shutdown) {
    shutdown(handle);
  }

  rd_kafka_destroy(handle);
}

auto createKafkaHandle(rd_kafka_type_t type, Kfk_KafkaPtr<rd_kafka_conf_t> &conf,
                       Kfk_ClientOpaque *opaque, Kfk_Logger &logger)
    -> std::expected<rd_kafka_t *, std::error_code> {
  rd_kafka_conf_set_opaque(conf.get(), opaque);
  rd_kafka_conf_set_log_cb(conf.get(), logCallback);
  rd_kafka_conf_set_error_cb(conf.get(), errorCallback);

  if (opaque->tokenProvider) {
    rd_kafka_conf_set_oauthbearer_token_refresh_cb(conf.get(),
                                                   oauthRefreshCallback);
    rd_kafka_conf_enable_sasl_queue(conf.get(), 1);
  }

  char errstr[kKafkaErrorStringLength]{};

  auto *handle = rd_kafka_new(type, conf.get(), errstr, sizeof(errstr));
  if (nullptr == handle) {
    logger.error("failed to create kafka client", {{"error", errstr}});

    return std::unexpected(make_error_code(Kfk_Errc::kConfiguration));
  }

  // rd_kafka_new() owns conf from here on
  static_cast<void>(conf.release());

  if (opaque->tokenProvider) {
    Kfk_KafkaPtr<rd_kafka_error_t> error{
        rd_kafka_sasl_background_callbacks_enable(handle)};
    if (error) {
      logger.error("failed to enable oauth token refresh",
                   {{"error", rd_kafka_error_string(error.get())}});
      rd_kafka_destroy(handle);

      return std::unexpected(make_error_code(Kfk_Errc::kConfiguration));
    }
  }

  return handle;
}

auto awaitEvent(const Kfk_Lease &lease, rd_kafka_queue_t *queue,
                const Kfk_Context::Ptr &ctx)
    -> std::expected<Kfk_KafkaPtr<rd_kafka_event_t>, std::error_code> {
  while (true) {
    if (auto ec = ctx->err(); ec) {
      return std::unexpected(ec);
    }

    if (lease.isClosing()) {
      return std::unexpected(make_error_code(Kfk_Errc::kClientClosed));
    }

    auto slice = ctx->remaining(kPollSlice);

    Kfk_KafkaPtr<rd_kafka_event_t> event{
        rd_kafka_queue_poll(queue, toTimeoutMs(slice))};
    if (event) {
      return event;
    }
  }
}

} // namespace kfk
