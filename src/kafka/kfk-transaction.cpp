/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-transaction.cpp
 * @brief Implementation of the kfk transactional session.
 */

#include "kafka/kfk-transaction.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "rdkafka.h"

#include "kafka/kfk-kafka-util.hpp"
#include "kafka/kfk-message.hpp"
#include "kafka/kfk-producer.hpp"
#include "kfk-context.hpp"
#include "kfk-error.hpp"
#include "kfk-log.hpp"

namespace kfk {

Kfk_Transaction::Kfk_Transaction(std::shared_ptr<Kfk_TransactionScope> scope,
                                 Kfk_Context::Ptr ctx,
                                 std::shared_ptr<Kfk_Logger> logger,
                                 std::string transactionalId,
                                 std::chrono::milliseconds requestTimeout)
    : m_scope{std::move(scope)}, m_ctx{std::move(ctx)},
      m_logger{std::move(logger)},
      m_transactional_id{std::move(transactionalId)},
      m_request_timeout{requestTimeout} {
  std::unique_lock lock{m_scope->m_mutex};

  m_scope->m_live.insert(this);
}

Kfk_Transaction::~Kfk_Transaction() noexcept try {
  std::unique_lock lock{m_scope->m_mutex};

  m_scope->m_live.erase(this);

  if (auto ec = abortWith(m_scope->m_producer); ec) {
    m_logger->warn("failed to abort unfinished kafka transaction",
                   {{"transactional_id", m_transactional_id},
                    {"error", ec.message()}});
  }
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Kfk_Transaction::produce(const Kfk_Record &record) -> std::error_code {
  std::unique_lock lock{m_mutex};

  if (m_finished || m_aborted) {
    return Kfk_Errc::kTransactionAborted;
  }

  m_buffered.push_back(record);

  return {};
}

auto Kfk_Transaction::produceMany(const std::vector<Kfk_Record> &records)
    -> std::error_code {
  std::unique_lock lock{m_mutex};

  if (m_finished || m_aborted) {
    return Kfk_Errc::kTransactionAborted;
  }

  m_buffered.insert(m_buffered.end(), records.begin(), records.end());

  return {};
}

auto Kfk_Transaction::commit() -> std::error_code {
  std::unique_lock scopeLock{m_scope->m_mutex};
  std::vector<Kfk_Record> records{};

  {
    std::unique_lock lock{m_mutex};

    if (m_finished || m_aborted) {
      return Kfk_Errc::kTransactionAborted;
    }

    m_finished = true;
    records = std::move(m_buffered);
    m_buffered.clear();
  }

  auto markAborted = [this]() -> void {
    std::unique_lock lock{m_mutex};
    m_aborted = true;
  };

  auto *producer = m_scope->m_producer;
  if (nullptr == producer) {
    markAborted();

    return Kfk_Errc::kClientClosed;
  }

  auto client = producer->snapshot();
  if (!client) {
    markAborted();

    return client.error();
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    markAborted();

    return Kfk_Errc::kClientClosed;
  }

  auto results = producer->produceWith(*lease, m_ctx, records);

  for (const auto &result : results) {
    if (!result.err) {
      continue;
    }

    markAborted();

    m_logger->error("kafka transaction record failed, aborting",
                    {{"transactional_id", m_transactional_id},
                     {"kafka_topic", result.topic},
                     {"kafka_partition", std::to_string(result.partition)},
                     {"error", result.err.message()}});

    if (auto ec = rollback(lease->handle()); ec) {
      m_logger->error("failed to abort kafka transaction",
                      {{"transactional_id", m_transactional_id},
                       {"error", ec.message()}});
    }

    return result.err;
  }

  return commitWith(lease->handle(), records.size());
}

auto Kfk_Transaction::commitWith(rd_kafka_t *handle, std::size_t recordCount)
    -> std::error_code {
  using Clock = std::chrono::steady_clock;

  auto timeout = m_ctx->remaining(m_request_timeout);
  Clock::time_point retryUntil{};

  while (true) {
    Kfk_KafkaPtr<rd_kafka_error_t> error{
        rd_kafka_commit_transaction(handle, toTimeoutMs(timeout))};
    if (!error) {
      break;
    }

    auto ec = toErrorCode(error.get());

    // a retriable failure leaves the commit pending in librdkafka, it is
    // finished by calling commit again
    if (rd_kafka_error_is_retriable(error.get())) {
      auto now = Clock::now();
      if (Clock::time_point{} == retryUntil) {
        retryUntil = now + m_request_timeout;
      }

      if (now < retryUntil) {
        m_logger->warn("retrying kafka transaction commit",
                       {{"transactional_id", m_transactional_id},
                        {"error", rd_kafka_error_string(error.get())}});

        timeout = retryUntil - now;

        continue;
      }
    }

    m_logger->error("failed to commit kafka transaction",
                    {{"transactional_id", m_transactional_id},
                     {"error", rd_kafka_error_string(error.get())}});

    {
      std::unique_lock lock{m_mutex};
      m_aborted = true;
    }

    if (rd_kafka_error_is_fatal(error.get())) {
      return ec;
    }

    if (auto abortEc = rollback(handle); abortEc) {
      m_logger->error("failed to abort kafka transaction",
                      {{"transactional_id", m_transactional_id},
                       {"error", abortEc.message()}});
    }

    return ec;
  }

  m_logger->info("kafka transaction committed",
                 {{"transactional_id", m_transactional_id},
                  {"recordCount", std::to_string(recordCount)}});

  return {};
}

auto Kfk_Transaction::abort() -> std::error_code {
  std::unique_lock scopeLock{m_scope->m_mutex};

  return abortWith(m_scope->m_producer);
}

auto Kfk_Transaction::abortWith(Kfk_Producer *producer) -> std::error_code {
  {
    std::unique_lock lock{m_mutex};

    if (m_finished) {
      return {};
    }

    m_aborted = true;
    m_finished = true;
    m_buffered.clear();
  }

  if (nullptr == producer) {
    return Kfk_Errc::kClientClosed;
  }

  auto client = producer->snapshot();
  if (!client) {
    return client.error();
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    return Kfk_Errc::kClientClosed;
  }

  return rollback(lease->handle());
}

auto Kfk_Transaction::rollback(rd_kafka_t *handle) -> std::error_code {
  auto err = rd_kafka_purge(handle, RD_KAFKA_PURGE_F_QUEUE);
  if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
    m_logger->warn("failed to purge kafka transaction records",
                   {{"transactional_id", m_transactional_id},
                    {"error", rd_kafka_err2str(err)}});
  }

  Kfk_KafkaPtr<rd_kafka_error_t> error{
      rd_kafka_abort_transaction(handle, toTimeoutMs(m_request_timeout))};
  if (error) {
    return toErrorCode(error.get());
  }

  m_logger->info("kafka transaction aborted",
                 {{"transactional_id", m_transactional_id}});

  return {};
}

auto Kfk_Transaction::isAborted() const -> bool {
  std::unique_lock lock{m_mutex};

  return m_aborted;
}

auto Kfk_Transaction::recordCount() const -> std::size_t {
  std::unique_lock lock{m_mutex};

  return m_buffered.size();
}

} // namespace kfk
