/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-transaction.hpp
 * @brief A transactional session of a Kfk_Producer.
 *
 * A Kfk_Transaction is returned by Kfk_Producer::beginTransaction() and
 * buffers records until commit(), which produces the whole buffer under the
 * librdkafka transaction and commits it, so read-committed consumers see
 * all of the records or none of them. If any record fails, the transaction
 * is aborted and that record's error is returned.
 *
 * Exactly one of commit() and abort() completes a transaction:
 *  - produce() / produceMany() after completion fail with
 *    Kfk_Errc::kTransactionAborted;
 *  - commit() after completion fails with Kfk_Errc::kTransactionAborted;
 *  - abort() after completion is a no-op returning success.
 *
 * Destroying an unfinished transaction aborts it. Closing or destroying the
 * producer aborts the transactions it still has open, a transaction that
 * outlives its producer only reports itself aborted. Kfk_Producer::transact()
 * scopes a transaction to one call:
 *
 *   auto ec = producer->transact(ctx, [&](kfk::Kfk_Transaction &txn) {
 *     return txn.produceMany({r1, r2});
 *   });
 */

#ifndef KFK_TRANSACTION_HPP_

#define KFK_TRANSACTION_HPP_

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "rdkafka.h"

#include "kafka/kfk-message.hpp"
#include "kfk-context.hpp"
#include "kfk-log.hpp"

namespace kfk {

class Kfk_Producer;
class Kfk_Transaction;

/**
 * Links a producer with its open transactions. The producer clears
 * m_producer on close, a transaction holds m_mutex while it reaches into
 * the producer.
 */
struct Kfk_TransactionScope {
  std::mutex m_mutex{};
  Kfk_Producer *m_producer{};
  std::set<Kfk_Transaction *> m_live{};
};

class Kfk_Transaction {
  friend class Kfk_Producer;

public:
  ~Kfk_Transaction() noexcept;

  Kfk_Transaction(const Kfk_Transaction &obj) = delete;
  const Kfk_Transaction &operator=(const Kfk_Transaction &obj) = delete;
  Kfk_Transaction(Kfk_Transaction &&obj) = delete;
  Kfk_Transaction &operator=(Kfk_Transaction &&obj) = delete;

  auto produce(const Kfk_Record &record) -> std::error_code;

  auto produceMany(const std::vector<Kfk_Record> &records) -> std::error_code;

  auto commit() -> std::error_code;

  auto abort() -> std::error_code;

  auto isAborted() const -> bool;

  auto recordCount() const -> std::size_t;

private:
  Kfk_Transaction(std::shared_ptr<Kfk_TransactionScope> scope,
                  Kfk_Context::Ptr ctx, std::shared_ptr<Kfk_Logger> logger,
                  std::string transactionalId,
                  std::chrono::milliseconds requestTimeout);

  /**
   * @brief Abort through producer, the scope mutex must be held.
   */
  auto abortWith(Kfk_Producer *producer) -> std::error_code;

  /**
   * @brief Commit the librdkafka transaction, retrying retriable failures
   *        for up to the request timeout and aborting what can not commit.
   */
  auto commitWith(rd_kafka_t *handle, std::size_t recordCount)
      -> std::error_code;

  /**
   * @brief Drop what librdkafka still queues and abort the transaction.
   */
  auto rollback(rd_kafka_t *handle) -> std::error_code;

  /**
   * data members for constructor to instantiate the object.
   */
  const std::shared_ptr<Kfk_TransactionScope> m_scope{};
  const Kfk_Context::Ptr m_ctx{};
  const std::shared_ptr<Kfk_Logger> m_logger{};
  const std::string m_transactional_id{};
  const std::chrono::milliseconds m_request_timeout{};

  /**
   * data members for internal logic.
   */
  mutable std::mutex m_mutex{};
  std::vector<Kfk_Record> m_buffered{};
  bool m_aborted{};
  bool m_finished{};
}; // class Kfk_Transaction

} // namespace kfk

#endif // KFK_TRANSACTION_HPP_
