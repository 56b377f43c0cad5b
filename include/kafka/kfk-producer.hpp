/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-producer.hpp
 * @brief The kfk Kafka producer facade.
 *
 * Kfk_Producer owns one librdkafka producer handle and offers:
 *  - produce(): synchronous, waits for the broker acknowledgement of every
 *    record and returns one Kfk_ProduceResult per record, in order.
 *    Per-record failures are reported inside the results, only
 *    preconditions and enqueue-level failures fail the call.
 *  - produceAsync(): enqueues one record and invokes the callback exactly
 *    once with its result, on the producer's callback executor thread and
 *    never under an internal lock.
 *  - produceJson() / produceJsonAsync(): produce the protobuf JSON form of
 *    a message, a marshal failure (Kfk_Errc::kMarshal) never reaches the
 *    network.
 *  - flush(), the transactional API (beginTransaction(), transact(),
 *    transactRecords(), see kfk-transaction.hpp), close() and
 *    isConnected().
 *
 * Example:
 *
 *   kfk::Kfk_ProducerConfig config{};
 *   config.brokers = "localhost:9092";
 *   config.defaultTopic = "orders";
 *
 *   auto producer = kfk::Kfk_Producer::create(&config, logger);
 *   auto ctx = kfk::Kfk_Context::withTimeout(kfk::Kfk_Context::background(),
 *                                            std::chrono::seconds(10));
 *   auto results = (*producer)->produce(ctx, {kfk::Kfk_Record::of("hello")});
 *
 * The producer is safe to use from many threads. A std::shared_mutex guards
 * the closed flag and the Kfk_Client pointer, operations only snapshot the
 * pointer under it. close() flushes (bounded by the request timeout), purges
 * what is left so every pending callback still runs once, and releases the
 * handle. close() and the destructor may run inside a produce callback,
 * the callbacks queued behind it then run after it returns.
 */

#ifndef KFK_PRODUCER_HPP_

#define KFK_PRODUCER_HPP_

#include <google/protobuf/message.h>

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "rdkafka.h"

#include "kafka/kfk-client.hpp"
#include "kafka/kfk-config.hpp"
#include "kafka/kfk-message.hpp"
#include "kfk-async.hpp"
#include "kfk-context.hpp"
#include "kfk-log.hpp"
#include "kfk-proc.hpp"

namespace kfk {

class Kfk_Transaction;
struct Kfk_TransactionScope;

class Kfk_Producer {
  friend class Kfk_Transaction;

public:
  using Callback = std::function<void(const Kfk_ProduceResult &result)>;
  using TransactFn = std::function<std::error_code(Kfk_Transaction &txn)>;

  /**
   * @brief Create and connect a producer. A null config means the default
   *        Kfk_ProducerConfig, which fails validation for lack of brokers.
   *        When a transactional id is configured the transactions are
   *        initialized here.
   *
   * @param config The producer configuration
   * @param logger The logger, a null logger discards everything
   */
  static auto create(const Kfk_ProducerConfig *config,
                     std::shared_ptr<Kfk_Logger> logger = {})
      -> std::expected<std::unique_ptr<Kfk_Producer>, std::error_code>;

  ~Kfk_Producer() noexcept;

  Kfk_Producer(const Kfk_Producer &obj) = delete;
  const Kfk_Producer &operator=(const Kfk_Producer &obj) = delete;
  Kfk_Producer(Kfk_Producer &&obj) = delete;
  Kfk_Producer &operator=(Kfk_Producer &&obj) = delete;

  auto produce(const Kfk_Context::Ptr &ctx,
               const std::vector<Kfk_Record> &records)
      -> std::expected<std::vector<Kfk_ProduceResult>, std::error_code>;

  /**
   * @brief Enqueue one record. The callback gets the result exactly once,
   *        including precondition failures (null ctx, closed producer) and
   *        enqueue failures. An empty callback is allowed.
   */
  void produceAsync(const Kfk_Context::Ptr &ctx, Kfk_Record record,
                    Callback callback);

  /**
   * @brief Produce the JSON form of message to topic (the default topic when
   *        empty) and return its result, a failed record is returned as the
   *        call's error.
   */
  auto produceJson(const Kfk_Context::Ptr &ctx, std::string_view topic,
                   std::optional<std::string> key,
                   const google::protobuf::Message &message)
      -> std::expected<Kfk_ProduceResult, std::error_code>;

  void produceJsonAsync(const Kfk_Context::Ptr &ctx, std::string_view topic,
                        std::optional<std::string> key,
                        const google::protobuf::Message &message,
                        Callback callback);

  /**
   * @brief Wait until every enqueued record is acknowledged, or ctx is done.
   */
  auto flush(const Kfk_Context::Ptr &ctx) -> std::error_code;

  auto beginTransaction(const Kfk_Context::Ptr &ctx)
      -> std::expected<std::unique_ptr<Kfk_Transaction>, std::error_code>;

  /**
   * @brief Run fn inside a transaction: commit when it returns success,
   *        abort and return its error otherwise. An exception thrown by fn
   *        aborts the transaction and is rethrown.
   */
  auto transact(const Kfk_Context::Ptr &ctx, const TransactFn &fn)
      -> std::error_code;

  auto transactRecords(const Kfk_Context::Ptr &ctx,
                       const std::vector<Kfk_Record> &records)
      -> std::error_code;

  void close();

  auto isConnected() const -> bool;

  auto config() const -> const Kfk_ProducerConfig &;

private:
  Kfk_Producer(Kfk_ProducerConfig config, std::shared_ptr<Kfk_Logger> logger);

  auto open() -> std::error_code;

  auto snapshot() const
      -> std::expected<std::shared_ptr<Kfk_Client>, std::error_code>;

  auto produceWith(const Kfk_Lease &lease, const Kfk_Context::Ptr &ctx,
                   const std::vector<Kfk_Record> &records)
      -> std::vector<Kfk_ProduceResult>;

  auto enqueue(const Kfk_Lease &lease, const Kfk_Context::Ptr &ctx,
               const Kfk_Record &record, void *ticket) -> std::error_code;

  auto marshalJson(std::string_view topic, std::optional<std::string> key,
                   const google::protobuf::Message &message)
      -> std::expected<Kfk_Record, std::error_code>;

  void dispatch(Callback callback, Kfk_ProduceResult result);

  void shutdown(rd_kafka_t *handle);

  void abortTransactions();

  static void deliveryReport(rd_kafka_t *handle,
                             const rd_kafka_message_t *message,
                             void *opaque);

  /**
   * data members for constructor to instantiate the object.
   */
  const Kfk_ProducerConfig m_config{};
  std::shared_ptr<Kfk_Logger> m_logger{};

  /**
   * data members for internal logic.
   */
  mutable std::shared_mutex m_mutex{};
  bool m_closed{};
  std::shared_ptr<Kfk_Client> m_client{};
  std::shared_ptr<Kfk_TransactionScope> m_transactions{};

  Kfk_Async m_callbacks;
  Kfk_Proc m_poller{"kafka-producer-poller"};
}; // class Kfk_Producer

} // namespace kfk

#endif // KFK_PRODUCER_HPP_
