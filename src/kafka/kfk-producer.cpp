/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-producer.cpp
 * @brief Implementation of the kfk Kafka producer facade.
 *
 * Every enqueued record carries a heap allocated Kfk_DeliveryTicket as its
 * librdkafka message opaque. The delivery report callback, served by the
 * poller thread (and by rd_kafka_flush()), takes the ticket back and
 * either completes a slot of a synchronous Kfk_PendingBatch or hands the
 * result to the callback executor.
 */

#include "kafka/kfk-producer.hpp"

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <expected>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "rdkafka.h"

#include "kafka/kfk-client.hpp"
#include "kafka/kfk-config.hpp"
#include "kafka/kfk-kafka-log.hpp"
#include "kafka/kfk-kafka-util.hpp"
#include "kafka/kfk-message.hpp"
#include "kafka/kfk-transaction.hpp"
#include "kfk-context.hpp"
#include "kfk-debug.hpp"
#include "kfk-error.hpp"
#include "kfk-log.hpp"

namespace kfk {

namespace {

/**
 * The results of one synchronous produce() call, filled in by delivery
 * reports. It is shared with the tickets so a report arriving after the
 * caller gave up (ctx done) still lands somewhere valid.
 */
class Kfk_PendingBatch {
public:
  Kfk_PendingBatch(const std::vector<Kfk_Record> &records,
                   std::string_view defaultTopic)
      : m_results(records.size()), m_completed(records.size(), false) {
    for (std::size_t idx = 0; idx < records.size(); idx++) {
      m_results[idx].record = records[idx];
      m_results[idx].topic = records[idx].topic.empty()
                                 ? std::string{defaultTopic}
                                 : records[idx].topic;
    }
  }

  void expect() {
    std::unique_lock lock{m_mutex};

    m_outstanding++;
  }

  void complete(std::size_t index, Kfk_ProduceResult result) {
    std::unique_lock lock{m_mutex};

    if (m_completed[index]) {
      return;
    }

    m_results[index] = std::move(result);
    m_completed[index] = true;
    m_outstanding--;

    if (0 == m_outstanding) {
      m_cond.notify_all();
    }
  }

  /**
   * @return true once every expected slot is completed
   */
  auto waitFor(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock{m_mutex};

    return m_cond.wait_for(lock, timeout,
                           [this] { return 0 == m_outstanding; });
  }

  /**
   * @brief The results so far, a slot still waiting for its report carries
   *        unfinished as its error.
   */
  auto results(std::error_code unfinished) -> std::vector<Kfk_ProduceResult> {
    std::unique_lock lock{m_mutex};

    auto results = m_results;
    for (std::size_t idx = 0; idx < results.size(); idx++) {
      if (!m_completed[idx]) {
        results[idx].err = unfinished;
      }
    }

    return results;
  }

private:
  std::mutex m_mutex{};
  std::condition_variable m_cond{};
  std::vector<Kfk_ProduceResult> m_results{};
  std::vector<bool> m_completed{};
  std::size_t m_outstanding{};
}; // class Kfk_PendingBatch

struct Kfk_DeliveryTicket {
  Kfk_Record record{};
  std::string topic{};
  std::shared_ptr<Kfk_PendingBatch> batch{};
  std::size_t index{};
  Kfk_Producer::Callback callback{};
}; // struct Kfk_DeliveryTicket

} // namespace

Kfk_Producer::Kfk_Producer(Kfk_ProducerConfig config,
                           std::shared_ptr<Kfk_Logger> logger)
    : m_config{std::move(config)}, m_logger{std::move(logger)},
      m_callbacks{"kafka-producer-callbacks",
                  [logger = m_logger](std::exception_ptr ep) {
                    try {
                      std::rethrow_exception(ep);
                    } catch (const std::exception &e) {
                      logger->error("produce callback failed",
                                    {{"error", e.what()}});
                    } catch (...) {
                      logger->error("produce callback failed");
                    }
                  }} {
  m_transactions = std::make_shared<Kfk_TransactionScope>();
  m_transactions->m_producer = this;
}

Kfk_Producer::~Kfk_Producer() noexcept try {
  close();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Kfk_Producer::create(const Kfk_ProducerConfig *config,
                          std::shared_ptr<Kfk_Logger> logger)
    -> std::expected<std::unique_ptr<Kfk_Producer>, std::error_code> {
  auto producerConfig = nullptr == config ? Kfk_ProducerConfig{} : *config;

  if (auto ec = producerConfig.validate(); ec) {
    return std::unexpected(ec);
  }

  auto topic = producerConfig.defaultTopic;

  std::unique_ptr<Kfk_Producer> producer{new Kfk_Producer(
      std::move(producerConfig), producerLogger(std::move(logger), topic))};

  if (auto ec = producer->open(); ec) {
    return std::unexpected(ec);
  }

  return producer;
}

auto Kfk_Producer::open() -> std::error_code {
  auto properties = producerProperties(m_config);
  if (!properties) {
    m_logger->error("invalid kafka producer configuration",
                    {{"error", properties.error().message()}});

    return properties.error();
  }

  auto conf = buildKafkaConf(*properties, *m_logger);
  if (!conf) {
    return conf.error();
  }

  rd_kafka_conf_set_dr_msg_cb(conf->get(), &Kfk_Producer::deliveryReport);

  auto opaque = std::make_unique<Kfk_ClientOpaque>(
      Kfk_ClientOpaque{m_logger, m_config.tokenProvider, this});

  auto handle =
      createKafkaHandle(RD_KAFKA_PRODUCER, *conf, opaque.get(), *m_logger);
  if (!handle) {
    return handle.error();
  }

  auto *rk = *handle;
  m_client =
      std::make_shared<Kfk_Client>("kafka-producer", rk, std::move(opaque));

  if (!m_poller.exec([this, rk]() -> void {
        while (!m_poller.isStopRequested()) {
          rd_kafka_poll(rk, toTimeoutMs(kPollSlice));
        }
      })) {
    m_client->close();
    m_client.reset();

    throw std::runtime_error("Failed to start kafka producer poller");
  }

  if (!m_config.transactionalId.empty()) {
    Kfk_KafkaPtr<rd_kafka_error_t> error{rd_kafka_init_transactions(
        rk, toTimeoutMs(std::max(m_config.requestTimeout,
                                 std::chrono::milliseconds{
                                     std::chrono::seconds(60)})))};
    if (error) {
      m_logger->error("failed to initialize kafka transactions",
                      {{"transactional_id", m_config.transactionalId},
                       {"error", rd_kafka_error_string(error.get())}});

      auto ec = toErrorCode(error.get());

      close();

      return ec;
    }
  }

  m_logger->info("kafka producer opened", {{"brokers", m_config.brokers}});

  return {};
}

auto Kfk_Producer::snapshot() const
    -> std::expected<std::shared_ptr<Kfk_Client>, std::error_code> {
  std::shared_lock lock{m_mutex};

  if (m_closed || !m_client) {
    return std::unexpected(make_error_code(Kfk_Errc::kClientClosed));
  }

  return m_client;
}

auto Kfk_Producer::enqueue(const Kfk_Lease &lease, const Kfk_Context::Ptr &ctx,
                           const Kfk_Record &record, void *ticket)
    -> std::error_code {
  auto traced = record;
  addContextHeaders(traced, *ctx);

  auto outbound = recordToKafka(traced, m_config.defaultTopic);
  if (outbound.topic.empty()) {
    return Kfk_Errc::kMissingTopic;
  }

  std::vector<rd_kafka_vu_t> vus{};
  vus.reserve(8);

  auto add = [&vus](rd_kafka_vtype_t type) -> rd_kafka_vu_t & {
    vus.push_back(rd_kafka_vu_t{});
    vus.back().vtype = type;

    return vus.back();
  };

  add(RD_KAFKA_VTYPE_TOPIC).u.cstr = outbound.topic.c_str();
  add(RD_KAFKA_VTYPE_PARTITION).u.i32 = outbound.partition;
  add(RD_KAFKA_VTYPE_MSGFLAGS).u.i = RD_KAFKA_MSG_F_COPY;

  if (nullptr != outbound.value) {
    auto &vu = add(RD_KAFKA_VTYPE_VALUE);
    vu.u.mem.ptr = const_cast<char *>(outbound.value->data());
    vu.u.mem.size = outbound.value->size();
  }

  if (nullptr != outbound.key) {
    auto &vu = add(RD_KAFKA_VTYPE_KEY);
    vu.u.mem.ptr = const_cast<char *>(outbound.key->data());
    vu.u.mem.size = outbound.key->size();
  }

  if (outbound.headers) {
    add(RD_KAFKA_VTYPE_HEADERS).u.headers = outbound.headers.get();
  }

  if (0 != outbound.timestampMs) {
    add(RD_KAFKA_VTYPE_TIMESTAMP).u.i64 = outbound.timestampMs;
  }

  add(RD_KAFKA_VTYPE_OPAQUE).u.ptr = ticket;

  while (true) {
    Kfk_KafkaPtr<rd_kafka_error_t> error{
        rd_kafka_produceva(lease.handle(), vus.data(), vus.size())};
    if (!error) {
      // the headers belong to the enqueued message now
      static_cast<void>(outbound.headers.release());

      return {};
    }

    if (RD_KAFKA_RESP_ERR__QUEUE_FULL != rd_kafka_error_code(error.get())) {
      return toErrorCode(error.get());
    }

    // the local queue drains as the poller serves delivery reports
    if (ctx->waitFor(kPollSlice)) {
      return ctx->err();
    }

    if (lease.isClosing()) {
      return Kfk_Errc::kClientClosed;
    }
  }
}

auto Kfk_Producer::produceWith(const Kfk_Lease &lease,
                               const Kfk_Context::Ptr &ctx,
                               const std::vector<Kfk_Record> &records)
    -> std::vector<Kfk_ProduceResult> {
  auto batch =
      std::make_shared<Kfk_PendingBatch>(records, m_config.defaultTopic);

  for (std::size_t idx = 0; idx < records.size(); idx++) {
    if (ctx->err() || lease.isClosing()) {
      break;
    }

    auto ticket = std::make_unique<Kfk_DeliveryTicket>();
    ticket->record = records[idx];
    ticket->topic = records[idx].topic.empty() ? m_config.defaultTopic
                                               : records[idx].topic;
    ticket->batch = batch;
    ticket->index = idx;

    batch->expect();

    auto ec = enqueue(lease, ctx, records[idx], ticket.get());
    if (ec) {
      Kfk_ProduceResult result{};
      result.record = std::move(ticket->record);
      result.topic = std::move(ticket->topic);
      result.partition = result.record.partition;
      result.err = ec;

      logRecordSent(*m_logger, result);
      batch->complete(idx, std::move(result));

      continue;
    }

    static_cast<void>(ticket.release());
  }

  while (!batch->waitFor(kPollSlice)) {
    if (ctx->err() || lease.isClosing()) {
      break;
    }
  }

  auto unfinished = ctx->err();
  if (!unfinished) {
    unfinished = Kfk_Errc::kClientClosed;
  }

  return batch->results(unfinished);
}

void Kfk_Producer::deliveryReport(rd_kafka_t *handle,
                                  const rd_kafka_message_t *message,
                                  void *opaque) {
  auto *clientOpaque = static_cast<Kfk_ClientOpaque *>(opaque);
  auto *producer = static_cast<Kfk_Producer *>(clientOpaque->owner);

  std::unique_ptr<Kfk_DeliveryTicket> ticket{
      static_cast<Kfk_DeliveryTicket *>(message->_private)};
  if (!ticket) {
    return;
  }

  Kfk_ProduceResult result{};
  result.record = std::move(ticket->record);
  result.topic = nullptr == message->rkt ? std::move(ticket->topic)
                                         : rd_kafka_topic_name(message->rkt);
  result.partition = message->partition;
  result.offset = message->offset;
  result.err = toErrorCode(message->err);

  logRecordSent(*producer->m_logger, result);

  KFK_DEBUG_PRINT(std::cerr << "delivery report (" << rd_kafka_name(handle)
                            << "): " << result.topic << "/"
                            << result.partition << "@" << result.offset
                            << '\n');

  if (ticket->batch) {
    ticket->batch->complete(ticket->index, std::move(result));
  } else {
    producer->dispatch(std::move(ticket->callback), std::move(result));
  }
}

void Kfk_Producer::dispatch(Callback callback, Kfk_ProduceResult result) {
  if (!callback) {
    return;
  }

  m_callbacks.addExecTask(
      [callback = std::move(callback), result = std::move(result)]() -> void {
        callback(result);
      });
}

auto Kfk_Producer::produce(const Kfk_Context::Ptr &ctx,
                           const std::vector<Kfk_Record> &records)
    -> std::expected<std::vector<Kfk_ProduceResult>, std::error_code> {
  if (!ctx) {
    return std::unexpected(make_error_code(Kfk_Errc::kNilContext));
  }

  auto client = snapshot();
  if (!client) {
    return std::unexpected(client.error());
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    return std::unexpected(make_error_code(Kfk_Errc::kClientClosed));
  }

  return produceWith(*lease, ctx, records);
}

void Kfk_Producer::produceAsync(const Kfk_Context::Ptr &ctx,
                                Kfk_Record record, Callback callback) {
  auto fail = [this, &record, &callback](std::error_code ec) {
    Kfk_ProduceResult result{};
    result.topic =
        record.topic.empty() ? m_config.defaultTopic : record.topic;
    result.record = std::move(record);
    result.err = ec;

    logRecordSent(*m_logger, result);
    dispatch(std::move(callback), std::move(result));
  };

  if (!ctx) {
    fail(Kfk_Errc::kNilContext);

    return;
  }

  auto client = snapshot();
  if (!client) {
    fail(client.error());

    return;
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    fail(Kfk_Errc::kClientClosed);

    return;
  }

  auto ticket = std::make_unique<Kfk_DeliveryTicket>();
  ticket->topic = record.topic.empty() ? m_config.defaultTopic : record.topic;
  ticket->record = std::move(record);
  ticket->callback = std::move(callback);

  auto ec = enqueue(*lease, ctx, ticket->record, ticket.get());
  if (ec) {
    record = std::move(ticket->record);
    callback = std::move(ticket->callback);
    fail(ec);

    return;
  }

  static_cast<void>(ticket.release());
}

auto Kfk_Producer::marshalJson(std::string_view topic,
                               std::optional<std::string> key,
                               const google::protobuf::Message &message)
    -> std::expected<Kfk_Record, std::error_code> {
  std::string json{};

  auto status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    m_logger->error("failed to marshal message to json",
                    {{"message_type", message.GetTypeName()},
                     {"error", status.ToString()}});

    return std::unexpected(make_error_code(Kfk_Errc::kMarshal));
  }

  auto record = Kfk_Record::of(json).withTopic(topic);
  record.key = std::move(key);

  return record;
}

auto Kfk_Producer::produceJson(const Kfk_Context::Ptr &ctx,
                               std::string_view topic,
                               std::optional<std::string> key,
                               const google::protobuf::Message &message)
    -> std::expected<Kfk_ProduceResult, std::error_code> {
  auto record = marshalJson(topic, std::move(key), message);
  if (!record) {
    return std::unexpected(record.error());
  }

  auto results = produce(ctx, {std::move(*record)});
  if (!results) {
    return std::unexpected(results.error());
  }

  auto &result = results->front();
  if (result.err) {
    return std::unexpected(result.err);
  }

  return std::move(result);
}

void Kfk_Producer::produceJsonAsync(const Kfk_Context::Ptr &ctx,
                                    std::string_view topic,
                                    std::optional<std::string> key,
                                    const google::protobuf::Message &message,
                                    Callback callback) {
  auto record = marshalJson(topic, key, message);
  if (!record) {
    Kfk_ProduceResult result{};
    result.record.topic = topic;
    result.record.key = std::move(key);
    result.topic = topic.empty() ? m_config.defaultTopic : std::string{topic};
    result.err = record.error();

    dispatch(std::move(callback), std::move(result));

    return;
  }

  produceAsync(ctx, std::move(*record), std::move(callback));
}

auto Kfk_Producer::flush(const Kfk_Context::Ptr &ctx) -> std::error_code {
  if (!ctx) {
    return Kfk_Errc::kNilContext;
  }

  auto client = snapshot();
  if (!client) {
    return client.error();
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    return Kfk_Errc::kClientClosed;
  }

  while (true) {
    if (auto ec = ctx->err(); ec) {
      return ec;
    }

    if (lease->isClosing()) {
      return Kfk_Errc::kClientClosed;
    }

    auto err = rd_kafka_flush(lease->handle(),
                              toTimeoutMs(ctx->remaining(kPollSlice)));
    if (RD_KAFKA_RESP_ERR_NO_ERROR == err) {
      return {};
    }

    if (RD_KAFKA_RESP_ERR__TIMED_OUT != err) {
      return toErrorCode(err);
    }
  }
}

auto Kfk_Producer::beginTransaction(const Kfk_Context::Ptr &ctx)
    -> std::expected<std::unique_ptr<Kfk_Transaction>, std::error_code> {
  if (!ctx) {
    return std::unexpected(make_error_code(Kfk_Errc::kNilContext));
  }

  if (m_config.transactionalId.empty()) {
    return std::unexpected(make_error_code(Kfk_Errc::kNoTransactionalId));
  }

  auto client = snapshot();
  if (!client) {
    return std::unexpected(client.error());
  }

  auto lease = (*client)->acquire();
  if (!lease) {
    return std::unexpected(make_error_code(Kfk_Errc::kClientClosed));
  }

  Kfk_KafkaPtr<rd_kafka_error_t> error{
      rd_kafka_begin_transaction(lease->handle())};
  if (error) {
    m_logger->error("failed to begin kafka transaction",
                    {{"transactional_id", m_config.transactionalId},
                     {"error", rd_kafka_error_string(error.get())}});

    return std::unexpected(toErrorCode(error.get()));
  }

  m_logger->info("kafka transaction begun",
                 {{"transactional_id", m_config.transactionalId}});

  return std::unique_ptr<Kfk_Transaction>{
      new Kfk_Transaction(m_transactions, ctx, m_logger,
                          m_config.transactionalId, m_config.requestTimeout)};
}

auto Kfk_Producer::transact(const Kfk_Context::Ptr &ctx, const TransactFn &fn)
    -> std::error_code {
  if (!ctx) {
    return Kfk_Errc::kNilContext;
  }

  if (!fn) {
    return Kfk_Errc::kNilHandler;
  }

  auto txn = beginTransaction(ctx);
  if (!txn) {
    return txn.error();
  }

  std::error_code ec{};

  try {
    ec = fn(**txn);
  } catch (...) {
    if (auto abortEc = (*txn)->abort(); abortEc) {
      m_logger->error("failed to abort kafka transaction",
                      {{"error", abortEc.message()}});
    }

    throw;
  }

  if (ec) {
    if (auto abortEc = (*txn)->abort(); abortEc) {
      m_logger->error("failed to abort kafka transaction",
                      {{"error", abortEc.message()}});
    }

    return ec;
  }

  return (*txn)->commit();
}

auto Kfk_Producer::transactRecords(const Kfk_Context::Ptr &ctx,
                                   const std::vector<Kfk_Record> &records)
    -> std::error_code {
  return transact(ctx, [&records](Kfk_Transaction &txn) -> std::error_code {
    return txn.produceMany(records);
  });
}

void Kfk_Producer::shutdown(rd_kafka_t *handle) {
  auto err = rd_kafka_flush(handle, toTimeoutMs(m_config.requestTimeout));
  if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
    m_logger->warn("kafka producer flush incomplete on close, purging",
                   {{"pending", std::to_string(rd_kafka_outq_len(handle))},
                    {"error", rd_kafka_err2str(err)}});

    err = rd_kafka_purge(handle,
                         RD_KAFKA_PURGE_F_QUEUE | RD_KAFKA_PURGE_F_INFLIGHT);
    if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
      m_logger->error("failed to purge kafka producer",
                      {{"error", rd_kafka_err2str(err)}});
    }

    // serve the delivery reports of the purged records
    err = rd_kafka_flush(handle, toTimeoutMs(m_config.requestTimeout));
    if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
      m_logger->error("kafka producer closed with undelivered records",
                      {{"pending", std::to_string(rd_kafka_outq_len(handle))}});
    }
  }

  m_poller.stopExec();
  rd_kafka_poll(handle, 0);
}

void Kfk_Producer::abortTransactions() {
  std::unique_lock lock{m_transactions->m_mutex};

  for (auto *txn : m_transactions->m_live) {
    if (auto ec = txn->abortWith(this); ec) {
      m_logger->warn("failed to abort kafka transaction on close",
                     {{"transactional_id", m_config.transactionalId},
                      {"error", ec.message()}});
    }
  }

  m_transactions->m_producer = nullptr;
}

void Kfk_Producer::close() {
  abortTransactions();

  std::shared_ptr<Kfk_Client> client{};

  {
    std::unique_lock lock{m_mutex};

    if (m_closed) {
      return;
    }

    m_closed = true;
    client = std::move(m_client);
  }

  if (client) {
    client->close([this](rd_kafka_t *handle) { shutdown(handle); });
    m_logger->info("kafka producer closed");
  }

  m_callbacks.waitForEmpty();
}

auto Kfk_Producer::isConnected() const -> bool {
  std::shared_lock lock{m_mutex};

  return !m_closed && m_client;
}

auto Kfk_Producer::config() const -> const Kfk_ProducerConfig & {
  return m_config;
}

} // namespace kfk
