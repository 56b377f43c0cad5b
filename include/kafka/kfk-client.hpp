/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-client.hpp
 * @brief The owner of one librdkafka handle shared by a kfk facade and its
 *        in-flight operations.
 *
 * A facade (Kfk_Producer, Kfk_Consumer, Kfk_Admin) holds its Kfk_Client in
 * a std::shared_ptr guarded by the facade's std::shared_mutex. Operations
 * snapshot the pointer under the shared lock and then enter the client's
 * in-flight gate:
 *
 *   auto lease = client->acquire();
 *   if (!lease) {
 *     return Kfk_Errc::kClientClosed;
 *   }
 *
 *   rd_kafka_flush(lease->handle(), ...);
 *
 * close() shuts the gate to new leases, waits until every outstanding lease
 * is released (blocking calls are sliced by kPollSlice and check
 * isClosing() between slices), runs the facade's shutdown step and then
 * destroys the handle exactly once.
 *
 * Kfk_ClientOpaque is the rd_kafka_conf opaque of the handle. The librdkafka
 * log, error and OAUTHBEARER refresh callbacks reach the facade's logger and
 * token provider through it, and the consumer rebalance callback reaches the
 * consumer through its owner pointer.
 */

#ifndef KFK_CLIENT_HPP_

#define KFK_CLIENT_HPP_

#include <condition_variable>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "rdkafka.h"

#include "kafka/kfk-config.hpp"
#include "kafka/kfk-kafka-util.hpp"
#include "kfk-context.hpp"
#include "kfk-log.hpp"

namespace kfk {

class Kfk_Client;

struct Kfk_ClientOpaque {
  std::shared_ptr<Kfk_Logger> logger{};
  Kfk_TokenProvider tokenProvider{};
  void *owner{};
}; // struct Kfk_ClientOpaque

/**
 * A counted entry through the in-flight gate of a Kfk_Client. The handle is
 * valid for as long as the lease is alive.
 */
class Kfk_Lease {
  friend class Kfk_Client;

public:
  ~Kfk_Lease() noexcept;

  Kfk_Lease(const Kfk_Lease &obj) = delete;
  const Kfk_Lease &operator=(const Kfk_Lease &obj) = delete;
  Kfk_Lease(Kfk_Lease &&obj) noexcept;
  Kfk_Lease &operator=(Kfk_Lease &&obj) = delete;

  auto handle() const -> rd_kafka_t *;

  /**
   * @brief True once close() of the owning client has started, a blocking
   *        loop must then return at the end of its current slice.
   */
  auto isClosing() const -> bool;

private:
  explicit Kfk_Lease(Kfk_Client *client);

  Kfk_Client *m_client{};
}; // class Kfk_Lease

class Kfk_Client {
  friend class Kfk_Lease;

public:
  using ShutdownFn = std::function<void(rd_kafka_t *)>;

  Kfk_Client(std::string_view name, rd_kafka_t *handle,
             std::unique_ptr<Kfk_ClientOpaque> opaque);
  ~Kfk_Client() noexcept;

  Kfk_Client(const Kfk_Client &obj) = delete;
  const Kfk_Client &operator=(const Kfk_Client &obj) = delete;
  Kfk_Client(Kfk_Client &&obj) = delete;
  Kfk_Client &operator=(Kfk_Client &&obj) = delete;

  /**
   * @brief Enter the in-flight gate, std::nullopt once close() has started.
   */
  auto acquire() -> std::optional<Kfk_Lease>;

  auto isClosing() const -> bool;

  auto name() const -> const std::string &;

  /**
   * @brief Close the handle, only the first call has an effect.
   *
   * @param shutdown Run with the handle after the last lease is released and
   *                 before rd_kafka_destroy(), e.g. to flush a producer
   */
  void close(const ShutdownFn &shutdown = {});

private:
  void release();

  /**
   * data members for constructor to instantiate the object.
   */
  std::string m_name{};
  rd_kafka_t *m_handle{};
  std::unique_ptr<Kfk_ClientOpaque> m_opaque{};

  /**
   * data members for internal logic.
   */
  mutable std::mutex m_mutex{};
  std::condition_variable m_cond{};
  std::size_t m_in_flight{};
  bool m_closing{};
}; // class Kfk_Client

/**
 * @brief Create a librdkafka handle of type from conf, with opaque wired to
 *        the log, error and (when opaque has a token provider) OAUTHBEARER
 *        refresh callbacks. conf is consumed on success. A failure is logged
 *        and reported as Kfk_Errc::kConfiguration.
 */
auto createKafkaHandle(rd_kafka_type_t type, Kfk_KafkaPtr<rd_kafka_conf_t> &conf,
                       Kfk_ClientOpaque *opaque, Kfk_Logger &logger)
    -> std::expected<rd_kafka_t *, std::error_code>;

/**
 * @brief Wait for the next event on queue, in kPollSlice steps, until ctx is
 *        done or the client behind lease starts closing.
 */
auto awaitEvent(const Kfk_Lease &lease, rd_kafka_queue_t *queue,
                const Kfk_Context::Ptr &ctx)
    -> std::expected<Kfk_KafkaPtr<rd_kafka_event_t>, std::error_code>;

} // namespace kfk

#endif // KFK_CLIENT_HPP_
