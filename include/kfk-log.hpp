/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-log.hpp
 * @brief Injectable structured logger used by the kfk facades.
 *
 * The facades never write to a stream directly, they log through a
 * Kfk_Logger supplied by the caller at construction. A log entry is a level,
 * a message and an ordered list of key/value fields, for example:
 *
 *   logger->error("failed to produce record",
 *                 {{"topic", "orders"}, {"partition", "3"}});
 *
 * Implementations:
 *  - Kfk_StreamLogger: writes one line per entry to a std::ostream
 *    (std::cerr by default) and drops entries below its minimum level.
 *  - Kfk_NopLogger: discards everything, the default when no logger is
 *    injected.
 *  - withFields(): returns a child logger that prepends fixed fields to
 *    every entry of its parent (e.g. component=kafka-consumer).
 *
 * Loggers may be called concurrently from application threads and from
 * librdkafka's internal threads, so every implementation must be thread
 * safe.
 */

#ifndef KFK_LOG_HPP_
#define KFK_LOG_HPP_

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kfk {

enum class Kfk_LogLevel { kDebug, kInfo, kWarn, kError };

using Kfk_LogField = std::pair<std::string, std::string>;
using Kfk_LogFields = std::vector<Kfk_LogField>;

auto toString(Kfk_LogLevel level) -> std::string_view;

class Kfk_Logger {
public:
  Kfk_Logger() = default;
  virtual ~Kfk_Logger() noexcept = default;

  Kfk_Logger(const Kfk_Logger &obj) = delete;
  const Kfk_Logger &operator=(const Kfk_Logger &obj) = delete;
  Kfk_Logger(Kfk_Logger &&obj) = delete;
  Kfk_Logger &operator=(Kfk_Logger &&obj) = delete;

  /**
   * @brief Emit one log entry.
   *
   * @param level   The severity of the entry
   * @param message The human readable message
   * @param fields  The ordered key/value context of the entry
   */
  virtual void log(Kfk_LogLevel level, std::string_view message,
                   const Kfk_LogFields &fields) = 0;

  void debug(std::string_view message, const Kfk_LogFields &fields = {});
  void info(std::string_view message, const Kfk_LogFields &fields = {});
  void warn(std::string_view message, const Kfk_LogFields &fields = {});
  void error(std::string_view message, const Kfk_LogFields &fields = {});
}; // class Kfk_Logger

class Kfk_StreamLogger : public Kfk_Logger {
public:
  explicit Kfk_StreamLogger(std::ostream &os = std::cerr,
                            Kfk_LogLevel minLevel = Kfk_LogLevel::kInfo);

  void log(Kfk_LogLevel level, std::string_view message,
           const Kfk_LogFields &fields) override;

private:
  std::mutex m_mutex{};
  std::ostream &m_os;
  const Kfk_LogLevel m_min_level{};
}; // class Kfk_StreamLogger

class Kfk_NopLogger : public Kfk_Logger {
public:
  void log(Kfk_LogLevel level, std::string_view message,
           const Kfk_LogFields &fields) override;
}; // class Kfk_NopLogger

/**
 * @brief Return a logger that prefixes fields to every entry before passing
 *        it to base. A null base yields a Kfk_NopLogger parent.
 */
auto withFields(std::shared_ptr<Kfk_Logger> base, Kfk_LogFields fields)
    -> std::shared_ptr<Kfk_Logger>;

} // namespace kfk

#endif // KFK_LOG_HPP_
