/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file kfk-log.cpp
 * @brief The source implementation file for kfk-log.
 */

#include "kfk-log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace kfk {

namespace {

class Kfk_FieldLogger : public Kfk_Logger {
public:
  Kfk_FieldLogger(std::shared_ptr<Kfk_Logger> base, Kfk_LogFields fields)
      : m_base{std::move(base)}, m_fields{std::move(fields)} {}

  void log(Kfk_LogLevel level, std::string_view message,
           const Kfk_LogFields &fields) override {
    Kfk_LogFields merged{m_fields};

    merged.insert(merged.end(), fields.begin(), fields.end());
    m_base->log(level, message, merged);
  }

private:
  const std::shared_ptr<Kfk_Logger> m_base{};
  const Kfk_LogFields m_fields{};
}; // class Kfk_FieldLogger

} // namespace

auto toString(Kfk_LogLevel level) -> std::string_view {
  switch (level) {
  case Kfk_LogLevel::kDebug:
    return "DEBUG";
  case Kfk_LogLevel::kInfo:
    return "INFO";
  case Kfk_LogLevel::kWarn:
    return "WARN";
  case Kfk_LogLevel::kError:
    return "ERROR";
  }

  return "UNKNOWN";
}

void Kfk_Logger::debug(std::string_view message, const Kfk_LogFields &fields) {
  log(Kfk_LogLevel::kDebug, message, fields);
}

void Kfk_Logger::info(std::string_view message, const Kfk_LogFields &fields) {
  log(Kfk_LogLevel::kInfo, message, fields);
}

void Kfk_Logger::warn(std::string_view message, const Kfk_LogFields &fields) {
  log(Kfk_LogLevel::kWarn, message, fields);
}

void Kfk_Logger::error(std::string_view message, const Kfk_LogFields &fields) {
  log(Kfk_LogLevel::kError, message, fields);
}

Kfk_StreamLogger::Kfk_StreamLogger(std::ostream &os, Kfk_LogLevel minLevel)
    : m_os{os}, m_min_level{minLevel} {}

void Kfk_StreamLogger::log(Kfk_LogLevel level, std::string_view message,
                           const Kfk_LogFields &fields) {
  if (level < m_min_level) {
    return;
  }

  auto now = std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::now());
  std::tm tm_now{};
  gmtime_r(&now, &tm_now);

  std::unique_lock lock{m_mutex};

  m_os << std::put_time(&tm_now, "%Y-%m-%dT%H:%M:%SZ") << ' '
       << toString(level) << ' ' << message;

  for (const auto &[key, value] : fields) {
    m_os << ' ' << key << '=';

    if (value.find(' ') != std::string::npos) {
      m_os << std::quoted(value);
    } else {
      m_os << value;
    }
  }

  m_os << '\n';
  m_os.flush();
}

void Kfk_NopLogger::log([[maybe_unused]] Kfk_LogLevel level,
                        [[maybe_unused]] std::string_view message,
                        [[maybe_unused]] const Kfk_LogFields &fields) {}

auto withFields(std::shared_ptr<Kfk_Logger> base, Kfk_LogFields fields)
    -> std::shared_ptr<Kfk_Logger> {
  if (!base) {
    base = std::make_shared<Kfk_NopLogger>();
  }

  return std::make_shared<Kfk_FieldLogger>(std::move(base), std::move(fields));
}

} // namespace kfk
