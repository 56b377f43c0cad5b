/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file include/kfk-util.hpp
 * @brief Small, header-only string helpers used across the kfk project.
 *
 *  - stringCompare(...) : compare two strings with optional case-insensitive
 *    mode (ASCII only).
 *  - toLower(...)       : ASCII lowercase copy of a string.
 *  - trim(...)          : strip leading and trailing whitespace.
 *  - split(...)         : split on a delimiter, trimming every item and
 *    dropping empty ones (used for "host1:9092, host2:9092" broker lists).
 *  - join(...)          : the reverse of split for diagnostics.
 *  - secureZero(...)    : overwrite a string holding a secret before it is
 *    released.
 */

#ifndef KFK_UTIL_HPP_
#define KFK_UTIL_HPP_

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace kfk {

/**
 * @brief Return an ASCII lowercase copy of str.
 */
inline auto toLower(std::string_view str) -> std::string {
  std::string value{str};

  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) -> char { return std::tolower(c); });

  return value;
}

/**
 * @brief Compare two strings for equality, optionally in a case-insensitive
 * way.
 *
 * The lowercasing is a simple byte-wise ASCII conversion, it is not suitable
 * for Unicode case folding.
 *
 * @param str1            The first string to compare
 * @param str2            The second string to compare
 * @param caseInsensitive If true, comparison is performed case-insensitively
 *
 * @return true if the (possibly lowercased) strings are equal
 */
inline bool stringCompare(const std::string_view str1,
                          const std::string_view str2,
                          bool caseInsensitive = true) {
  if (caseInsensitive) {
    return toLower(str1) == toLower(str2);
  }

  return str1 == str2;
}

inline auto trim(std::string_view str) -> std::string_view {
  while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
    str.remove_prefix(1);
  }

  while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
    str.remove_suffix(1);
  }

  return str;
}

/**
 * @brief Split str on delim. Items are trimmed and empty items are dropped,
 *        so "a, ,b," yields {"a", "b"}.
 */
inline auto split(std::string_view str, char delim = ',')
    -> std::vector<std::string> {
  std::vector<std::string> items{};

  while (true) {
    auto pos = str.find(delim);
    auto item = trim(str.substr(0, pos));

    if (!item.empty()) {
      items.emplace_back(item);
    }

    if (std::string_view::npos == pos) {
      break;
    }

    str.remove_prefix(pos + 1);
  }

  return items;
}

inline auto join(const std::vector<std::string> &items,
                 std::string_view separator = ",") -> std::string {
  std::string value{};

  for (const auto &item : items) {
    if (!value.empty()) {
      value.append(separator);
    }

    value.append(item);
  }

  return value;
}

/**
 * @brief Overwrite the content of a string holding a secret and clear it.
 *
 * The volatile write keeps the compiler from eliding the stores for a buffer
 * that is about to be released.
 */
inline void secureZero(std::string &secret) {
  volatile char *data = secret.data();

  for (std::size_t i = 0; i < secret.size(); i++) {
    data[i] = '\0';
  }

  secret.clear();
}

} // namespace kfk

#endif // KFK_UTIL_HPP_
