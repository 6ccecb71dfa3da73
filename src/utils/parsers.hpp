/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace chime::util {

  /**
   * Case-insensitive comparison of two string views.
   *
   * @param lhs First string view
   * @param rhs Second string view
   * @return true if strings are equal ignoring case, false otherwise
   */
  inline bool iequals(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(lhs[i]))
          != std::tolower(static_cast<unsigned char>(rhs[i]))) {
        return false;
      }
    }
    return true;
  }

  inline std::string_view trim(std::string_view input) {
    auto first = input.find_first_not_of(" \t\n\r");
    if (first == std::string_view::npos) {
      return {};
    }
    auto last = input.find_last_not_of(" \t\n\r");
    return input.substr(first, last - first + 1);
  }

  /**
   * Parses a string representing a time duration (e.g., "100ms", "5 sec",
   * "2 hours") and converts it to nanoseconds.
   *
   * Recognized suffixes (case-insensitive): ns, us, ms, s, m, h, d and their
   * long forms. A number without suffix is taken as milliseconds.
   *
   * @param input string representation of duration
   * @return duration if parsing succeeded, std::nullopt otherwise
   */
  inline std::optional<std::chrono::nanoseconds> parseTimeDuration(
      std::string_view input) {
    input = trim(input);

    size_t i = 0;
    while (i < input.size()
           && std::isdigit(static_cast<unsigned char>(input[i]))) {
      ++i;
    }
    if (i == 0) {
      return std::nullopt;
    }

    std::string_view number_part = input.substr(0, i);
    while (i < input.size()
           && std::isspace(static_cast<unsigned char>(input[i]))) {
      ++i;
    }
    std::string_view suffix = input.substr(i);

    uint64_t number = 0;
    auto [ptr, ec] = std::from_chars(
        number_part.data(), number_part.data() + number_part.size(), number);
    if (ec != std::errc()) {
      return std::nullopt;
    }

    struct Entry {
      std::string_view suffix;
      uint64_t nanos;
    };
    static constexpr uint64_t kUs = 1'000ull;
    static constexpr uint64_t kMs = 1'000'000ull;
    static constexpr uint64_t kSec = 1'000'000'000ull;
    static constexpr Entry suffixes[] = {
        {"", kMs},
        {"ns", 1},          {"nanos", 1},       {"nanoseconds", 1},
        {"us", kUs},        {"micros", kUs},    {"microseconds", kUs},
        {"ms", kMs},        {"millis", kMs},    {"milliseconds", kMs},
        {"s", kSec},        {"sec", kSec},      {"secs", kSec},
        {"second", kSec},   {"seconds", kSec},  {"m", 60 * kSec},
        {"min", 60 * kSec}, {"mins", 60 * kSec}, {"minute", 60 * kSec},
        {"minutes", 60 * kSec}, {"h", 3600 * kSec}, {"hour", 3600 * kSec},
        {"hours", 3600 * kSec}, {"d", 86400 * kSec}, {"day", 86400 * kSec},
        {"days", 86400 * kSec},
    };

    static constexpr auto kMax =
        static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    for (const auto &[table_suffix, nanos] : suffixes) {
      if (iequals(table_suffix, suffix)) {
        if (number > kMax / nanos) {
          return std::nullopt;
        }
        return std::chrono::nanoseconds(static_cast<int64_t>(number * nanos));
      }
    }

    return std::nullopt;
  }

}  // namespace chime::util
