/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace chime::timer {

  /// Where a scheduled task is run when its timeout fires
  enum class ExecutionType : uint8_t {
    /// On the timer thread itself
    Inline,
    /// On the worker pool
    Threaded,
  };

  inline std::string_view toString(ExecutionType type) {
    switch (type) {
      case ExecutionType::Inline:
        return "inline";
      case ExecutionType::Threaded:
        return "threaded";
    }
    return "unknown";
  }

  inline std::optional<ExecutionType> executionTypeFromString(
      std::string_view str) {
    if (str == "inline" or str == "default") {
      return ExecutionType::Inline;
    }
    if (str == "threaded") {
      return ExecutionType::Threaded;
    }
    return std::nullopt;
  }

}  // namespace chime::timer
