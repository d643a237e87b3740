#pragma once

#include "tuplekey/base/enum_traits.hpp"
#include "tuplekey/base/optional.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

namespace tuplekey {

/// Log level.
enum class LogLevel : uint8_t {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
};

/// The options for the process-wide logger.
struct LogOption {
  /// The log level
  LogLevel level_ = LogLevel::kInfo;

  /// Path of the log file, logs go to stderr when empty.
  std::string log_file_;
};

template <>
struct EnumTraits<LogLevel> {
  static constexpr std::string_view kNames[] = {"debug", "info", "warn", "error"};

  static std::string_view ToString(LogLevel level) {
    return kNames[static_cast<uint8_t>(level)];
  }

  /// Case-insensitive parse of a level name.
  static Optional<LogLevel> FromString(std::string_view name) {
    auto lower_name = std::string(name.size(), '\0');
    std::ranges::transform(name, lower_name.begin(), ::tolower);
    for (uint8_t i = 0; i < std::size(kNames); i++) {
      if (lower_name == kNames[i]) {
        return static_cast<LogLevel>(i);
      }
    }
    return std::nullopt;
  }
};

} // namespace tuplekey
