#pragma once

#include "tuplekey/config/log_option.hpp"

#include <format>
#include <string>
#include <utility>

#ifdef DEBUG
#define TK_DLOG(...) tuplekey::Log::Debug(__VA_ARGS__);
#define TK_DCHECK(...) tuplekey::Log::DebugCheck(__VA_ARGS__);
#else
#define TK_DLOG(...) (void)0;
#define TK_DCHECK(...) (void)0;
#endif

namespace tuplekey {

class Log {
public:
  /// Installs the tuplekey logger as the default spdlog logger. Calling it
  /// again before Deinit() is a no-op.
  static void Init(const LogOption& option);

  /// Drops the tuplekey logger and restores the original default logger.
  static void Deinit();

  static void DebugCheck(bool condition, const std::string& msg = "");

  static void Debug(const std::string& msg);

  static void Info(const std::string& msg);

  static void Warn(const std::string& msg);

  static void Error(const std::string& msg);

  static void Fatal(const std::string& msg);

  template <typename... Args>
  static void DebugCheck(bool condition, std::format_string<Args...> fmt, Args&&... args) {
    DebugCheck(condition, std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void Debug(std::format_string<Args...> fmt, Args&&... args) {
    Debug(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void Info(std::format_string<Args...> fmt, Args&&... args) {
    Info(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void Warn(std::format_string<Args...> fmt, Args&&... args) {
    Warn(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void Error(std::format_string<Args...> fmt, Args&&... args) {
    Error(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void Fatal(std::format_string<Args...> fmt, Args&&... args) {
    Fatal(std::format(fmt, std::forward<Args>(args)...));
  }
};

} // namespace tuplekey
