#include "tuplekey/base/log.hpp"

#include "tuplekey/base/enum_traits.hpp"
#include "tuplekey/config/log_option.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>

namespace tuplekey {

static constexpr char kLoggerName[] = "tuplekey_logger";
static constexpr char kLogFormat[] = "[%Y-%m-%d %H:%M:%S.%e] [%t] [%l] %v";
static constexpr int kFlushIntervalSeconds = 3;

namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> logger = nullptr;
std::shared_ptr<spdlog::logger> origin_default_logger = spdlog::default_logger();

spdlog::level::level_enum LogLevelToSpdlogLevel(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return spdlog::level::debug;
  case LogLevel::kInfo:
    return spdlog::level::info;
  case LogLevel::kWarn:
    return spdlog::level::warn;
  case LogLevel::kError:
  default:
    return spdlog::level::err;
  }
}

} // namespace

void Log::Init(const LogOption& option) {
  std::lock_guard<std::mutex> lock(logger_mutex);
  if (logger != nullptr) {
    return;
  }

  if (option.log_file_.empty()) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  } else {
    logger = spdlog::basic_logger_mt(kLoggerName, option.log_file_);
    spdlog::flush_every(std::chrono::seconds(kFlushIntervalSeconds));
  }
  logger->set_pattern(kLogFormat);
  logger->flush_on(spdlog::level::warn);
  logger->set_level(LogLevelToSpdlogLevel(option.level_));

  spdlog::set_default_logger(logger);
  Log::Debug("Logger initialized, level={}, file={}", EnumTraits<LogLevel>::ToString(option.level_),
             option.log_file_.empty() ? "<stderr>" : option.log_file_);
}

void Log::Deinit() {
  std::lock_guard<std::mutex> lock(logger_mutex);
  if (logger == nullptr) {
    return;
  }

  logger->flush();
  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(origin_default_logger);
  spdlog::flush_every(std::chrono::seconds(0));
  logger = nullptr;
}

void Log::DebugCheck(bool condition, const std::string& msg) {
  if (!condition) {
    spdlog::critical(msg);
    assert(false);
  }
}

void Log::Debug(const std::string& msg) {
  spdlog::debug(msg);
}

void Log::Info(const std::string& msg) {
  spdlog::info(msg);
}

void Log::Warn(const std::string& msg) {
  spdlog::warn(msg);
}

void Log::Error(const std::string& msg) {
  spdlog::error(msg);
}

void Log::Fatal(const std::string& msg) {
  spdlog::critical(msg);
  std::abort();
}

} // namespace tuplekey
