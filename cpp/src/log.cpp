// src/log.cpp
#include "cr/log.hpp"

#include <atomic>
#include <cstdlib>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cr {
namespace {

std::mutex &logger_mutex() {
  static std::mutex m;
  return m;
}

spdlog::level::level_enum parse_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "info")
    return spdlog::level::info;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "critical")
    return spdlog::level::critical;
  if (level == "off")
    return spdlog::level::off;
  return spdlog::level::warn;
}

// -1 until the logger exists.
std::atomic<int> g_level{-1};

std::shared_ptr<spdlog::logger> make_logger(const std::string &level) {
  // Library output goes to stderr so CLI results on stdout stay clean.
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
  auto logger = std::make_shared<spdlog::logger>("cryptorand", sink);
  logger->set_level(parse_level(level));
  logger->flush_on(spdlog::level::err);
  g_level.store(static_cast<int>(logger->level()), std::memory_order_relaxed);
  return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::init(const std::string &level) {
  std::lock_guard<std::mutex> lock(logger_mutex());
  logger_ = make_logger(level);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  std::lock_guard<std::mutex> lock(logger_mutex());
  if (!logger_) {
    const char *env = std::getenv("CR_LOG_LEVEL");
    logger_ = make_logger(env ? env : "warn");
  }
  return logger_;
}

bool Logger::enabled(spdlog::level::level_enum level) {
  int current = g_level.load(std::memory_order_relaxed);
  if (current < 0)
    current = static_cast<int>(get()->level());
  return static_cast<int>(level) >= current;
}

} // namespace cr
