// include/cr/log.hpp
#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace cr {

// spdlog wrapper shared by the library, the CLI and the bindings.
class Logger {
public:
  // level: trace, debug, info, warn, error, critical, off
  static void init(const std::string& level);

  // Lazily initialised from CR_LOG_LEVEL (default "warn").
  static std::shared_ptr<spdlog::logger> get();

  // Lock-free level check against the level last set through init() or
  // CR_LOG_LEVEL.
  static bool enabled(spdlog::level::level_enum level);

private:
  static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cr

// Arguments are not evaluated when the level is disabled.
#define CR_LOG_TRACE(...)                                                      \
  do {                                                                         \
    if (::cr::Logger::enabled(spdlog::level::trace))                           \
      ::cr::Logger::get()->trace(__VA_ARGS__);                                 \
  } while (0)
#define CR_LOG_DEBUG(...)                                                      \
  do {                                                                         \
    if (::cr::Logger::enabled(spdlog::level::debug))                           \
      ::cr::Logger::get()->debug(__VA_ARGS__);                                 \
  } while (0)
#define CR_LOG_WARN(...) ::cr::Logger::get()->warn(__VA_ARGS__)
#define CR_LOG_ERROR(...) ::cr::Logger::get()->error(__VA_ARGS__)
