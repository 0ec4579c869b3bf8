// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit::log -- library logging on top of spdlog.
//
// Design:
//   - One named logger "dbkit", shared with the application through the
//     spdlog registry (register your own sink under that name to redirect)
//   - Created lazily on stderr when the application did not register one
//   - fmt-style helpers, nothing formatted when the level is disabled

#pragma once

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dbkit {
namespace log {

constexpr const char* kLoggerName = "dbkit";

inline const std::shared_ptr<spdlog::logger>& Logger() {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    std::shared_ptr<spdlog::logger> existing = spdlog::get(kLoggerName);
    return existing != nullptr ? existing : spdlog::stderr_color_mt(kLoggerName);
  }();
  return logger;
}

inline void SetLevel(spdlog::level::level_enum level) {
  Logger()->set_level(level);
}

template <typename... Args>
inline void Debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  Logger()->debug(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void Info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  Logger()->info(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void Warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  Logger()->warn(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void Error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  Logger()->error(fmt, std::forward<Args>(args)...);
}

}  // namespace log
}  // namespace dbkit
