#pragma once
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace lull {

enum class log_level {
  debug,
  info,
  warning,
  error,
  off,
};

constexpr const char* to_string(log_level level) noexcept {
  switch (level) {
    case log_level::debug:   return "debug";
    case log_level::info:    return "info";
    case log_level::warning: return "warning";
    case log_level::error:   return "error";
    case log_level::off:     return "off";
  }
  return "unknown";
}

// Parses "debug" / "info" / "warning" / "error" / "off"; anything else yields fallback.
inline log_level parse_log_level(std::string_view s, log_level fallback = log_level::off) noexcept {
  if (s == "debug")   return log_level::debug;
  if (s == "info")    return log_level::info;
  if (s == "warning" || s == "warn") return log_level::warning;
  if (s == "error")   return log_level::error;
  if (s == "off")     return log_level::off;
  return fallback;
}

// Reads the level from an environment variable (LULL_LOG_LEVEL by default)
inline log_level log_level_from_env(const char* var = "LULL_LOG_LEVEL",
                                    log_level fallback = log_level::off) noexcept {
  const char* raw = std::getenv(var);
  if (raw == nullptr) return fallback;
  return parse_log_level(raw, fallback);
}

struct log_context {
  log_level level;
  std::string_view message;
  std::string_view file;
  int line;
  std::chrono::system_clock::time_point timestamp;
};

using log_function = std::function<void(const log_context&)>;

// Process-wide sink. Logging is off until a level is set explicitly.
class logger {
public:
  static logger& instance() {
    static logger inst;
    return inst;
  }

  // nullptr restores the default stderr sink
  void set_log_function(log_function fn) {
    std::lock_guard<std::mutex> lock(m_);
    fn_ = fn ? std::move(fn) : log_function(&default_log_function);
  }

  void set_log_level(log_level level) noexcept { min_level_.store(level, std::memory_order_relaxed); }
  log_level get_log_level() const noexcept { return min_level_.load(std::memory_order_relaxed); }

  bool enabled(log_level level) const noexcept {
    return level != log_level::off && level >= min_level_.load(std::memory_order_relaxed);
  }

  void log(log_level level, std::string_view message, std::string_view file, int line) {
    if (!enabled(level)) return;
    emit(level, message, file, line);
  }

  // An error nobody handles reaches the sink whatever the level
  void log_unhandled(std::string_view message, std::string_view file, int line) {
    emit(log_level::error, message, file, line);
  }

  template <class... Args>
  void log(log_level level, std::string_view file, int line,
           fmt::format_string<Args...> format, Args&&... args) {
    if (!enabled(level)) return;
    auto message = fmt::format(format, std::forward<Args>(args)...);
    log(level, message, file, line);
  }

  logger(const logger&) = delete;
  logger& operator=(const logger&) = delete;

private:
  logger() : fn_(&default_log_function), min_level_(log_level::off) {}

  void emit(log_level level, std::string_view message, std::string_view file, int line) {
    log_function fn;
    {
      std::lock_guard<std::mutex> lock(m_);
      fn = fn_;
    }
    if (fn) fn(log_context{level, message, file, line, std::chrono::system_clock::now()});
  }

  static void default_log_function(const log_context& ctx) {
    auto time = std::chrono::system_clock::to_time_t(ctx.timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      ctx.timestamp.time_since_epoch()) % 1000;

    auto file = ctx.file;
    if (auto pos = file.find_last_of("/\\"); pos != std::string_view::npos) {
      file = file.substr(pos + 1);
    }

    std::cerr << fmt::format(
      "[{:02d}:{:02d}:{:02d}.{:03d}] [lull] [{}] [{}:{}] {}\n",
      tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()),
      to_string(ctx.level), file, ctx.line, ctx.message);
  }

  std::mutex m_;
  log_function fn_;
  std::atomic<log_level> min_level_;
};

inline logger& get_logger() { return logger::instance(); }

inline void set_log_function(log_function fn) { logger::instance().set_log_function(std::move(fn)); }
inline void set_log_level(log_level level) { logger::instance().set_log_level(level); }

} // namespace lull

#define LULL_LOG_DEBUG(fmt, ...) \
  ::lull::get_logger().log(::lull::log_level::debug, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)

#define LULL_LOG_INFO(fmt, ...) \
  ::lull::get_logger().log(::lull::log_level::info, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)

#define LULL_LOG_WARNING(fmt, ...) \
  ::lull::get_logger().log(::lull::log_level::warning, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)

#define LULL_LOG_ERROR(fmt, ...) \
  ::lull::get_logger().log(::lull::log_level::error, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)
