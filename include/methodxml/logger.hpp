#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <string>
#include <string_view>
#include <version>

#if defined(__cpp_lib_format) && __has_include(<format>)
#include <format>
namespace methodxml {
namespace format_impl = std;
}  // namespace methodxml
#else
#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif
#include <fmt/format.h>
namespace methodxml {
namespace format_impl = fmt;
}  // namespace methodxml
#endif

namespace methodxml {

enum class log_level {
  debug,
  info,
  warning,
  error,
  off,
};

constexpr auto to_string(log_level level) noexcept -> char const* {
  switch (level) {
    case log_level::debug:
      return "debug";
    case log_level::info:
      return "info";
    case log_level::warning:
      return "warning";
    case log_level::error:
      return "error";
    case log_level::off:
      return "off";
  }
  return "unknown";
}

struct log_context {
  log_level level;
  std::string_view message;
  std::string_view file;
  int line;
  std::chrono::system_clock::time_point timestamp;
};

using log_function = void (*)(void*, log_context const&);

/// Process-wide log sink.
///
/// Encoders are short-lived and created per method body, so the sink lives here rather than
/// in `config`. Logging is off until a level is set.
class logger {
 public:
  static auto instance() -> logger& {
    static logger inst;
    return inst;
  }

  // Not synchronized with concurrent log() calls; install the sink during startup.
  void set_log_function(log_function fn, void* user_data = nullptr) {
    if (fn == nullptr) {
      fn = &default_log_function;
      user_data = nullptr;
    }
    log_fn_ = fn;
    log_user_data_ = user_data;
  }

  void set_log_level(log_level level) { min_level_.store(level, std::memory_order_relaxed); }

  [[nodiscard]] auto get_log_level() const -> log_level {
    return min_level_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] auto enabled(log_level level) const -> bool {
    return level != log_level::off && level >= get_log_level();
  }

  void log(log_level level, std::string_view message, std::string_view file, int line) {
    if (!enabled(level)) {
      return;
    }

    log_context ctx{
      .level = level,
      .message = message,
      .file = file,
      .line = line,
      .timestamp = std::chrono::system_clock::now(),
    };
    log_fn_(log_user_data_, ctx);
  }

  template <typename... Args>
  void log(log_level level, std::string_view file, int line,
           format_impl::format_string<Args...> fmt, Args&&... args) {
    if (!enabled(level)) {
      return;
    }

    auto message = format_impl::format(fmt, std::forward<Args>(args)...);
    log(level, message, file, line);
  }

 private:
  logger() : log_fn_(&default_log_function), log_user_data_(nullptr), min_level_(log_level::off) {}

  static auto short_file(std::string_view path) -> std::string_view {
    // Keep the part below `include/` so headers show as `methodxml/writer.hpp`.
    constexpr std::string_view k_include_posix = "include/";
    constexpr std::string_view k_include_win = "include\\";
    if (auto pos = path.rfind(k_include_posix); pos != std::string_view::npos) {
      return path.substr(pos + k_include_posix.size());
    }
    if (auto pos = path.rfind(k_include_win); pos != std::string_view::npos) {
      return path.substr(pos + k_include_win.size());
    }
    if (auto pos = path.find_last_of("/\\"); pos != std::string_view::npos) {
      return path.substr(pos + 1);
    }
    return path;
  }

  static void default_log_function(void*, log_context const& ctx) {
    auto time = std::chrono::system_clock::to_time_t(ctx.timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);
    auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(ctx.timestamp.time_since_epoch()) %
      1000;

    auto formatted = format_impl::format(
      "[{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}] [methodxml] [{}] [{}:{}] {}",
      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
      static_cast<int>(ms.count()), to_string(ctx.level), short_file(ctx.file), ctx.line,
      ctx.message);

    std::cerr << formatted << std::endl;
  }

  log_function log_fn_;
  void* log_user_data_;
  std::atomic<log_level> min_level_;
};

inline auto get_logger() -> logger& { return logger::instance(); }

inline void set_log_function(log_function fn, void* user_data = nullptr) {
  logger::instance().set_log_function(fn, user_data);
}

inline void set_log_level(log_level level) { logger::instance().set_log_level(level); }

}  // namespace methodxml

#define METHODXML_LOG_DEBUG(fmt, ...)                                                    \
  ::methodxml::get_logger().log(::methodxml::log_level::debug, __FILE__, __LINE__, fmt \
                                __VA_OPT__(, ) __VA_ARGS__)

#define METHODXML_LOG_INFO(fmt, ...)                                                    \
  ::methodxml::get_logger().log(::methodxml::log_level::info, __FILE__, __LINE__, fmt \
                                __VA_OPT__(, ) __VA_ARGS__)

#define METHODXML_LOG_WARNING(fmt, ...)                                                    \
  ::methodxml::get_logger().log(::methodxml::log_level::warning, __FILE__, __LINE__, fmt \
                                __VA_OPT__(, ) __VA_ARGS__)

#define METHODXML_LOG_ERROR(fmt, ...)                                                    \
  ::methodxml::get_logger().log(::methodxml::log_level::error, __FILE__, __LINE__, fmt \
                                __VA_OPT__(, ) __VA_ARGS__)
