#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#if defined(__cpp_lib_format) && __has_include(<format>)
#include <format>
namespace pipecoro {
namespace format_impl = std;
#else
#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif
#include <fmt/format.h>
namespace pipecoro {
namespace format_impl = fmt;
#endif

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
/// - Disabled (`log_level::off`) until the application picks a level.
/// - The sink is a plain function pointer plus user data so callers can route records into any
///   logging backend without this library depending on it.
/// - Level checks are lock-free; the sink itself must be installed before concurrent logging.
class logger {
 public:
  static auto instance() -> logger& {
    static logger inst;
    return inst;
  }

  /// Install a sink. Passing nullptr restores the stderr sink.
  void set_log_function(log_function fn, void* user_data = nullptr) {
    if (fn == nullptr) {
      log_fn_ = &stderr_sink;
      log_user_data_ = nullptr;
      return;
    }
    log_fn_ = fn;
    log_user_data_ = user_data;
  }

  void set_log_level(log_level level) { min_level_.store(level, std::memory_order_relaxed); }

  [[nodiscard]] auto get_log_level() const -> log_level {
    return min_level_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] auto enabled(log_level level) const noexcept -> bool {
    return level != log_level::off && level >= min_level_.load(std::memory_order_relaxed);
  }

  void log(log_level level, std::string_view message, std::string_view file, int line) {
    if (!enabled(level) || log_fn_ == nullptr) {
      return;
    }
    log_fn_(log_user_data_, log_context{
                              .level = level,
                              .message = message,
                              .file = file,
                              .line = line,
                              .timestamp = std::chrono::system_clock::now(),
                            });
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
  logger() : log_fn_(&stderr_sink), log_user_data_(nullptr), min_level_(log_level::off) {}

  /// Shorten `__FILE__` to the part below `include/pipecoro/`, or the basename otherwise.
  static auto short_file(std::string_view path) noexcept -> std::string_view {
    for (std::string_view marker : {std::string_view{"pipecoro/"}, std::string_view{"pipecoro\\"}}) {
      if (auto pos = path.rfind(marker); pos != std::string_view::npos) {
        return path.substr(pos + marker.size());
      }
    }
    if (auto pos = path.find_last_of("/\\"); pos != std::string_view::npos) {
      return path.substr(pos + 1);
    }
    return path;
  }

  static void stderr_sink(void*, log_context const& ctx) {
    auto time = std::chrono::system_clock::to_time_t(ctx.timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                ctx.timestamp.time_since_epoch()) %
              1000;

    std::cerr << format_impl::format(
                   "[{:02d}:{:02d}:{:02d}.{:03d}] [pipecoro] [{}] [{}:{}] {}", tm.tm_hour,
                   tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()), to_string(ctx.level),
                   short_file(ctx.file), ctx.line, ctx.message)
              << '\n';
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

}  // namespace pipecoro

#define PIPECORO_LOG_DEBUG(fmt, ...)                                                         \
  ::pipecoro::get_logger().log(::pipecoro::log_level::debug, __FILE__, __LINE__, \
                               fmt __VA_OPT__(, ) __VA_ARGS__)

#define PIPECORO_LOG_INFO(fmt, ...)                                                         \
  ::pipecoro::get_logger().log(::pipecoro::log_level::info, __FILE__, __LINE__, \
                               fmt __VA_OPT__(, ) __VA_ARGS__)

#define PIPECORO_LOG_WARNING(fmt, ...)                                                         \
  ::pipecoro::get_logger().log(::pipecoro::log_level::warning, __FILE__, __LINE__, \
                               fmt __VA_OPT__(, ) __VA_ARGS__)

#define PIPECORO_LOG_ERROR(fmt, ...)                                                         \
  ::pipecoro::get_logger().log(::pipecoro::log_level::error, __FILE__, __LINE__, \
                               fmt __VA_OPT__(, ) __VA_ARGS__)
