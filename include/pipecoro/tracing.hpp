#pragma once

#include <pipecoro/error_info.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>

namespace pipecoro {

/// Which `request()` front end admitted the request.
enum class request_kind : std::uint8_t {
  sequence = 0,
  value,
  writer,
};

constexpr auto to_string(request_kind kind) noexcept -> char const* {
  switch (kind) {
    case request_kind::sequence:
      return "sequence";
    case request_kind::value:
      return "value";
    case request_kind::writer:
      return "writer";
  }
  return "unknown";
}

/// How a traced request ended.
enum class request_outcome : std::uint8_t {
  completed = 0,
  failed,
  cancelled,
  rejected,
};

constexpr auto to_string(request_outcome outcome) noexcept -> char const* {
  switch (outcome) {
    case request_outcome::completed:
      return "completed";
    case request_outcome::failed:
      return "failed";
    case request_outcome::cancelled:
      return "cancelled";
    case request_outcome::rejected:
      return "rejected";
  }
  return "unknown";
}

struct request_trace_info {
  std::uint64_t id{};
  request_kind kind{request_kind::sequence};
};

struct request_trace_start {
  request_trace_info info{};
  /// Pending requests on the connection including this one.
  std::size_t pending{0};
};

struct request_trace_finish {
  request_trace_info info{};
  request_outcome outcome{request_outcome::completed};

  // From admission to the terminal event, including time spent queued.
  std::chrono::nanoseconds duration{};

  std::size_t items_read{0};

  /// Default constructed unless the request failed or was rejected.
  std::error_code primary_error{};

  /// Lifetime: valid only during the callback.
  std::string_view primary_error_detail{};
};

/// Request-level instrumentation hooks.
///
/// Threading contract:
/// - `on_start` and most `on_finish` calls run on the connection strand.
/// - `on_finish` for `request_outcome::rejected` runs on the thread that called `request()`.
/// - Implementations must be non-blocking and must not throw.
struct request_trace_hooks {
  using on_start_fn = void (*)(void*, request_trace_start const&);
  using on_finish_fn = void (*)(void*, request_trace_finish const&);

  void* user_data{};
  on_start_fn on_start{};
  on_finish_fn on_finish{};

  [[nodiscard]] constexpr bool enabled() const noexcept {
    return on_start != nullptr || on_finish != nullptr;
  }
};

}  // namespace pipecoro
