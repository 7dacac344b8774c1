#pragma once

#include <pipecoro/detail/response_slot.hpp>
#include <pipecoro/error_info.hpp>
#include <pipecoro/expected.hpp>
#include <pipecoro/tracing.hpp>

#include <iocoro/awaitable.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stop_token>

namespace pipecoro::detail {

enum class request_state : std::uint8_t {
  queued,
  writing,
  awaiting_read,
  reading,
  completed,
  failed,
  cancelled,
};

constexpr auto to_string(request_state s) noexcept -> char const* {
  switch (s) {
    case request_state::queued:
      return "queued";
    case request_state::writing:
      return "writing";
    case request_state::awaiting_read:
      return "awaiting_read";
    case request_state::reading:
      return "reading";
    case request_state::completed:
      return "completed";
    case request_state::failed:
      return "failed";
    case request_state::cancelled:
      return "cancelled";
  }
  return "unknown";
}

[[nodiscard]] constexpr auto is_terminal(request_state s) noexcept -> bool {
  return s == request_state::completed || s == request_state::failed ||
         s == request_state::cancelled;
}

/// Deferred write of one request, run once when the request reaches the write phase.
///
/// `stop` fires when the request is cancelled or the connection fails; implementations should
/// return promptly once it does.
class request_writer {
 public:
  virtual ~request_writer() = default;

  virtual auto write(std::stop_token stop) -> iocoro::awaitable<expected<void, error_info>> = 0;
};

/// One admitted request. Owned by the connection strand until it reaches a terminal state.
template <typename Resp>
struct pending_request {
  std::uint64_t id{};
  request_state state{request_state::queued};
  std::unique_ptr<request_writer> writer{};
  std::stop_source stop{};
  std::shared_ptr<response_slot<Resp>> slot{};

  request_kind kind{request_kind::sequence};
  std::chrono::steady_clock::time_point admitted_at{};
  std::size_t items_read{0};
};

}  // namespace pipecoro::detail
