#pragma once

#include <pipecoro/assert.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace pipecoro::detail {

/// Lock-free pending-request counter bounded by `max_pending_requests`.
///
/// - `try_acquire()` runs on the caller's thread so admission fails synchronously; a rejected
///   attempt leaves the counter untouched.
/// - Every accepted slot is returned exactly once through `release()` (see
///   `response_slot::release_slot()`).
/// - `close()` is sticky: later acquisitions fail with `result::closed`.
class admission_control {
 public:
  enum class result : std::uint8_t {
    accepted,
    queue_full,
    closed,
  };

  explicit admission_control(std::size_t max_pending) noexcept : max_(max_pending) {}

  admission_control(admission_control const&) = delete;
  auto operator=(admission_control const&) -> admission_control& = delete;

  [[nodiscard]] auto try_acquire() noexcept -> result {
    auto cur = pending_.load(std::memory_order_acquire);
    for (;;) {
      if (closed_.load(std::memory_order_acquire)) {
        return result::closed;
      }
      if (cur >= max_) {
        return result::queue_full;
      }
      if (pending_.compare_exchange_weak(cur, cur + 1, std::memory_order_acq_rel,
                                         std::memory_order_acquire)) {
        return result::accepted;
      }
    }
  }

  auto release() noexcept -> void {
    [[maybe_unused]] auto prev = pending_.fetch_sub(1, std::memory_order_acq_rel);
    PIPECORO_ASSERT(prev > 0, "admission slot released twice");
  }

  auto close() noexcept -> void { closed_.store(true, std::memory_order_release); }

  [[nodiscard]] auto is_closed() const noexcept -> bool {
    return closed_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto pending() const noexcept -> std::size_t {
    return pending_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto max_pending() const noexcept -> std::size_t { return max_; }

 private:
  std::size_t const max_;
  std::atomic<std::size_t> pending_{0};
  std::atomic<bool> closed_{false};
};

}  // namespace pipecoro::detail
