#pragma once

#include <pipecoro/assert.hpp>
#include <pipecoro/detail/admission_control.hpp>
#include <pipecoro/error.hpp>
#include <pipecoro/error_info.hpp>
#include <pipecoro/expected.hpp>
#include <pipecoro/stream.hpp>

#include <iocoro/awaitable.hpp>
#include <iocoro/condition_event.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace pipecoro::detail {

/// Shared state between one admitted request and the stream returned to its caller.
///
/// Producer side (connection strand only): `deliver()`, `complete()`, `fail()`.
/// Consumer side (any executor): `next()`, `cancel()`.
///
/// Slot accounting (CRITICAL):
/// - The slot owns one unit of `admission_control`; `release_slot()` returns it exactly once.
/// - The producer releases before completing or failing, and the consumer releases when it
///   cancels, so the pending count has already dropped when the caller observes the terminal
///   event.
///
/// Items are buffered without bound; the read slice of one response is expected to be small.
template <typename Resp>
class response_slot {
 public:
  using result_type = expected<std::optional<Resp>, error_info>;

  explicit response_slot(std::shared_ptr<admission_control> admission)
      : admission_(std::move(admission)) {}

  response_slot(response_slot const&) = delete;
  auto operator=(response_slot const&) -> response_slot& = delete;

  auto deliver(Resp item) -> void {
    {
      std::lock_guard lk{mtx_};
      if (status_ != status::open) {
        return;
      }
      items_.push_back(std::move(item));
    }
    ready_.notify();
  }

  auto complete() -> void { finish(status::completed, error_info{}); }

  auto fail(error_info err) -> void { finish(status::failed, std::move(err)); }

  /// Transition an open slot to cancelled; buffered items are dropped.
  /// Returns false when the slot already reached a terminal state.
  auto cancel() -> bool {
    {
      std::lock_guard lk{mtx_};
      if (status_ != status::open) {
        return false;
      }
      status_ = status::cancelled;
      items_.clear();
    }
    ready_.notify();
    return true;
  }

  auto release_slot() noexcept -> void {
    if (!released_.exchange(true, std::memory_order_acq_rel) && admission_) {
      admission_->release();
    }
  }

  [[nodiscard]] auto is_cancelled() const -> bool {
    std::lock_guard lk{mtx_};
    return status_ == status::cancelled;
  }

  auto next() -> iocoro::awaitable<result_type> {
    for (;;) {
      if (auto r = try_take()) {
        co_return std::move(*r);
      }
      (void)co_await ready_.async_wait();
    }
  }

 private:
  enum class status : std::uint8_t {
    open,
    completed,
    failed,
    cancelled,
  };

  auto finish(status s, error_info err) -> void {
    {
      std::lock_guard lk{mtx_};
      if (status_ != status::open) {
        return;
      }
      PIPECORO_ASSERT(released_.load(std::memory_order_acquire),
                      "slot must be released before the request terminates");
      status_ = s;
      error_ = std::move(err);
    }
    ready_.notify();
  }

  auto try_take() -> std::optional<result_type> {
    std::lock_guard lk{mtx_};
    if (!items_.empty()) {
      auto item = std::move(items_.front());
      items_.pop_front();
      return result_type{std::optional<Resp>{std::move(item)}};
    }
    switch (status_) {
      case status::open:
        return std::nullopt;
      case status::completed:
        return result_type{std::optional<Resp>{}};
      case status::failed:
        return result_type{unexpected(error_)};
      case status::cancelled:
        return result_type{unexpected(error_info{client_errc::operation_aborted})};
    }
    PIPECORO_UNREACHABLE();
  }

  std::shared_ptr<admission_control> admission_;
  std::atomic<bool> released_{false};

  mutable std::mutex mtx_;
  std::deque<Resp> items_{};
  status status_{status::open};
  error_info error_{};
  iocoro::condition_event ready_{};
};

/// The result stream handed to callers of `pipelined_connection::request()`.
///
/// Cancelling (or destroying) it before the response terminated cancels the request: the slot is
/// released at once and `on_cancel` hands the cancellation over to the connection strand.
template <typename Resp>
class response_stream final : public item_stream<Resp> {
 public:
  using result_type = typename item_stream<Resp>::result_type;
  using cancel_hook = std::function<void()>;

  response_stream(std::shared_ptr<response_slot<Resp>> slot, cancel_hook on_cancel)
      : slot_(std::move(slot)), on_cancel_(std::move(on_cancel)) {}

  ~response_stream() override { cancel(); }

  response_stream(response_stream const&) = delete;
  auto operator=(response_stream const&) -> response_stream& = delete;

  auto next() -> iocoro::awaitable<result_type> override { co_return co_await slot_->next(); }

  auto cancel() noexcept -> void override {
    if (!slot_->cancel()) {
      return;
    }
    slot_->release_slot();
    if (on_cancel_) {
      on_cancel_();
    }
  }

 private:
  std::shared_ptr<response_slot<Resp>> slot_;
  cancel_hook on_cancel_;
};

}  // namespace pipecoro::detail
