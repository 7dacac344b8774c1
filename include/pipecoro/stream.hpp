#pragma once

#include <pipecoro/error_info.hpp>
#include <pipecoro/expected.hpp>

#include <iocoro/awaitable.hpp>
#include <iocoro/condition_event.hpp>

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace pipecoro {

/// Pull-based asynchronous sequence with explicit cancellation.
///
/// Contract:
/// - `next()` yields the next item, `std::nullopt` once the sequence completed, or an error.
///   After completion or an error, further calls keep returning the same terminal result.
/// - A stream has a single consumer; `next()` must not be awaited concurrently.
/// - `cancel()` may be called from any thread, at most wakes a pending `next()`, and makes
///   later `next()` calls fail with `client_errc::operation_aborted`. It is idempotent and a
///   no-op on a stream that already terminated.
template <typename T>
class item_stream {
 public:
  using value_type = T;
  using result_type = expected<std::optional<T>, error_info>;

  virtual ~item_stream() = default;

  virtual auto next() -> iocoro::awaitable<result_type> = 0;

  virtual auto cancel() noexcept -> void {}
};

template <typename T>
using stream_ptr = std::unique_ptr<item_stream<T>>;

namespace detail {

template <typename T>
struct channel_state {
  std::mutex mtx;
  std::deque<T> items;
  std::optional<error_info> error;
  bool completed = false;
  bool cancelled = false;
  bool subscribed = false;
  iocoro::condition_event ready;
};

template <typename T>
class channel_stream final : public item_stream<T> {
 public:
  using result_type = typename item_stream<T>::result_type;

  explicit channel_stream(std::shared_ptr<channel_state<T>> st) : st_(std::move(st)) {}

  auto next() -> iocoro::awaitable<result_type> override {
    for (;;) {
      if (auto r = try_take()) {
        co_return std::move(*r);
      }
      (void)co_await st_->ready.async_wait();
    }
  }

  auto cancel() noexcept -> void override {
    {
      std::lock_guard lk{st_->mtx};
      if (st_->completed || st_->error.has_value()) {
        return;
      }
      st_->cancelled = true;
      st_->items.clear();
    }
    st_->ready.notify();
  }

 private:
  auto try_take() -> std::optional<result_type> {
    std::lock_guard lk{st_->mtx};
    st_->subscribed = true;
    if (st_->cancelled) {
      return result_type{unexpected(error_info{client_errc::operation_aborted})};
    }
    if (!st_->items.empty()) {
      auto item = std::move(st_->items.front());
      st_->items.pop_front();
      return result_type{std::optional<T>{std::move(item)}};
    }
    if (st_->error.has_value()) {
      return result_type{unexpected(*st_->error)};
    }
    if (st_->completed) {
      return result_type{std::optional<T>{}};
    }
    return std::nullopt;
  }

  std::shared_ptr<channel_state<T>> st_;
};

template <typename T>
class vector_stream final : public item_stream<T> {
 public:
  using result_type = typename item_stream<T>::result_type;

  explicit vector_stream(std::vector<T> items) : items_(std::move(items)) {}

  auto next() -> iocoro::awaitable<result_type> override {
    if (!done_.load(std::memory_order_acquire) && cancelled_.load(std::memory_order_acquire)) {
      co_return unexpected(error_info{client_errc::operation_aborted});
    }
    if (pos_ == items_.size()) {
      done_.store(true, std::memory_order_release);
      co_return result_type{std::optional<T>{}};
    }
    co_return result_type{std::optional<T>{std::move(items_[pos_++])}};
  }

  auto cancel() noexcept -> void override {
    if (!done_.load(std::memory_order_acquire)) {
      cancelled_.store(true, std::memory_order_release);
    }
  }

 private:
  std::vector<T> items_;
  std::size_t pos_{0};
  std::atomic<bool> done_{false};
  std::atomic<bool> cancelled_{false};
};

template <typename T>
class never_stream final : public item_stream<T> {
 public:
  using result_type = typename item_stream<T>::result_type;

  auto next() -> iocoro::awaitable<result_type> override {
    while (!cancelled_.load(std::memory_order_acquire)) {
      (void)co_await wakeup_.async_wait();
    }
    co_return unexpected(error_info{client_errc::operation_aborted});
  }

  auto cancel() noexcept -> void override {
    cancelled_.store(true, std::memory_order_release);
    wakeup_.notify();
  }

 private:
  std::atomic<bool> cancelled_{false};
  iocoro::condition_event wakeup_{};
};

template <typename T>
class failed_stream final : public item_stream<T> {
 public:
  using result_type = typename item_stream<T>::result_type;

  explicit failed_stream(error_info err) : err_(std::move(err)) {}

  auto next() -> iocoro::awaitable<result_type> override { co_return unexpected(err_); }

 private:
  error_info err_;
};

}  // namespace detail

/// Caller-fed stream: items pushed with `send()` are delivered in order to the single consumer
/// obtained from `stream()`. All members are thread-safe.
template <typename T>
class channel {
 public:
  channel() : st_(std::make_shared<detail::channel_state<T>>()) {}

  /// Returns false once the channel completed, failed or its consumer cancelled.
  auto send(T item) -> bool {
    {
      std::lock_guard lk{st_->mtx};
      if (st_->cancelled || st_->completed || st_->error.has_value()) {
        return false;
      }
      st_->items.push_back(std::move(item));
    }
    st_->ready.notify();
    return true;
  }

  auto complete() -> void {
    {
      std::lock_guard lk{st_->mtx};
      if (st_->cancelled || st_->error.has_value()) {
        return;
      }
      st_->completed = true;
    }
    st_->ready.notify();
  }

  auto fail(error_info err) -> void {
    {
      std::lock_guard lk{st_->mtx};
      if (st_->cancelled || st_->completed || st_->error.has_value()) {
        return;
      }
      st_->error = std::move(err);
    }
    st_->ready.notify();
  }

  [[nodiscard]] auto stream() const -> stream_ptr<T> {
    return std::make_unique<detail::channel_stream<T>>(st_);
  }

  /// True once the consumer pulled for the first time.
  [[nodiscard]] auto subscribed() const -> bool {
    std::lock_guard lk{st_->mtx};
    return st_->subscribed;
  }

  [[nodiscard]] auto cancelled() const -> bool {
    std::lock_guard lk{st_->mtx};
    return st_->cancelled;
  }

 private:
  std::shared_ptr<detail::channel_state<T>> st_;
};

template <typename T>
[[nodiscard]] auto from_vector(std::vector<T> items) -> stream_ptr<T> {
  return std::make_unique<detail::vector_stream<T>>(std::move(items));
}

template <typename T, typename... Rest>
[[nodiscard]] auto just(T first, Rest... rest) -> stream_ptr<T> {
  std::vector<T> items;
  items.reserve(1 + sizeof...(Rest));
  items.push_back(std::move(first));
  (items.push_back(T(std::move(rest))), ...);
  return from_vector(std::move(items));
}

/// A stream that never emits and only terminates when cancelled.
template <typename T>
[[nodiscard]] auto never() -> stream_ptr<T> {
  return std::make_unique<detail::never_stream<T>>();
}

/// A stream that fails immediately with `err`.
template <typename T>
[[nodiscard]] auto failed(error_info err) -> stream_ptr<T> {
  return std::make_unique<detail::failed_stream<T>>(std::move(err));
}

/// Drain `s` into a vector, stopping at the first error.
template <typename T>
auto collect(item_stream<T>& s) -> iocoro::awaitable<expected<std::vector<T>, error_info>> {
  std::vector<T> out;
  for (;;) {
    auto r = co_await s.next();
    if (!r) {
      co_return unexpected(std::move(r.error()));
    }
    if (!r->has_value()) {
      co_return expected<std::vector<T>, error_info>{std::move(out)};
    }
    out.push_back(std::move(**r));
  }
}

}  // namespace pipecoro
