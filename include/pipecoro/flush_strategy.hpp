#pragma once

#include <pipecoro/stream.hpp>

#include <iocoro/any_executor.hpp>
#include <iocoro/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

namespace pipecoro {

/// Side channel of flush hints produced while an outbound stream is written.
///
/// The write path installs a listener before it starts pulling items; every `signal_flush()`
/// invokes it synchronously on the signalling thread. Signals are counted even without a
/// listener. Thread-safe.
class flush_signals {
 public:
  using listener = std::function<void()>;

  auto set_listener(listener fn) -> void {
    std::lock_guard lk{mtx_};
    listener_ = std::move(fn);
  }

  auto signal_flush() -> void {
    listener fn;
    {
      std::lock_guard lk{mtx_};
      count_ += 1;
      fn = listener_;
    }
    if (fn) {
      fn();
    }
  }

  [[nodiscard]] auto count() const -> std::size_t {
    std::lock_guard lk{mtx_};
    return count_;
  }

 private:
  mutable std::mutex mtx_;
  listener listener_{};
  std::size_t count_{0};
};

/// Per-write flush decision state created by a `flush_strategy`.
///
/// Driven by the flushing stage, from the consumer's context:
/// - `on_item()` once per item, after the write path accepted it
/// - `on_complete()` once, when the outbound stream completes (not on error or cancellation)
class flush_policy {
 public:
  virtual ~flush_policy() = default;

  virtual auto on_item() -> void = 0;

  virtual auto on_complete() -> void = 0;
};

/// Decides when a write should be flushed. Strategies are immutable and shareable across
/// writes and threads; all per-write state lives in the `flush_policy` they create.
class flush_strategy {
 public:
  virtual ~flush_strategy() = default;

  [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;

  /// `ex` runs time-based flushes; `signals` receives every flush the policy decides on.
  [[nodiscard]] virtual auto make_policy(iocoro::any_executor ex,
                                         std::shared_ptr<flush_signals> signals) const
    -> std::unique_ptr<flush_policy> = 0;
};

using flush_strategy_ptr = std::shared_ptr<flush_strategy const>;

/// Result of `apply()`: the outbound items, unchanged, and their flush signals.
template <typename T>
struct flush_holder {
  stream_ptr<T> source;
  std::shared_ptr<flush_signals> signals;
};

/// One flush after every item.
[[nodiscard]] auto flush_on_each() -> flush_strategy_ptr;

/// One flush when the outbound stream completes.
[[nodiscard]] auto flush_on_end() -> flush_strategy_ptr;

/// A flush after every `batch_size` items, when `window` elapses with unflushed items (a zero
/// window disables the timer), and at completion if items are left unflushed.
[[nodiscard]] auto batch_flush(std::size_t batch_size,
                               std::chrono::milliseconds window = std::chrono::milliseconds{0})
  -> flush_strategy_ptr;

/// Strategy used when the caller does not pick one: flush after each item.
[[nodiscard]] auto default_flush_strategy() -> flush_strategy_ptr;

namespace detail {

/// Pipeline stage applying a `flush_policy` to a stream.
///
/// The flush owed for an item is emitted when the consumer asks for the next one, so it always
/// follows the write path's acceptance of that item and precedes the wait for the next.
template <typename T>
class flushing_stream final : public item_stream<T> {
 public:
  using result_type = typename item_stream<T>::result_type;

  flushing_stream(stream_ptr<T> source, std::unique_ptr<flush_policy> policy)
      : source_(std::move(source)), policy_(std::move(policy)) {}

  auto next() -> iocoro::awaitable<result_type> override {
    if (owed_) {
      owed_ = false;
      policy_->on_item();
    }

    auto r = co_await source_->next();
    if (!r) {
      co_return r;
    }
    if (!r->has_value()) {
      if (!completed_) {
        completed_ = true;
        policy_->on_complete();
      }
      co_return r;
    }

    owed_ = true;
    co_return r;
  }

  auto cancel() noexcept -> void override { source_->cancel(); }

 private:
  stream_ptr<T> source_;
  std::unique_ptr<flush_policy> policy_;
  bool owed_{false};
  bool completed_{false};
};

}  // namespace detail

/// Split `source` into the items to write and the flush signals decided by `strategy`.
template <typename T>
[[nodiscard]] auto apply(flush_strategy const& strategy, stream_ptr<T> source,
                         iocoro::any_executor ex) -> flush_holder<T> {
  auto signals = std::make_shared<flush_signals>();
  auto policy = strategy.make_policy(std::move(ex), signals);
  return flush_holder<T>{
    .source = std::make_unique<detail::flushing_stream<T>>(std::move(source), std::move(policy)),
    .signals = std::move(signals),
  };
}

}  // namespace pipecoro

#include <pipecoro/impl/flush_strategy.ipp>
