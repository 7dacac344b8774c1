#pragma once

#include <pipecoro/flush_strategy.hpp>

#include <iocoro/co_sleep.hpp>
#include <iocoro/co_spawn.hpp>

#include <cstdint>
#include <stdexcept>

namespace pipecoro {
namespace detail {

class each_item_policy final : public flush_policy {
 public:
  explicit each_item_policy(std::shared_ptr<flush_signals> signals)
      : signals_(std::move(signals)) {}

  auto on_item() -> void override { signals_->signal_flush(); }

  auto on_complete() -> void override {}

 private:
  std::shared_ptr<flush_signals> signals_;
};

class on_end_policy final : public flush_policy {
 public:
  explicit on_end_policy(std::shared_ptr<flush_signals> signals) : signals_(std::move(signals)) {}

  auto on_item() -> void override {}

  auto on_complete() -> void override { signals_->signal_flush(); }

 private:
  std::shared_ptr<flush_signals> signals_;
};

/// Shared between a batch policy and its pending window timer.
/// `generation` advances on every flush so a timer armed for an older batch does nothing.
struct batch_state {
  std::mutex mtx;
  std::shared_ptr<flush_signals> signals;
  std::size_t unflushed{0};
  std::uint64_t generation{0};
  bool timer_armed{false};

  // Caller holds mtx.
  auto take_batch() -> bool {
    if (unflushed == 0) {
      return false;
    }
    unflushed = 0;
    generation += 1;
    timer_armed = false;
    return true;
  }
};

class batch_policy final : public flush_policy {
 public:
  batch_policy(iocoro::any_executor ex, std::shared_ptr<flush_signals> signals,
               std::size_t batch_size, std::chrono::milliseconds window)
      : ex_(std::move(ex)),
        st_(std::make_shared<batch_state>()),
        batch_size_(batch_size),
        window_(window) {
    st_->signals = std::move(signals);
  }

  auto on_item() -> void override {
    bool flush = false;
    bool arm = false;
    std::uint64_t gen = 0;
    {
      std::lock_guard lk{st_->mtx};
      st_->unflushed += 1;
      if (st_->unflushed >= batch_size_) {
        flush = st_->take_batch();
      } else if (window_.count() > 0 && !st_->timer_armed) {
        st_->timer_armed = true;
        arm = true;
        gen = st_->generation;
      }
    }

    if (flush) {
      st_->signals->signal_flush();
    }
    if (arm) {
      iocoro::co_spawn(ex_, window_elapsed(st_, gen, window_), iocoro::detached);
    }
  }

  auto on_complete() -> void override {
    bool flush = false;
    {
      std::lock_guard lk{st_->mtx};
      flush = st_->take_batch();
    }
    if (flush) {
      st_->signals->signal_flush();
    }
  }

 private:
  static auto window_elapsed(std::weak_ptr<batch_state> weak, std::uint64_t gen,
                             std::chrono::milliseconds window) -> iocoro::awaitable<void> {
    co_await iocoro::co_sleep(window);

    auto st = weak.lock();
    if (!st) {
      co_return;
    }
    bool flush = false;
    {
      std::lock_guard lk{st->mtx};
      flush = st->generation == gen && st->take_batch();
    }
    if (flush) {
      st->signals->signal_flush();
    }
  }

  iocoro::any_executor ex_;
  std::shared_ptr<batch_state> st_;
  std::size_t batch_size_;
  std::chrono::milliseconds window_;
};

class each_item_strategy final : public flush_strategy {
 public:
  auto name() const noexcept -> std::string_view override { return "flush_on_each"; }

  auto make_policy(iocoro::any_executor, std::shared_ptr<flush_signals> signals) const
    -> std::unique_ptr<flush_policy> override {
    return std::make_unique<each_item_policy>(std::move(signals));
  }
};

class on_end_strategy final : public flush_strategy {
 public:
  auto name() const noexcept -> std::string_view override { return "flush_on_end"; }

  auto make_policy(iocoro::any_executor, std::shared_ptr<flush_signals> signals) const
    -> std::unique_ptr<flush_policy> override {
    return std::make_unique<on_end_policy>(std::move(signals));
  }
};

class batch_strategy final : public flush_strategy {
 public:
  batch_strategy(std::size_t batch_size, std::chrono::milliseconds window)
      : batch_size_(batch_size), window_(window) {}

  auto name() const noexcept -> std::string_view override { return "batch_flush"; }

  auto make_policy(iocoro::any_executor ex, std::shared_ptr<flush_signals> signals) const
    -> std::unique_ptr<flush_policy> override {
    return std::make_unique<batch_policy>(std::move(ex), std::move(signals), batch_size_,
                                          window_);
  }

 private:
  std::size_t batch_size_;
  std::chrono::milliseconds window_;
};

}  // namespace detail

inline auto flush_on_each() -> flush_strategy_ptr {
  static auto const instance = std::make_shared<detail::each_item_strategy>();
  return instance;
}

inline auto flush_on_end() -> flush_strategy_ptr {
  static auto const instance = std::make_shared<detail::on_end_strategy>();
  return instance;
}

inline auto batch_flush(std::size_t batch_size, std::chrono::milliseconds window)
  -> flush_strategy_ptr {
  if (batch_size == 0) {
    throw std::invalid_argument("batch_flush: batch_size must be positive");
  }
  if (window.count() < 0) {
    throw std::invalid_argument("batch_flush: window must not be negative");
  }
  return std::make_shared<detail::batch_strategy>(batch_size, window);
}

inline auto default_flush_strategy() -> flush_strategy_ptr { return flush_on_each(); }

}  // namespace pipecoro
