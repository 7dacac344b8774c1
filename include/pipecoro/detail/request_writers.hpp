#pragma once

#include <pipecoro/detail/pending_request.hpp>
#include <pipecoro/duplex_connection.hpp>
#include <pipecoro/error.hpp>
#include <pipecoro/error_info.hpp>
#include <pipecoro/expected.hpp>
#include <pipecoro/flush_strategy.hpp>
#include <pipecoro/stream.hpp>

#include <iocoro/awaitable.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <utility>

namespace pipecoro::detail {

/// Forwards `inner` and cancels it as soon as `stop` is requested.
template <typename T>
class stoppable_stream final : public item_stream<T> {
 public:
  using result_type = typename item_stream<T>::result_type;

  stoppable_stream(stream_ptr<T> inner, std::stop_token stop)
      : inner_(std::move(inner)), stop_(std::move(stop)) {
    on_stop_.emplace(stop_, canceller{inner_.get()});
  }

  auto next() -> iocoro::awaitable<result_type> override {
    if (stop_.stop_requested()) {
      co_return unexpected(error_info{client_errc::operation_aborted});
    }
    co_return co_await inner_->next();
  }

  auto cancel() noexcept -> void override { inner_->cancel(); }

 private:
  struct canceller {
    item_stream<T>* target;
    auto operator()() noexcept -> void { target->cancel(); }
  };

  stream_ptr<T> inner_;
  std::stop_token stop_;
  // Declared last: the callback must be unregistered before `inner_` goes away.
  std::optional<std::stop_callback<canceller>> on_stop_{};
};

/// Writes a caller-supplied outbound stream through the connection's write path.
template <typename Req, typename Resp>
class sequence_writer final : public request_writer {
 public:
  sequence_writer(std::shared_ptr<duplex_connection<Req, Resp>> conn, stream_ptr<Req> source,
                  flush_strategy_ptr strategy)
      : conn_(std::move(conn)), source_(std::move(source)), strategy_(std::move(strategy)) {}

  auto write(std::stop_token stop) -> iocoro::awaitable<expected<void, error_info>> override {
    stream_ptr<Req> guarded =
      std::make_unique<stoppable_stream<Req>>(std::move(source_), std::move(stop));
    co_return co_await conn_->write(std::move(guarded), strategy_);
  }

 private:
  std::shared_ptr<duplex_connection<Req, Resp>> conn_;
  stream_ptr<Req> source_;
  flush_strategy_ptr strategy_;
};

/// Runs a caller-supplied write action; the caller decides when and how it writes.
class function_writer final : public request_writer {
 public:
  using function = std::function<iocoro::awaitable<expected<void, error_info>>(std::stop_token)>;

  explicit function_writer(function fn) : fn_(std::move(fn)) {}

  auto write(std::stop_token stop) -> iocoro::awaitable<expected<void, error_info>> override {
    co_return co_await fn_(std::move(stop));
  }

 private:
  function fn_;
};

}  // namespace pipecoro::detail
