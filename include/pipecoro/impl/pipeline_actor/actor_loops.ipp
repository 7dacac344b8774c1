#pragma once

#include <pipecoro/detail/pipeline_actor.hpp>

#include <iocoro/bind_executor.hpp>
#include <iocoro/co_spawn.hpp>
#include <iocoro/this_coro.hpp>
#include <iocoro/when_all.hpp>

#include <utility>

namespace pipecoro::detail {

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::actor_loop() -> iocoro::awaitable<void> {
  // Both loops are joined here and share the actor's stop token.
  auto const stop = co_await iocoro::this_coro::stop_token;
  auto const strand = executor_.strand().executor();
  auto on_strand = [&](iocoro::awaitable<void> loop) {
    return iocoro::co_spawn(strand, stop, iocoro::bind_executor(strand, std::move(loop)),
                            iocoro::use_awaitable);
  };

  PIPECORO_LOG_DEBUG("pipeline actor start: max_pending={}", admission_->max_pending());
  (void)co_await iocoro::when_all(on_strand(write_loop()), on_strand(read_loop()));
  PIPECORO_LOG_DEBUG("pipeline actor end: pending={}", admission_->pending());
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::write_loop() -> iocoro::awaitable<void> {
  auto tok = co_await iocoro::this_coro::stop_token;
  PIPECORO_LOG_DEBUG("write loop start");
  while (!tok.stop_requested() && !closed_) {
    auto req = queue_.next_to_write();
    if (!req) {
      (void)co_await write_wakeup_.async_wait();
      continue;
    }

    co_await do_write(std::move(req));
  }

  PIPECORO_LOG_DEBUG("write loop stop");
  co_return;
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::read_loop() -> iocoro::awaitable<void> {
  auto tok = co_await iocoro::this_coro::stop_token;
  PIPECORO_LOG_DEBUG("read loop start");
  while (!tok.stop_requested() && !closed_) {
    auto head = queue_.front();
    if (!head || head->state != request_state::awaiting_read) {
      (void)co_await read_wakeup_.async_wait();
      continue;
    }

    co_await do_read(std::move(head));
  }

  PIPECORO_LOG_DEBUG("read loop stop");
  co_return;
}

}  // namespace pipecoro::detail
