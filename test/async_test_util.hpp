#pragma once

#include <pipecoro/error_info.hpp>
#include <pipecoro/stream.hpp>

#include <iocoro/co_sleep.hpp>
#include <iocoro/co_spawn.hpp>
#include <iocoro/expected.hpp>
#include <iocoro/io_context.hpp>
#include <iocoro/work_guard.hpp>

#include <pipecoro/src.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace pipecoro::test_util {

inline void fail_and_stop_on_exception(std::exception_ptr eptr) {
  if (!eptr) {
    return;
  }
  try {
    std::rethrow_exception(eptr);
  } catch (std::exception const& e) {
    ADD_FAILURE() << "Unhandled exception in spawned coroutine: " << e.what();
  } catch (...) {
    ADD_FAILURE() << "Unhandled unknown exception in spawned coroutine";
  }
}

/// Run a coroutine on the given io_context until completion.
///
/// - Uses completion-token `co_spawn` so exceptions are captured and reported
template <class Factory>
inline void run_async(iocoro::io_context& ctx, Factory&& factory) {
  auto guard = std::make_shared<iocoro::work_guard<iocoro::executor>>(ctx.get_executor());

  iocoro::co_spawn(
      ctx.get_executor(),
      [f = std::forward<Factory>(factory)]() mutable -> iocoro::awaitable<void> { co_await f(); },
      [&](iocoro::expected<void, std::exception_ptr> r) mutable {
        guard->reset();
        if (!r) {
          fail_and_stop_on_exception(r.error());
        }
      });

  ctx.run();
}

/// Poll `pred` until it holds or `timeout` elapses. Returns the final value of `pred`.
template <class Pred>
auto wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds{2000})
  -> iocoro::awaitable<bool> {
  auto const deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      co_return pred();
    }
    co_await iocoro::co_sleep(std::chrono::milliseconds{1});
  }
  co_return true;
}

/// Give posted work a chance to run.
inline auto settle(std::chrono::milliseconds d = std::chrono::milliseconds{10})
  -> iocoro::awaitable<void> {
  co_await iocoro::co_sleep(d);
}

/// What a background consumer observed on a result stream.
template <typename T>
struct stream_outcome {
  std::vector<T> items{};
  std::optional<error_info> error{};
  bool done{false};

  [[nodiscard]] auto ok() const -> bool { return done && !error.has_value(); }
};

template <typename T>
auto drain_into(stream_ptr<T> s, std::shared_ptr<stream_outcome<T>> out) -> iocoro::awaitable<void> {
  for (;;) {
    auto r = co_await s->next();
    if (!r) {
      out->error = std::move(r.error());
      break;
    }
    if (!r->has_value()) {
      break;
    }
    out->items.push_back(std::move(**r));
  }
  out->done = true;
}

/// Consume `s` on `ex` in the background; the returned outcome fills in as items arrive.
template <typename T, typename Executor>
auto consume(Executor ex, stream_ptr<T> s) -> std::shared_ptr<stream_outcome<T>> {
  auto out = std::make_shared<stream_outcome<T>>();
  iocoro::co_spawn(ex, drain_into<T>(std::move(s), out), iocoro::detached);
  return out;
}

}  // namespace pipecoro::test_util
