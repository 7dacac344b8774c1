#pragma once

#include <pipecoro/detail/pipeline_actor.hpp>

#include <iocoro/this_coro.hpp>

#include <exception>
#include <utility>

namespace pipecoro::detail {

/// Marks one direction of the transport busy for the lifetime of a do_write()/do_read() call.
struct in_flight_guard {
  bool& flag;
  in_flight_guard(bool& f, [[maybe_unused]] char const* what) : flag(f) {
    PIPECORO_ASSERT(!flag, what);
    flag = true;
  }
  ~in_flight_guard() { flag = false; }

  in_flight_guard(in_flight_guard const&) = delete;
  auto operator=(in_flight_guard const&) -> in_flight_guard& = delete;
};

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::do_write(request_ptr req) -> iocoro::awaitable<void> {
  in_flight_guard guard{write_in_flight_, "concurrent write detected"};

  req->state = request_state::writing;
  PIPECORO_LOG_DEBUG("write start: id={}", req->id);

  expected<void, error_info> r{};
  try {
    r = co_await req->writer->write(req->stop.get_token());
  } catch (...) {
    r = unexpected(make_internal_error(std::current_exception(), "request writer", req->id));
  }
  req->writer.reset();

  // User write actions may resume elsewhere.
  co_await iocoro::this_coro::switch_to(executor_.strand().executor());

  if (req->state != request_state::writing) {
    // Cancelled or failed by fail_all() while the write was in flight.
    PIPECORO_LOG_DEBUG("write returned after request left the write phase: id={} state={}",
                       req->id, to_string(req->state));
    co_return;
  }

  if (!r) {
    auto& cause = r.error();
    if (cause.is(client_errc::connection_closed)) {
      on_connection_failure(std::move(cause));
      co_return;
    }
    auto err = cause.is(client_errc::internal_error)
                 ? std::move(cause)
                 : error_info::wrap(client_errc::write_failed, cause);
    PIPECORO_LOG_DEBUG("write failed: id={} err={}", req->id, err.to_string());
    fail_request(req, std::move(err));
    co_return;
  }

  req->state = request_state::awaiting_read;
  PIPECORO_LOG_DEBUG("write done: id={}", req->id);
  read_wakeup_.notify();
  co_return;
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::do_read(request_ptr req) -> iocoro::awaitable<void> {
  in_flight_guard guard{read_in_flight_, "concurrent read detected"};

  req->state = request_state::reading;
  auto const stop = req->stop.get_token();
  PIPECORO_LOG_DEBUG("read start: id={}", req->id);

  for (;;) {
    auto r = co_await conn_->read(stop);
    // Transports may complete reads on their own IO context.
    co_await iocoro::this_coro::switch_to(executor_.strand().executor());

    if (req->state != request_state::reading) {
      // Cancelled or failed meanwhile; whatever was read belongs to nobody.
      PIPECORO_LOG_DEBUG("read returned after request left the read phase: id={} state={}",
                         req->id, to_string(req->state));
      co_return;
    }

    if (!r) {
      auto& cause = r.error();
      if (cause.is(client_errc::connection_closed)) {
        on_connection_failure(std::move(cause));
        co_return;
      }
      auto err = error_info::wrap(client_errc::read_failed, cause);
      PIPECORO_LOG_DEBUG("read failed: id={} err={}", req->id, err.to_string());
      fail_request(req, std::move(err));
      co_return;
    }

    if (!r->has_value()) {
      complete_request(req);
      co_return;
    }

    auto& item = **r;
    bool const terminal = conn_->is_terminal(item);
    req->items_read += 1;
    req->slot->deliver(std::move(item));
    if (terminal) {
      complete_request(req);
      co_return;
    }
  }
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::complete_request(request_ptr const& req) -> void {
  req->state = request_state::completed;
  (void)queue_.remove(req->id);

  // Release before completing: the caller must see the freed slot once its stream ends.
  req->slot->release_slot();
  req->slot->complete();

  PIPECORO_LOG_DEBUG("request completed: id={} items={} pending={}", req->id, req->items_read,
                     admission_->pending());
  trace_finish(*req, request_outcome::completed, nullptr);
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::fail_request(request_ptr const& req, error_info err) -> void {
  req->state = request_state::failed;
  (void)queue_.remove(req->id);
  req->stop.request_stop();

  req->slot->release_slot();
  trace_finish(*req, request_outcome::failed, &err);
  req->slot->fail(std::move(err));

  read_wakeup_.notify();
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::on_cancel(std::uint64_t id) -> void {
  auto req = queue_.remove(id);
  if (!req) {
    // Already terminal: completed, failed, or never reached the queue.
    return;
  }

  auto const phase = req->state;
  req->state = request_state::cancelled;
  req->stop.request_stop();

  PIPECORO_LOG_DEBUG("request cancelled: id={} phase={} pending={}", id, to_string(phase),
                     admission_->pending());
  trace_finish(*req, request_outcome::cancelled, nullptr);

  write_wakeup_.notify();
  read_wakeup_.notify();
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::fail_all(error_info err) -> void {
  if (closed_) {
    return;
  }
  closed_ = true;
  admission_->close();
  stop_.request_stop();

  auto drained = queue_.drain();
  PIPECORO_LOG_DEBUG("pipeline closing: pending={} err={}", drained.size(), err.to_string());
  for (auto const& req : drained) {
    req->state = request_state::failed;
    req->stop.request_stop();
    req->slot->release_slot();
    trace_finish(*req, request_outcome::failed, &err);
    req->slot->fail(err);
  }

  write_wakeup_.notify();
  read_wakeup_.notify();
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::on_connection_failure(error_info err) -> void {
  if (closed_) {
    return;
  }
  if (!err.is(client_errc::connection_closed)) {
    err = error_info::wrap(client_errc::connection_closed, err);
  }
  PIPECORO_LOG_WARNING("connection failure: {}", err.to_string());
  fail_all(std::move(err));
}

}  // namespace pipecoro::detail
