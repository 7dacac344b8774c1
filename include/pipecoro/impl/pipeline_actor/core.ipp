#pragma once

#include <pipecoro/detail/pipeline_actor.hpp>

#include <iocoro/bind_executor.hpp>
#include <iocoro/co_spawn.hpp>
#include <iocoro/this_coro.hpp>

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace pipecoro::detail {

inline auto describe_exception(std::exception_ptr const& ep) -> std::string {
  if (ep != nullptr) {
    try {
      std::rethrow_exception(ep);
    } catch (std::exception const& e) {
      return e.what();
    } catch (...) {
      return "unknown exception";
    }
  }
  return "no exception";
}

inline auto make_internal_error(std::exception_ptr const& ep, std::string_view where,
                                std::uint64_t request_id) -> error_info {
  if (request_id == 0) {
    return {client_errc::internal_error,
            format_impl::format("{}: {}", where, describe_exception(ep))};
  }
  return {client_errc::internal_error,
          format_impl::format("{} (request {}): {}", where, request_id, describe_exception(ep))};
}

template <typename Req, typename Resp>
pipeline_actor<Req, Resp>::pipeline_actor(std::shared_ptr<connection_type> conn,
                                          pipeline_config cfg)
    : conn_(std::move(conn)),
      cfg_(std::move(cfg)),
      executor_(conn_->get_executor()),
      admission_(std::make_shared<admission_control>(cfg_.max_pending_requests)) {}

template <typename Req, typename Resp>
pipeline_actor<Req, Resp>::~pipeline_actor() noexcept {
  // The actor holds a strong reference, so it is no longer running here. Requests can only be
  // left behind when the executor stopped before shutdown() ran.
  if (!closed_) {
    fail_all(error_info{client_errc::connection_closed, "pipeline destroyed"});
  }
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::start() -> void {
  std::weak_ptr<pipeline_actor> weak = this->shared_from_this();
  auto ex = executor_.strand().executor();
  conn_->set_close_handler([weak, ex](error_info err) mutable {
    ex.dispatch([weak, err = std::move(err)]() mutable {
      if (auto self = weak.lock()) {
        self->on_connection_failure(std::move(err));
      }
    });
  });
  ex.dispatch([self = this->shared_from_this()] { self->run_actor(); });
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::run_actor() -> void {
  PIPECORO_ASSERT(!actor_running_, "run_actor() called while the actor is running");
  if (closed_) {
    return;
  }
  actor_running_ = true;

  auto ex = executor_.strand().executor();
  auto self = this->shared_from_this();
  iocoro::co_spawn(
    ex, stop_.get_token(),
    [self, ex]() mutable -> iocoro::awaitable<void> {
      co_return co_await iocoro::bind_executor(ex, self->actor_loop());
    },
    [self, ex](iocoro::expected<void, std::exception_ptr> r) mutable {
      ex.post([self = std::move(self), r = std::move(r)]() mutable {
        self->actor_running_ = false;
        if (!r) {
          auto err = make_internal_error(r.error(), "pipeline actor");
          PIPECORO_LOG_ERROR("actor failed: {}", err.to_string());
          self->fail_all(std::move(err));
        }
        self->actor_done_.notify();
      });
    });
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::submit(std::unique_ptr<request_writer> writer, request_kind kind)
  -> stream_ptr<Resp> {
  auto const id = next_request_id_.fetch_add(1, std::memory_order_relaxed);

  switch (admission_->try_acquire()) {
    case admission_control::result::accepted:
      break;
    case admission_control::result::queue_full: {
      auto err = error_info{client_errc::queue_full,
                            format_impl::format("max_pending_requests={}",
                                                admission_->max_pending())};
      PIPECORO_LOG_DEBUG("request rejected: id={} reason=queue_full", id);
      trace_rejected(id, kind, err);
      return pipecoro::failed<Resp>(std::move(err));
    }
    case admission_control::result::closed: {
      auto err = error_info{client_errc::connection_closed, "pipeline closed"};
      PIPECORO_LOG_DEBUG("request rejected: id={} reason=closed", id);
      trace_rejected(id, kind, err);
      return pipecoro::failed<Resp>(std::move(err));
    }
  }

  auto req = std::make_shared<pending_request<Resp>>();
  req->id = id;
  req->kind = kind;
  req->writer = std::move(writer);
  req->admitted_at = std::chrono::steady_clock::now();
  req->slot = std::make_shared<response_slot<Resp>>(admission_);

  auto strand = executor_.strand().executor();
  std::weak_ptr<pipeline_actor> weak = this->shared_from_this();
  auto stream = std::make_unique<response_stream<Resp>>(req->slot, [weak, strand, id]() mutable {
    strand.post([weak, id] {
      if (auto self = weak.lock()) {
        self->on_cancel(id);
      }
    });
  });

  // Thread-safety: queue mutation must happen on the strand. dispatch() runs inline when the
  // caller already is on the strand and behaves like post() otherwise.
  strand.dispatch([self = this->shared_from_this(), req]() mutable {
    try {
      self->enqueue_impl(req);
    } catch (...) {
      auto err = make_internal_error(std::current_exception(), "enqueue", req->id);
      PIPECORO_LOG_ERROR("request enqueue failed: id={} err={}", req->id, err.to_string());
      req->state = request_state::failed;
      req->slot->release_slot();
      req->slot->fail(std::move(err));
    }
  });

  return stream;
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::enqueue_impl(request_ptr const& req) -> void {
  if (closed_) {
    error_info err{client_errc::connection_closed, "pipeline closed before admission completed"};
    req->state = request_state::failed;
    req->slot->release_slot();
    trace_finish(*req, request_outcome::failed, &err);
    req->slot->fail(std::move(err));
    return;
  }

  trace_start(*req);
  if (req->slot->is_cancelled()) {
    // Cancelled between admission and the strand hand-off; the slot is already released.
    req->state = request_state::cancelled;
    trace_finish(*req, request_outcome::cancelled, nullptr);
    return;
  }

  queue_.push(req);
  PIPECORO_LOG_DEBUG("request queued: id={} kind={} queue_size={}", req->id,
                     to_string(req->kind), queue_.size());
  write_wakeup_.notify();
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::close() -> iocoro::awaitable<void> {
  // Keep *this alive across suspension points even if the owning handle goes away.
  auto self = this->shared_from_this();
  co_await iocoro::this_coro::switch_to(executor_.strand().executor());

  fail_all(error_info{client_errc::connection_closed, "closed by user"});

  // actor_done_ wakes one waiter per notify(); every joined close() passes it on so that
  // concurrent callers all resume.
  bool joined = false;
  while (actor_running_) {
    (void)co_await actor_done_.async_wait();
    co_await iocoro::this_coro::switch_to(executor_.strand().executor());
    joined = true;
  }
  if (joined) {
    actor_done_.notify();
  }

  if (!transport_closed_) {
    transport_closed_ = true;
    co_await conn_->close();
  }
  co_return;
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::shutdown() -> void {
  executor_.strand().executor().dispatch([self = this->shared_from_this()] {
    self->fail_all(error_info{client_errc::connection_closed, "pipelined connection destroyed"});
  });
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::trace_start(pending_request<Resp> const& req) noexcept -> void {
  auto const& hooks = cfg_.trace_hooks;
  if (hooks.on_start == nullptr) {
    return;
  }

  request_trace_start evt{
    .info = request_trace_info{.id = req.id, .kind = req.kind},
    .pending = admission_->pending(),
  };
  try {
    hooks.on_start(hooks.user_data, evt);
  } catch (...) {
    PIPECORO_LOG_WARNING("trace on_start hook threw: id={}", req.id);
  }
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::trace_finish(pending_request<Resp> const& req,
                                             request_outcome outcome,
                                             error_info const* err) noexcept -> void {
  auto const& hooks = cfg_.trace_hooks;
  if (hooks.on_finish == nullptr) {
    return;
  }

  request_trace_finish evt{
    .info = request_trace_info{.id = req.id, .kind = req.kind},
    .outcome = outcome,
    .duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - req.admitted_at),
    .items_read = req.items_read,
    .primary_error = err != nullptr ? err->code : std::error_code{},
    .primary_error_detail = err != nullptr ? std::string_view{err->detail} : std::string_view{},
  };
  try {
    hooks.on_finish(hooks.user_data, evt);
  } catch (...) {
    PIPECORO_LOG_WARNING("trace on_finish hook threw: id={} outcome={}", req.id,
                         to_string(outcome));
  }
}

template <typename Req, typename Resp>
auto pipeline_actor<Req, Resp>::trace_rejected(std::uint64_t id, request_kind kind,
                                               error_info const& err) noexcept -> void {
  auto const& hooks = cfg_.trace_hooks;
  if (hooks.on_finish == nullptr) {
    return;
  }

  request_trace_finish evt{
    .info = request_trace_info{.id = id, .kind = kind},
    .outcome = request_outcome::rejected,
    .primary_error = err.code,
    .primary_error_detail = err.detail,
  };
  try {
    hooks.on_finish(hooks.user_data, evt);
  } catch (...) {
    PIPECORO_LOG_WARNING("trace on_finish hook threw: id={} outcome=rejected", id);
  }
}

}  // namespace pipecoro::detail
