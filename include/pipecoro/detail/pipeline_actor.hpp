#pragma once

#include <pipecoro/assert.hpp>
#include <pipecoro/config.hpp>
#include <pipecoro/detail/admission_control.hpp>
#include <pipecoro/detail/connection_executor.hpp>
#include <pipecoro/detail/pending_request.hpp>
#include <pipecoro/detail/request_queue.hpp>
#include <pipecoro/detail/response_slot.hpp>
#include <pipecoro/duplex_connection.hpp>
#include <pipecoro/error.hpp>
#include <pipecoro/error_info.hpp>
#include <pipecoro/expected.hpp>
#include <pipecoro/logger.hpp>
#include <pipecoro/stream.hpp>
#include <pipecoro/tracing.hpp>

#include <iocoro/awaitable.hpp>
#include <iocoro/condition_event.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <stop_token>
#include <string_view>

namespace pipecoro::detail {

/// `internal_error` for an exception that escaped a writer or the actor itself. `request_id` is
/// 0 when no single request is to blame.
inline auto make_internal_error(std::exception_ptr const& ep, std::string_view where,
                                std::uint64_t request_id = 0) -> error_info;

/// Pipelining actor shared by one `pipelined_connection` and its transport.
///
/// High-level model:
/// - A single background actor (`actor_loop`) runs two strand-bound loops, `write_loop` and
///   `read_loop`, joined with `when_all`.
/// - All queue and request-state mutations are serialized on the strand. `submit()` is the only
///   entry point used off the strand: it performs admission with an atomic counter and hands the
///   request over with `dispatch()`.
///
/// Ordering (CRITICAL):
/// - Writes start in queue order and never overlap (`write_in_flight_`).
/// - Only the queue head may read (`read_in_flight_`), so read slices follow write order.
/// - The write of a request may start while an earlier request is still reading.
///
/// Termination paths of a request (each releases its admission slot exactly once):
/// - completed: terminal inbound item or explicit end of response
/// - failed: local write/read error, or connection-level failure (`fail_all`)
/// - cancelled: by the consumer through its result stream (`on_cancel`)
///
/// Lifetime: the actor keeps `*this` alive through `shared_from_this()` until it finishes.
template <typename Req, typename Resp>
class pipeline_actor : public std::enable_shared_from_this<pipeline_actor<Req, Resp>> {
 public:
  using connection_type = duplex_connection<Req, Resp>;
  using request_ptr = std::shared_ptr<pending_request<Resp>>;

  pipeline_actor(std::shared_ptr<connection_type> conn, pipeline_config cfg);
  ~pipeline_actor() noexcept;

  pipeline_actor(pipeline_actor const&) = delete;
  auto operator=(pipeline_actor const&) -> pipeline_actor& = delete;

  /// Install the transport close handler and spawn the actor. Called once after construction.
  auto start() -> void;

  /// Admit a request and return its result stream.
  ///
  /// Thread-safety: any thread. On rejection the returned stream is already failed
  /// (`queue_full` or `connection_closed`) and nothing else changes.
  auto submit(std::unique_ptr<request_writer> writer, request_kind kind) -> stream_ptr<Resp>;

  /// Fail every pending request with `connection_closed`, join the actor and close the
  /// transport.
  ///
  /// Thread-safety: any executor (switches to the strand). Idempotent.
  auto close() -> iocoro::awaitable<void>;

  /// Non-blocking variant of `close()` for destructors: fails pending requests and stops the
  /// actor, but leaves the transport to its owner.
  auto shutdown() -> void;

  [[nodiscard]] auto pending_requests() const noexcept -> std::size_t {
    return admission_->pending();
  }

  [[nodiscard]] auto max_pending_requests() const noexcept -> std::size_t {
    return admission_->max_pending();
  }

  [[nodiscard]] auto is_closed() const noexcept -> bool { return admission_->is_closed(); }

 private:
  /// Spawn `actor_loop()` on the strand. Completion is serialized back onto the strand, where
  /// an escaped exception fails all pending work before `actor_done_` is signalled.
  auto run_actor() -> void;

  /// Top-level actor coroutine: joins `write_loop()` and `read_loop()`.
  auto actor_loop() -> iocoro::awaitable<void>;

  /// Starts the write phase of the next queued request, one at a time.
  /// Woken by: admissions, cancellations, shutdown.
  auto write_loop() -> iocoro::awaitable<void>;

  /// Reads the response slice of the queue head once its write finished.
  /// Woken by: write completions, removals of the head, shutdown.
  auto read_loop() -> iocoro::awaitable<void>;

  /// Run the request's writer. On success the request becomes `awaiting_read`; write errors
  /// fail only this request unless the transport reports `connection_closed`.
  auto do_write(request_ptr req) -> iocoro::awaitable<void>;

  /// Forward inbound items to the request's slot until the terminal predicate accepts an item
  /// or the transport ends the response explicitly.
  auto do_read(request_ptr req) -> iocoro::awaitable<void>;

  // Strand-only.
  auto enqueue_impl(request_ptr const& req) -> void;
  auto on_cancel(std::uint64_t id) -> void;
  auto complete_request(request_ptr const& req) -> void;
  auto fail_request(request_ptr const& req, error_info err) -> void;
  auto fail_all(error_info err) -> void;
  auto on_connection_failure(error_info err) -> void;

  auto trace_start(pending_request<Resp> const& req) noexcept -> void;
  auto trace_finish(pending_request<Resp> const& req, request_outcome outcome,
                    error_info const* err) noexcept -> void;
  auto trace_rejected(std::uint64_t id, request_kind kind, error_info const& err) noexcept
    -> void;

  std::shared_ptr<connection_type> conn_;
  pipeline_config cfg_;
  connection_executor executor_;

  // Shared with every response slot; the only state touched off the strand.
  std::shared_ptr<admission_control> admission_;
  std::atomic<std::uint64_t> next_request_id_{1};

  request_queue<Resp> queue_{};
  // Stops the actor loops; never reset, a closed pipeline does not restart.
  std::stop_source stop_{};
  bool closed_{false};
  bool transport_closed_{false};

  // Loop notifications (counting wakeups, thread-safe notify)
  iocoro::condition_event write_wakeup_{};
  iocoro::condition_event read_wakeup_{};

  // In-flight guards (strand-only mutation)
  bool write_in_flight_{false};
  bool read_in_flight_{false};

  // Actor lifecycle
  bool actor_running_{false};
  iocoro::condition_event actor_done_{};
};

}  // namespace pipecoro::detail

#include <pipecoro/impl/pipeline_actor/actor_loops.ipp>
#include <pipecoro/impl/pipeline_actor/core.ipp>
#include <pipecoro/impl/pipeline_actor/io.ipp>
