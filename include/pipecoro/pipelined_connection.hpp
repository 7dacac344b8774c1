#pragma once

#include <pipecoro/config.hpp>
#include <pipecoro/detail/pipeline_actor.hpp>
#include <pipecoro/detail/request_writers.hpp>
#include <pipecoro/duplex_connection.hpp>
#include <pipecoro/error_info.hpp>
#include <pipecoro/expected.hpp>
#include <pipecoro/flush_strategy.hpp>
#include <pipecoro/stream.hpp>

#include <iocoro/awaitable.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <utility>

namespace pipecoro {

/// Shares one `duplex_connection` among many concurrent request/response exchanges.
///
/// Responsibilities:
/// - Admission control: at most `max_pending_requests` requests are pending (admitted and not
///   yet fully read); extra requests fail immediately with `client_errc::queue_full`.
/// - Sequencing: writes run one at a time in admission order; response slices are read one at a
///   time in the same order, delimited by the connection's terminal predicate. The write of a
///   request may overlap the read of an earlier one (pipelining).
/// - Cancellation: cancelling or dropping a result stream cancels its request in whatever phase
///   it is in and frees its slot without disturbing other requests.
/// - Failure: write/read errors fail only the affected request (`write_failed` /
///   `read_failed`); connection-level failures fail every pending request with
///   `connection_closed` and refuse later admissions.
///
/// NOT responsible for:
/// - IO, framing and flushing (delegated to the connection)
/// - timeouts and retries (policies of the caller)
///
/// Thread safety:
/// - `request()` and the observers can be called from any thread.
/// - `close()` can be awaited from any executor.
///
/// Usage:
///   pipelined_connection<std::string, std::string> pc{conn, pipeline_config{.max_pending_requests = 8}};
///   auto reply = pc.request(std::string{"PING"});
///   auto items = co_await collect(*reply);
///   co_await pc.close();
template <typename Req, typename Resp>
class pipelined_connection {
 public:
  using connection_type = duplex_connection<Req, Resp>;

  /// Deferred write action for `request(writer)`. Called once when the request reaches the
  /// write phase; `stop` fires if the request is cancelled or the connection fails meanwhile.
  using writer = detail::function_writer::function;

  /// Throws std::invalid_argument if `cfg` is invalid.
  explicit pipelined_connection(std::shared_ptr<connection_type> conn, pipeline_config cfg = {})
      : actor_(make_actor(std::move(conn), std::move(cfg))) {}

  ~pipelined_connection() {
    if (actor_) {
      actor_->shutdown();
    }
  }

  pipelined_connection(pipelined_connection const&) = delete;
  auto operator=(pipelined_connection const&) -> pipelined_connection& = delete;

  pipelined_connection(pipelined_connection&&) noexcept = default;
  auto operator=(pipelined_connection&&) noexcept -> pipelined_connection& = default;

  /// Write `items` with `strategy` and return the matching response slice.
  [[nodiscard]] auto request(stream_ptr<Req> items, flush_strategy_ptr strategy)
    -> stream_ptr<Resp> {
    auto w = std::make_unique<detail::sequence_writer<Req, Resp>>(
      conn(), std::move(items), strategy ? std::move(strategy) : default_flush_strategy());
    return actor_->submit(std::move(w), request_kind::sequence);
  }

  /// Write a single item with `default_flush_strategy()`.
  [[nodiscard]] auto request(Req item) -> stream_ptr<Resp> {
    auto w = std::make_unique<detail::sequence_writer<Req, Resp>>(
      conn(), just(std::move(item)), default_flush_strategy());
    return actor_->submit(std::move(w), request_kind::value);
  }

  /// Let `w` perform the write itself when the request's turn comes.
  [[nodiscard]] auto request(writer w) -> stream_ptr<Resp> {
    return actor_->submit(std::make_unique<detail::function_writer>(std::move(w)),
                          request_kind::writer);
  }

  /// Fail pending requests with `connection_closed`, stop the pipeline and close the
  /// connection. Idempotent.
  auto close() -> iocoro::awaitable<void> { co_await actor_->close(); }

  [[nodiscard]] auto pending_requests() const noexcept -> std::size_t {
    return actor_->pending_requests();
  }

  [[nodiscard]] auto max_pending_requests() const noexcept -> std::size_t {
    return actor_->max_pending_requests();
  }

  [[nodiscard]] auto is_closed() const noexcept -> bool { return actor_->is_closed(); }

 private:
  auto make_actor(std::shared_ptr<connection_type> conn, pipeline_config cfg)
    -> std::shared_ptr<detail::pipeline_actor<Req, Resp>> {
    cfg.validate();
    if (!conn) {
      throw std::invalid_argument("pipelined_connection: connection must not be null");
    }
    conn_ = conn;
    auto actor =
      std::make_shared<detail::pipeline_actor<Req, Resp>>(std::move(conn), std::move(cfg));
    actor->start();
    return actor;
  }

  [[nodiscard]] auto conn() const -> std::shared_ptr<connection_type> { return conn_; }

  std::shared_ptr<connection_type> conn_;
  std::shared_ptr<detail::pipeline_actor<Req, Resp>> actor_;
};

}  // namespace pipecoro
