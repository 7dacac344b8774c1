#pragma once

#include <pipecoro/error_info.hpp>
#include <pipecoro/expected.hpp>
#include <pipecoro/flush_strategy.hpp>
#include <pipecoro/stream.hpp>

#include <iocoro/any_executor.hpp>
#include <iocoro/awaitable.hpp>

#include <functional>
#include <optional>
#include <stop_token>

namespace pipecoro {

/// A duplex transport shared by a `pipelined_connection`.
///
/// Write path:
/// - `write()` drains `items` into the transport, honouring the flush signals produced by
///   `strategy` (see `apply()`), and completes once every item was accepted or an error
///   occurred. Cancelling `items` must make it return promptly.
/// - At most one `write()` is active at a time.
///
/// Read path:
/// - `read()` pops the next inbound item. It returns `std::nullopt` when the transport marks the
///   end of the current response explicitly, and must return `client_errc::operation_aborted`
///   promptly once `stop` is requested.
/// - At most one `read()` is active at a time.
/// - `is_terminal()` tells whether an inbound item ends the response it belongs to.
///
/// Both `write()` and `read()` may complete on any executor; the caller resumes where it needs.
///
/// Lifecycle:
/// - Connection-level failures are reported through the close handler and make pending and
///   later `write()` / `read()` calls fail with `client_errc::connection_closed`.
/// - `close()` releases the transport; it is idempotent.
template <typename Req, typename Resp>
class duplex_connection {
 public:
  using request_type = Req;
  using response_type = Resp;
  using close_handler = std::function<void(error_info)>;

  virtual ~duplex_connection() = default;

  virtual auto write(stream_ptr<Req> items, flush_strategy_ptr strategy)
    -> iocoro::awaitable<expected<void, error_info>> = 0;

  virtual auto read(std::stop_token stop)
    -> iocoro::awaitable<expected<std::optional<Resp>, error_info>> = 0;

  [[nodiscard]] virtual auto is_terminal(Resp const& item) const -> bool = 0;

  /// Install the connection-level failure handler. It may be invoked from any thread.
  virtual auto set_close_handler(close_handler handler) -> void = 0;

  virtual auto close() -> iocoro::awaitable<void> = 0;

  [[nodiscard]] virtual auto get_executor() const -> iocoro::any_executor = 0;
};

}  // namespace pipecoro
