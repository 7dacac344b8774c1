#pragma once

#include <pipecoro/duplex_connection.hpp>
#include <pipecoro/error.hpp>
#include <pipecoro/error_info.hpp>
#include <pipecoro/expected.hpp>
#include <pipecoro/flush_strategy.hpp>
#include <pipecoro/logger.hpp>
#include <pipecoro/stream.hpp>

#include <iocoro/any_executor.hpp>
#include <iocoro/awaitable.hpp>
#include <iocoro/condition_event.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace pipecoro {

/// Entries of `memory_connection::events()`, in the order they happened on the write path.
enum class write_event : std::uint8_t {
  item,
  flush,
};

/// In-process `duplex_connection`.
///
/// The outbound side behaves like a buffered channel: accepted items are buffered and move to
/// `flushed()` on each flush signal. The inbound side is fed by the owner through
/// `push_inbound()`, `end_response()` and `fail_read()`; `fail()` simulates a connection-level
/// failure. All members are thread-safe.
///
/// Must be owned by a `std::shared_ptr` (flush listeners hold weak references).
template <typename Req, typename Resp>
class memory_connection final
    : public duplex_connection<Req, Resp>,
      public std::enable_shared_from_this<memory_connection<Req, Resp>> {
 public:
  using terminal_predicate = std::function<bool(Resp const&)>;
  using typename duplex_connection<Req, Resp>::close_handler;
  using read_result = expected<std::optional<Resp>, error_info>;

  /// Without a predicate every inbound item is a complete response.
  explicit memory_connection(iocoro::any_executor ex, terminal_predicate is_terminal = {})
      : ex_(std::move(ex)), is_terminal_(std::move(is_terminal)) {}

  auto write(stream_ptr<Req> items, flush_strategy_ptr strategy)
    -> iocoro::awaitable<expected<void, error_info>> override {
    if (auto rejected = begin_write()) {
      items->cancel();
      co_return unexpected(std::move(*rejected));
    }
    if (!strategy) {
      strategy = default_flush_strategy();
    }

    auto holder = apply(*strategy, std::move(items), ex_);
    holder.signals->set_listener([weak = this->weak_from_this()] {
      if (auto self = weak.lock()) {
        self->flush_buffered();
      }
    });

    struct active_write_guard {
      memory_connection* self;
      active_write_guard(memory_connection* s, item_stream<Req>* source) : self(s) {
        self->set_active_source(source);
      }
      ~active_write_guard() { self->set_active_source(nullptr); }
    };

    active_write_guard guard{this, holder.source.get()};
    co_return co_await drain(*holder.source);
  }

  auto read(std::stop_token stop) -> iocoro::awaitable<read_result> override {
    {
      std::lock_guard lk{mtx_};
      reads_started_ += 1;
      read_pending_ = true;
    }

    std::stop_callback wake{stop, [this] { inbound_ready_.notify(); }};
    for (;;) {
      if (auto r = try_pop(stop)) {
        co_return std::move(*r);
      }
      (void)co_await inbound_ready_.async_wait();
    }
  }

  auto is_terminal(Resp const& item) const -> bool override {
    return is_terminal_ ? is_terminal_(item) : true;
  }

  auto set_close_handler(close_handler handler) -> void override {
    std::lock_guard lk{mtx_};
    close_handler_ = std::move(handler);
  }

  auto close() -> iocoro::awaitable<void> override {
    shutdown(error_info{client_errc::connection_closed, "closed locally"});
    co_return;
  }

  auto get_executor() const -> iocoro::any_executor override { return ex_; }

  /// Write a single item and flush it.
  auto write_and_flush(Req item) -> iocoro::awaitable<expected<void, error_info>> {
    co_return co_await write(just(std::move(item)), flush_on_each());
  }

  // -------------------- inbound control --------------------

  auto push_inbound(Resp item) -> void {
    push_entry(inbound_entry{.item = std::move(item)});
  }

  /// Mark the end of the current response explicitly.
  auto end_response() -> void { push_entry(inbound_entry{}); }

  /// Fail the next read with `err` without affecting the connection.
  auto fail_read(error_info err) -> void { push_entry(inbound_entry{.error = std::move(err)}); }

  /// Reject the next `write()` with `err` before it pulls any item.
  auto fail_next_write(error_info err) -> void {
    std::lock_guard lk{mtx_};
    fail_next_write_ = std::move(err);
  }

  /// Connection-level failure: pending and later IO fails with `client_errc::connection_closed`
  /// and the close handler observes the wrapped `cause`.
  auto fail(error_info cause) -> void {
    shutdown(error_info::wrap(client_errc::connection_closed, cause));
  }

  // -------------------- observers --------------------

  [[nodiscard]] auto written() const -> std::vector<Req> {
    std::lock_guard lk{mtx_};
    return written_;
  }

  [[nodiscard]] auto flushed() const -> std::vector<Req> {
    std::lock_guard lk{mtx_};
    return flushed_;
  }

  [[nodiscard]] auto events() const -> std::vector<write_event> {
    std::lock_guard lk{mtx_};
    return events_;
  }

  [[nodiscard]] auto flush_count() const -> std::size_t {
    std::lock_guard lk{mtx_};
    return flush_count_;
  }

  [[nodiscard]] auto writes_started() const -> std::size_t {
    std::lock_guard lk{mtx_};
    return writes_started_;
  }

  [[nodiscard]] auto writes_completed() const -> std::size_t {
    std::lock_guard lk{mtx_};
    return writes_completed_;
  }

  [[nodiscard]] auto write_active() const -> bool {
    std::lock_guard lk{mtx_};
    return active_source_ != nullptr;
  }

  [[nodiscard]] auto reads_started() const -> std::size_t {
    std::lock_guard lk{mtx_};
    return reads_started_;
  }

  /// True while a `read()` waits for inbound data.
  [[nodiscard]] auto read_pending() const -> bool {
    std::lock_guard lk{mtx_};
    return read_pending_;
  }

  [[nodiscard]] auto inbound_size() const -> std::size_t {
    std::lock_guard lk{mtx_};
    return inbound_.size();
  }

  [[nodiscard]] auto is_closed() const -> bool {
    std::lock_guard lk{mtx_};
    return closed_;
  }

 private:
  /// An item, an explicit end of response (neither set) or a read error.
  struct inbound_entry {
    std::optional<Resp> item{};
    std::optional<error_info> error{};
  };

  auto begin_write() -> std::optional<error_info> {
    std::lock_guard lk{mtx_};
    if (closed_) {
      return close_error_;
    }
    writes_started_ += 1;
    if (fail_next_write_.has_value()) {
      return std::exchange(fail_next_write_, std::nullopt);
    }
    return std::nullopt;
  }

  auto drain(item_stream<Req>& source) -> iocoro::awaitable<expected<void, error_info>> {
    for (;;) {
      auto r = co_await source.next();
      if (auto closed = closed_error()) {
        co_return unexpected(std::move(*closed));
      }
      if (!r) {
        co_return unexpected(std::move(r.error()));
      }
      if (!r->has_value()) {
        std::lock_guard lk{mtx_};
        writes_completed_ += 1;
        break;
      }
      accept(std::move(**r));
    }
    co_return expected<void, error_info>{};
  }

  auto accept(Req item) -> void {
    std::lock_guard lk{mtx_};
    written_.push_back(item);
    buffered_.push_back(std::move(item));
    events_.push_back(write_event::item);
  }

  auto flush_buffered() -> void {
    std::lock_guard lk{mtx_};
    for (auto& item : buffered_) {
      flushed_.push_back(std::move(item));
    }
    buffered_.clear();
    events_.push_back(write_event::flush);
    flush_count_ += 1;
  }

  auto set_active_source(item_stream<Req>* source) -> void {
    std::lock_guard lk{mtx_};
    active_source_ = source;
  }

  auto closed_error() const -> std::optional<error_info> {
    std::lock_guard lk{mtx_};
    if (!closed_) {
      return std::nullopt;
    }
    return close_error_;
  }

  auto push_entry(inbound_entry entry) -> void {
    {
      std::lock_guard lk{mtx_};
      inbound_.push_back(std::move(entry));
    }
    inbound_ready_.notify();
  }

  auto try_pop(std::stop_token const& stop) -> std::optional<read_result> {
    std::lock_guard lk{mtx_};
    if (stop.stop_requested()) {
      read_pending_ = false;
      return read_result{unexpected(error_info{client_errc::operation_aborted})};
    }
    if (closed_) {
      read_pending_ = false;
      return read_result{unexpected(close_error_)};
    }
    if (inbound_.empty()) {
      return std::nullopt;
    }

    auto entry = std::move(inbound_.front());
    inbound_.pop_front();
    read_pending_ = false;
    if (entry.error.has_value()) {
      return read_result{unexpected(std::move(*entry.error))};
    }
    return read_result{std::move(entry.item)};
  }

  auto shutdown(error_info err) -> void {
    close_handler handler;
    {
      std::lock_guard lk{mtx_};
      if (closed_) {
        return;
      }
      closed_ = true;
      close_error_ = err;
      handler = close_handler_;
      if (active_source_ != nullptr) {
        active_source_->cancel();
      }
    }
    PIPECORO_LOG_DEBUG("memory connection closed: {}", err.to_string());
    inbound_ready_.notify();
    if (handler) {
      handler(std::move(err));
    }
  }

  iocoro::any_executor ex_;
  terminal_predicate is_terminal_;

  mutable std::mutex mtx_;
  bool closed_{false};
  error_info close_error_{};
  close_handler close_handler_{};
  std::optional<error_info> fail_next_write_{};

  item_stream<Req>* active_source_{nullptr};
  std::vector<Req> buffered_{};
  std::vector<Req> written_{};
  std::vector<Req> flushed_{};
  std::vector<write_event> events_{};
  std::size_t flush_count_{0};
  std::size_t writes_started_{0};
  std::size_t writes_completed_{0};

  std::deque<inbound_entry> inbound_{};
  std::size_t reads_started_{0};
  bool read_pending_{false};
  iocoro::condition_event inbound_ready_{};
};

}  // namespace pipecoro
