#pragma once

#include <pipecoro/detail/pending_request.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <utility>

namespace pipecoro::detail {

/// FIFO of the non-terminal requests of one pipelined connection, in admission order.
///
/// Shape invariant (strand-only access, no locking):
///   [awaiting_read | reading]* [writing]? [queued]*
/// i.e. requests that finished writing precede the (single) writing request, which precedes
/// requests that have not started. Terminal requests are removed immediately.
template <typename Resp>
class request_queue {
 public:
  using pointer = std::shared_ptr<pending_request<Resp>>;

  auto push(pointer req) -> void { entries_.push_back(std::move(req)); }

  /// Earliest request whose write has not started, or nullptr.
  [[nodiscard]] auto next_to_write() const -> pointer {
    auto it = std::find_if(entries_.begin(), entries_.end(), [](pointer const& p) {
      return p->state == request_state::queued;
    });
    return it == entries_.end() ? nullptr : *it;
  }

  /// Oldest pending request (the only one allowed to read), or nullptr.
  [[nodiscard]] auto front() const -> pointer {
    return entries_.empty() ? nullptr : entries_.front();
  }

  /// Remove and return the request with `id`, or nullptr if it is no longer pending.
  auto remove(std::uint64_t id) -> pointer {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](pointer const& p) { return p->id == id; });
    if (it == entries_.end()) {
      return nullptr;
    }
    auto out = std::move(*it);
    entries_.erase(it);
    return out;
  }

  /// Remove every request, preserving order in the returned sequence.
  auto drain() -> std::deque<pointer> { return std::exchange(entries_, {}); }

  [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }

  [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

 private:
  std::deque<pointer> entries_{};
};

}  // namespace pipecoro::detail
