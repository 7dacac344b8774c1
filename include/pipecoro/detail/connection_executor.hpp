#pragma once

#include <iocoro/any_executor.hpp>
#include <iocoro/strand.hpp>

#include <utility>

namespace pipecoro::detail {

/// Binds a pipelined connection to one strand.
///
/// Constraints:
/// 1. Every mutation of the request queue and of the in-flight flags happens on this strand.
///    The actor's write and read loops are both spawned onto it, and `request()` hands its work
///    over with `dispatch()`.
/// 2. The strand is derived from the transport's executor, so the connection's IO completions
///    and the pipeline state machine share one event loop.
/// 3. Copies of the facade refer to the same strand.
class connection_executor {
 public:
  explicit connection_executor(iocoro::any_executor ex)
      : strand_(iocoro::make_strand(std::move(ex))) {}

  /// Not implicitly convertible to `iocoro::any_executor`; call `.executor()` explicitly.
  class strand_facade {
   public:
    explicit strand_facade(iocoro::any_executor ex) : ex_(std::move(ex)) {}

    [[nodiscard]] auto executor() const noexcept -> iocoro::any_executor { return ex_; }

   private:
    iocoro::any_executor ex_;
  };

  [[nodiscard]] auto strand() const noexcept -> strand_facade { return strand_facade{strand_}; }

 private:
  iocoro::any_executor strand_;
};

}  // namespace pipecoro::detail
