#pragma once

#include <pipecoro/tracing.hpp>

#include <cstddef>
#include <stdexcept>

namespace pipecoro {

/// Pipelined connection configuration.
struct pipeline_config {
  /// Pipelining depth: requests admitted but not yet fully read.
  /// Admissions beyond this limit fail fast with `client_errc::queue_full`. Must be positive.
  std::size_t max_pending_requests = 16;

  request_trace_hooks trace_hooks{};

  auto validate() const -> void {
    if (max_pending_requests == 0) {
      throw std::invalid_argument("pipeline_config: max_pending_requests must be positive");
    }
  }
};

}  // namespace pipecoro
