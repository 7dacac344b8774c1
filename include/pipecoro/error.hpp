#pragma once

#include <system_error>
#include <type_traits>

namespace pipecoro {

/// Errors reported by pipelined connections and their collaborators.
enum class client_errc {
  /// The request was cancelled by its consumer (result stream cancelled or dropped).
  operation_aborted = 1,

  /// Admission rejected: `max_pending_requests` requests are already pending.
  ///
  /// Reported immediately by `request()`; no request is created.
  queue_full,

  /// The write phase of a request failed.
  /// The collaborator's error is kept in `error_info::cause_ec` / `error_info::detail`.
  write_failed,

  /// Reading the response slice of a request failed.
  read_failed,

  /// The connection was closed, either by the user or by a connection-level failure.
  ///
  /// Every pending request fails with this error and later admissions are refused.
  connection_closed,

  /// An exception escaped a user-supplied write action or the connection actor.
  internal_error,
};

[[nodiscard]] auto make_error_code(client_errc e) -> std::error_code;

[[nodiscard]] auto client_category() noexcept -> std::error_category const&;

}  // namespace pipecoro

namespace std {

template <>
struct is_error_code_enum<pipecoro::client_errc> : std::true_type {};

}  // namespace std

#include <pipecoro/impl/error.ipp>
