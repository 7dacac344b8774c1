#pragma once

#include <pipecoro/error.hpp>

#include <string>

namespace pipecoro {
namespace detail {

struct client_category_impl final : std::error_category {
  auto name() const noexcept -> char const* override { return "pipecoro"; }

  auto message(int ev) const -> std::string override {
    // clang-format off
    switch (static_cast<client_errc>(ev)) {
      case client_errc::operation_aborted: return "Request cancelled.";
      case client_errc::queue_full:        return "Too many pending requests.";
      case client_errc::write_failed:      return "Request write failed.";
      case client_errc::read_failed:       return "Response read failed.";
      case client_errc::connection_closed: return "Connection closed.";
      case client_errc::internal_error:    return "Internal error.";
    }
    // clang-format on
    return "Unknown pipecoro error.";
  }
};

}  // namespace detail

inline auto client_category() noexcept -> std::error_category const& {
  static detail::client_category_impl instance;
  return instance;
}

inline auto make_error_code(client_errc e) -> std::error_code {
  return std::error_code{static_cast<int>(e), client_category()};
}

}  // namespace pipecoro
