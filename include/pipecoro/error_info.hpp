#pragma once

#include <pipecoro/error.hpp>

#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace pipecoro {

/// Error payload carried by failed requests and streams.
///
/// - `code`: stable classification, usually a `client_errc`
/// - `detail`: optional human-oriented context
/// - `cause_ec`: optional underlying error (for example the collaborator's code behind a
///   `write_failed`); never nested further
struct error_info {
  std::error_code code{};
  std::string detail{};
  std::error_code cause_ec{};

  error_info() = default;

  explicit error_info(std::error_code c) : code(c) {}

  error_info(std::error_code c, std::string d) : code(c), detail(std::move(d)) {}

  template <typename Errc>
    requires std::is_error_code_enum_v<Errc>
  error_info(Errc e) : code(make_error_code(e)) {}

  template <typename Errc>
    requires std::is_error_code_enum_v<Errc>
  error_info(Errc e, std::string d) : code(make_error_code(e)), detail(std::move(d)) {}

  auto append_detail(std::string_view s) -> error_info& {
    if (s.empty()) {
      return *this;
    }
    if (!detail.empty()) {
      detail += "; ";
    }
    detail.append(s.data(), s.size());
    return *this;
  }

  auto set_cause(std::error_code ec) -> error_info& {
    cause_ec = ec;
    return *this;
  }

  /// Re-classify `cause` under `outer`, keeping its code as the cause and its text as detail.
  [[nodiscard]] static auto wrap(client_errc outer, error_info const& cause) -> error_info {
    error_info out{outer};
    if (cause.code) {
      out.cause_ec = cause.code;
      out.detail = cause.code.message();
    }
    out.append_detail(cause.detail);
    return out;
  }

  [[nodiscard]] auto is(client_errc e) const noexcept -> bool { return code == e; }

  [[nodiscard]] auto to_string() const -> std::string {
    std::string out = code ? std::string{code.category().name()} + ": " + code.message()
                           : std::string{"unknown error"};
    if (!detail.empty()) {
      out += " (";
      out += detail;
      out += ")";
    } else if (cause_ec) {
      out += " (cause=";
      out += cause_ec.category().name();
      out += ": ";
      out += cause_ec.message();
      out += ")";
    }
    return out;
  }
};

}  // namespace pipecoro
