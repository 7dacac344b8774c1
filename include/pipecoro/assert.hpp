#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define PIPECORO_LIKELY(x) __builtin_expect(!!(x), 1)
#else
#define PIPECORO_LIKELY(x) (x)
#endif

namespace pipecoro::detail {

/// Failure handlers behind the checking macros below. They print a report to stderr and abort.
/// Defined in `pipecoro/impl/assert.ipp`, compiled once per binary through `pipecoro/src.hpp`.
[[noreturn]] void check_failed(char const* kind, char const* expr, char const* msg,
                               char const* file, int line, char const* func) noexcept;

}  // namespace pipecoro::detail

#define PIPECORO_CHECK_SELECTOR(_1, _2, NAME, ...) NAME

#define PIPECORO_CHECK_IMPL(kind, expr, msg) \
  (PIPECORO_LIKELY(expr)                     \
     ? (void)0                               \
     : ::pipecoro::detail::check_failed(kind, #expr, msg, __FILE__, __LINE__, __func__))

// -------------------- ASSERT (debug only) --------------------
#if !defined(NDEBUG)

#define PIPECORO_ASSERT_1(expr) PIPECORO_CHECK_IMPL("ASSERT", expr, nullptr)
#define PIPECORO_ASSERT_2(expr, msg) PIPECORO_CHECK_IMPL("ASSERT", expr, msg)

#define PIPECORO_ASSERT(...) \
  PIPECORO_CHECK_SELECTOR(__VA_ARGS__, PIPECORO_ASSERT_2, PIPECORO_ASSERT_1)(__VA_ARGS__)

#else
#define PIPECORO_ASSERT(...) ((void)0)
#endif

// -------------------- UNREACHABLE --------------------

#define PIPECORO_UNREACHABLE() \
  ::pipecoro::detail::check_failed("UNREACHABLE", nullptr, nullptr, __FILE__, __LINE__, __func__)
