#include <pipecoro/assert.hpp>

#include <cstdio>
#include <cstdlib>

namespace pipecoro::detail {

void check_failed(char const* kind, char const* expr, char const* msg, char const* file,
                  int line, char const* func) noexcept {
  std::fprintf(stderr, "[pipecoro] %s failure\n", kind);
  if (expr != nullptr) {
    std::fprintf(stderr, "  expression: %s\n", expr);
  }
  if (msg != nullptr) {
    std::fprintf(stderr, "  message   : %s\n", msg);
  }
  std::fprintf(stderr,
               "  location  : %s:%d\n"
               "  function  : %s\n",
               file, line, func);
  std::fflush(stderr);
  std::abort();
}

}  // namespace pipecoro::detail
