#include <respkit/assert.hpp>

#include <cstdio>
#include <cstdlib>

namespace respkit::detail {

void assert_fail(char const* expr, char const* msg, char const* file, int line,
                 char const* func) noexcept {
  std::fprintf(stderr,
               "[respkit] ASSERT failure\n"
               "  expression: %s\n",
               expr);
  if (msg) {
    std::fprintf(stderr, "  message   : %s\n", msg);
  }
  std::fprintf(stderr,
               "  location  : %s:%d\n"
               "  function  : %s\n",
               file, line, func);
  std::fflush(stderr);
  std::abort();
}

}  // namespace respkit::detail
