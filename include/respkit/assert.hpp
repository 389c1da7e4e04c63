#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define RESPKIT_LIKELY(x) __builtin_expect(!!(x), 1)
#else
#define RESPKIT_LIKELY(x) (x)
#endif

namespace respkit::detail {

/// Print a diagnostic for a failed assertion to stderr and abort the process.
///
/// `msg` may be null.
[[noreturn]] void assert_fail(char const* expr, char const* msg, char const* file, int line,
                              char const* func) noexcept;

}  // namespace respkit::detail

// Debug-only invariant check. Optional second argument is a message.
#if !defined(NDEBUG)

#define RESPKIT_ASSERT_SELECTOR(_1, _2, NAME, ...) NAME

#define RESPKIT_ASSERT_1(expr) RESPKIT_ASSERT_2(expr, nullptr)

#define RESPKIT_ASSERT_2(expr, msg) \
  (RESPKIT_LIKELY(expr)             \
     ? (void)0                      \
     : ::respkit::detail::assert_fail(#expr, msg, __FILE__, __LINE__, __func__))

#define RESPKIT_ASSERT(...) \
  RESPKIT_ASSERT_SELECTOR(__VA_ARGS__, RESPKIT_ASSERT_2, RESPKIT_ASSERT_1)(__VA_ARGS__)

#else
#define RESPKIT_ASSERT(...) ((void)0)
#endif
