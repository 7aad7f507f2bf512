#pragma once

#include <cstdlib>
#include <exception>

#if defined(__GNUC__) || defined(__clang__)
#define METHODXML_LIKELY(x) __builtin_expect(!!(x), 1)
#define METHODXML_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define METHODXML_LIKELY(x) (x)
#define METHODXML_UNLIKELY(x) (x)
#endif

namespace methodxml::detail {

[[noreturn]] void assert_fail(char const* expr, char const* file, int line,
                              char const* func) noexcept;

[[noreturn]] void assert_fail(char const* expr, char const* msg, char const* file, int line,
                              char const* func) noexcept;

[[noreturn]] void ensure_fail(char const* expr, char const* file, int line,
                              char const* func) noexcept;

[[noreturn]] void ensure_fail(char const* expr, char const* msg, char const* file, int line,
                              char const* func) noexcept;

[[noreturn]] void unreachable_fail(char const* file, int line, char const* func) noexcept;

/// A value of a closed enumeration reached a table that has no entry for it.
[[noreturn]] void invalid_enum_fail(char const* enum_name, long long value, char const* file,
                                    int line, char const* func) noexcept;

}  // namespace methodxml::detail

// -------------------- ASSERT --------------------
#if !defined(NDEBUG)

#define METHODXML_ASSERT_SELECTOR(_1, _2, NAME, ...) NAME

#define METHODXML_ASSERT_1(expr)    \
  (METHODXML_LIKELY(expr) ? (void)0 \
                          : ::methodxml::detail::assert_fail(#expr, __FILE__, __LINE__, __func__))

#define METHODXML_ASSERT_2(expr, msg) \
  (METHODXML_LIKELY(expr)             \
     ? (void)0                        \
     : ::methodxml::detail::assert_fail(#expr, msg, __FILE__, __LINE__, __func__))

#define METHODXML_ASSERT(...) \
  METHODXML_ASSERT_SELECTOR(__VA_ARGS__, METHODXML_ASSERT_2, METHODXML_ASSERT_1)(__VA_ARGS__)

#else
#define METHODXML_ASSERT(...) ((void)0)
#endif

// -------------------- ENSURE --------------------

#define METHODXML_ENSURE_SELECTOR(_1, _2, NAME, ...) NAME

#define METHODXML_ENSURE_1(expr)    \
  (METHODXML_LIKELY(expr) ? (void)0 \
                          : ::methodxml::detail::ensure_fail(#expr, __FILE__, __LINE__, __func__))

#define METHODXML_ENSURE_2(expr, msg) \
  (METHODXML_LIKELY(expr)             \
     ? (void)0                        \
     : ::methodxml::detail::ensure_fail(#expr, msg, __FILE__, __LINE__, __func__))

#define METHODXML_ENSURE(...) \
  METHODXML_ENSURE_SELECTOR(__VA_ARGS__, METHODXML_ENSURE_2, METHODXML_ENSURE_1)(__VA_ARGS__)

// -------------------- UNREACHABLE --------------------

#define METHODXML_UNREACHABLE() ::methodxml::detail::unreachable_fail(__FILE__, __LINE__, __func__)

// -------------------- INVALID ENUM --------------------

#define METHODXML_INVALID_ENUM(enum_name, value)                                            \
  ::methodxml::detail::invalid_enum_fail(enum_name, static_cast<long long>(value), __FILE__, \
                                         __LINE__, __func__)
