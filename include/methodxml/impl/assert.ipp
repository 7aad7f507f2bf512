#include <methodxml/assert.hpp>

#include <cstdio>
#include <cstdlib>

namespace methodxml::detail {

namespace {

[[noreturn]] void fail(char const* kind, char const* expr, char const* msg, char const* file,
                       int line, char const* func) noexcept {
  if (msg) {
    std::fprintf(stderr,
                 "[methodxml] %s failure\n"
                 "  expression: %s\n"
                 "  message   : %s\n"
                 "  location  : %s:%d\n"
                 "  function  : %s\n",
                 kind, expr ? expr : "(none)", msg, file, line, func);
  } else {
    std::fprintf(stderr,
                 "[methodxml] %s failure\n"
                 "  expression: %s\n"
                 "  location  : %s:%d\n"
                 "  function  : %s\n",
                 kind, expr ? expr : "(none)", file, line, func);
  }
  std::fflush(stderr);
  std::abort();
}

}  // namespace

// -------------------- ASSERT --------------------

void assert_fail(char const* expr, char const* file, int line, char const* func) noexcept {
  fail("ASSERT", expr, nullptr, file, line, func);
}

void assert_fail(char const* expr, char const* msg, char const* file, int line,
                 char const* func) noexcept {
  fail("ASSERT", expr, msg, file, line, func);
}

// -------------------- ENSURE --------------------

void ensure_fail(char const* expr, char const* file, int line, char const* func) noexcept {
  fail("ENSURE", expr, nullptr, file, line, func);
}

void ensure_fail(char const* expr, char const* msg, char const* file, int line,
                 char const* func) noexcept {
  fail("ENSURE", expr, msg, file, line, func);
}

void unreachable_fail(char const* file, int line, char const* func) noexcept {
  fail("UNREACHABLE", nullptr, nullptr, file, line, func);
}

// -------------------- INVALID ENUM --------------------

void invalid_enum_fail(char const* enum_name, long long value, char const* file, int line,
                       char const* func) noexcept {
  char msg[128]{};
  std::snprintf(msg, sizeof(msg), "Invalid %s: %lld", enum_name, value);
  fail("INVALID ENUM", enum_name, msg, file, line, func);
}

}  // namespace methodxml::detail
