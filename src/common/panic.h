/** LICENSE TEMPLATE */
#pragma once

#include <source_location>
#include <string_view>

// defines PANIC macro. Responsibility on caller to include required headers.

#define PANIC(err_msg)                                                                                            \
  {                                                                                                               \
    auto loc = std::source_location::current();                                                                   \
    ldb::panic(err_msg, loc, 1);                                                                                  \
  }

#define NEVER(msg)                                                                                                \
  PANIC(msg);                                                                                                     \
  LDB_UNREACHABLE

#ifndef LDB_UNREACHABLE

#if defined(__clang__)
#define LDB_UNREACHABLE std::unreachable();
#elif defined(__GNUC__) || defined(__GNUG__)
#define LDB_UNREACHABLE __builtin_unreachable();
#endif

#endif

namespace ldb {
[[noreturn]] void panic(
  std::string_view err_msg, const char *functionName, const char *file, int line, int strip_levels);

[[noreturn]] void panic(std::string_view err_msg, const std::source_location &loc, int strip_levels);
} // namespace ldb
