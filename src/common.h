/** LICENSE TEMPLATE */
#pragma once
#include <common/macros.h>
#include <common/panic.h>
#include <common/typedefs.h>
#include <filesystem>
#include <format>
#include <source_location>

namespace fs = std::filesystem;
using Path = fs::path;

// clang-format off
// Identical to LDB_ASSERT, but doesn't care about build type
#define VERIFY(cond, msg, ...) if (!(cond)) [[unlikely]] { std::source_location loc = std::source_location::current(); \
    ldb::panic(std::format("{} FAILED {}", #cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__)), loc, 1);          \
  }
// clang-format on

#if defined(LDB_DEBUG) and LDB_DEBUG == 1
#define LDB_ASSERT(cond, msg, ...) VERIFY(cond, msg, __VA_ARGS__)
#else
#define LDB_ASSERT(cond, msg, ...)
#endif

template <class... T> constexpr bool always_false = false;
