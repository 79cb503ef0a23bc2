/** LICENSE TEMPLATE */
#include "panic.h"

// ldb
#include <utils/logger.h>

// stdlib
#include <cstdlib>
#include <cstring>
#include <print>
#include <regex>

// system
#include <cxxabi.h>
#include <execinfo.h>

namespace ldb {
template <typename T>
void
replace_regex(T &str)
{
  static const std::regex str_view_regex("std::basic_string_view<char, std::char_traits<char> >");
  static const std::regex str_regex{
    "std::__cxx11::basic_string<char, std::char_traits<char>, std::allocator<char> >"
  };
  static const std::regex allocator_regex{ ", std::allocator<.*> " };

  str = std::regex_replace(str, str_view_regex, "std::string_view");
  str = std::regex_replace(str, str_regex, "std::string");
  str = std::regex_replace(str, allocator_regex, "");
}

[[noreturn]] void
panic(std::string_view err_msg, const char *functionName, const char *file, int line, int strip_levels)
{
  constexpr auto logIf = [](std::string_view msg) { logging::Logger::LogIf(Channel::core, msg); };
  constexpr auto BT_BUF_SIZE = 100;
  // Grab errno before anything below gets a chance to clobber it.
  const auto savedErrno = errno;
  void *buffer[BT_BUF_SIZE];
  const int nptrs = backtrace(buffer, BT_BUF_SIZE);
  logIf(std::format("backtrace() returned {} addresses", nptrs));
  std::println(stderr, "backtrace() returned {} addresses", nptrs);

  if (char **strings = backtrace_symbols(buffer, nptrs); strings != nullptr) {
    for (int j = strip_levels; j < nptrs; j++) {
      std::string_view view{ strings[j] };
      if (const auto p = view.find("_Z"); p != std::string_view::npos) {
        view.remove_prefix(p);
        if (const auto plus = view.find('+'); plus != std::string_view::npos) {
          view = view.substr(0, plus);
        }
        std::string mangled{ view };
        int stat = 0;
        if (char *res = __cxxabiv1::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &stat); stat == 0) {
          std::string demangled{ res };
          free(res);
          replace_regex(demangled);
          logIf(demangled);
          std::println(stderr, "{}", demangled);
          continue;
        }
      }
      logIf(strings[j]);
      std::println(stderr, "{}", strings[j]);
    }
    free(strings);
  }

  const auto message =
    std::format("--- [PANIC] ---\n[FILE]: {}:{}\n[FUNCTION]: {}\n[REASON]: {}\nErrno: {}: {}\n--- [PANIC] ---",
      file,
      line,
      functionName,
      err_msg,
      savedErrno,
      strerror(savedErrno));
  logIf(message);
  std::println(stderr, "{}", message);
  logging::Logger::GetLogger()->OnAbort();
  std::_Exit(EXIT_FAILURE);
}

[[noreturn]] void
panic(std::string_view err_msg, const std::source_location &loc, int strip_levels)
{
  panic(err_msg, loc.function_name(), loc.file_name(), loc.line(), strip_levels);
}
} // namespace ldb
