/** LICENSE TEMPLATE */
#pragma once

#include <cctype>
#include <common/typedefs.h>
#include <string_view>
#include <vector>

namespace ldb {
struct HelpMessage
{
  std::string_view mInfo{};

  constexpr HelpMessage() noexcept = default;
  constexpr HelpMessage(std::string_view message) noexcept : mInfo(message) {}
  constexpr HelpMessage(const char *message) noexcept : mInfo(message) {}

  // Splits the message on explicit newlines and on the last whitespace before `width`.
  template <PushBackContainer ContainerType>
  void
  CreateLinesOfWidth(ContainerType &outResult, size_t width) const noexcept
  {
    size_t lastWordBoundary = 0;
    auto txt = mInfo;
    i64 i = 0;

    const auto processPrefix = [&](auto prefixLen, bool recordLine) noexcept {
      if (recordLine) {
        outResult.push_back(txt.substr(0, prefixLen));
      }
      txt.remove_prefix(prefixLen);
      i = -1;
      lastWordBoundary = 0;
    };

    for (; i < static_cast<i64>(txt.size()); ++i) {
      lastWordBoundary = std::isspace(static_cast<unsigned char>(txt[i])) ? i : lastWordBoundary;
      if (txt[i] == '\n') {
        if (i == 0) {
          processPrefix(1, false);
          continue;
        }
        const auto subLength = (lastWordBoundary == 0 ? i : lastWordBoundary);
        processPrefix(subLength, true);
        processPrefix(1, false);
        continue;
      }
      if (i == static_cast<i64>(width)) {
        const auto subLength = lastWordBoundary == 0 ? width : lastWordBoundary;
        processPrefix(subLength, true);
      }
    }
    if (!txt.empty()) {
      outResult.push_back(txt);
    }
  }

  std::vector<std::string_view>
  CreateLinesOfWidth(size_t width) const noexcept
  {
    std::vector<std::string_view> result;
    CreateLinesOfWidth(result, width);
    return result;
  }
};
} // namespace ldb
