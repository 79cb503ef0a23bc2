/** LICENSE TEMPLATE */
#pragma once
#include <algorithm>
#include <cctype>
#include <charconv>
#include <common/typedefs.h>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ldb {

template <typename ContainerType, typename ValueType>
constexpr bool
ContainsValue(const ContainerType &container, const ValueType &b) noexcept
{
  for (const auto &element : container) {
    if (element == b) {
      return true;
    }
  }
  return false;
}

template <typename Integral>
constexpr std::optional<Integral>
ParseInteger(std::string_view str, int base = 10) noexcept
  requires(std::is_integral_v<Integral>)
{
  Integral value;
  auto res = std::from_chars(str.data(), str.data() + str.size(), value, base);
  if (res.ec == std::errc() && res.ptr == str.data() + str.size()) {
    return value;
  }
  return {};
}

constexpr std::optional<Pid>
StrToPid(std::string_view str) noexcept
{
  return ParseInteger<Pid>(str);
}

template <typename Delimiter = std::string_view>
constexpr std::vector<std::string_view>
SplitString(std::string_view str, Delimiter delim) noexcept
{
  std::vector<std::string_view> result{};
  auto last = false;
  for (auto i = str.find(delim); i != std::string_view::npos || !last; i = str.find(delim)) {
    last = (i == std::string_view::npos);
    auto sub = str.substr(0, i);
    if (!sub.empty()) {
      result.push_back(sub);
    }
    if (!last) {
      str.remove_prefix(i + 1);
    }
  }
  return result;
}

constexpr std::string_view
TrimWhitespace(std::string_view str) noexcept
{
  while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
    str.remove_prefix(1);
  }
  while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
    str.remove_suffix(1);
  }
  return str;
}

inline std::string
ToLower(std::string_view str) noexcept
{
  std::string lowered;
  lowered.reserve(str.size());
  for (const auto c : str) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return lowered;
}

template <typename CA, typename CB>
constexpr void
CopyTo(const CA &c, CB &out)
{
  out.reserve(c.size() + out.size());
  std::copy(c.begin(), c.end(), std::back_inserter(out));
}

} // namespace ldb
