/** LICENSE TEMPLATE */
#pragma once
// ldb
#include <common/formatter.h>
#include <common/typedefs.h>

// stdlib
#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#if defined(__clang__)
#define LDB_UNREACHABLE std::unreachable();
#elif defined(__GNUC__) || defined(__GNUG__)
#define LDB_UNREACHABLE __builtin_unreachable();
#endif

#ifndef NO_COPY
/// Types that use NO_COPY in this codebase tend to be created and used via pointers, both raw and smart alike
#define NO_COPY(CLASS)                                                                                            \
  CLASS(const CLASS &) = delete;                                                                                  \
  CLASS(CLASS &) = delete;                                                                                        \
  CLASS &operator=(CLASS &) = delete;                                                                             \
  CLASS &operator=(const CLASS &) = delete;
#endif

#ifndef MOVE_ONLY
#define MOVE_ONLY(CLASS)                                                                                          \
  CLASS(const CLASS &) = delete;                                                                                  \
  CLASS(CLASS &) = delete;                                                                                        \
  CLASS &operator=(CLASS &) = delete;                                                                             \
  CLASS &operator=(const CLASS &) = delete;
#endif

#define DEFAULT_ENUM(Value, ...) Value,

#define STRINGIFY_VAL(x, ...) #x,

template <typename T> struct Enum
{
  static constexpr u32 Count() noexcept;
  static constexpr std::optional<T> FromInt(int value) noexcept;
};

#define ENUM_FMT(ENUM_TYPE)                                                                                       \
  template <> struct std::formatter<ENUM_TYPE> : public Default<ENUM_TYPE>                                        \
  {                                                                                                               \
    template <typename FormatContext>                                                                             \
    auto                                                                                                          \
    format(const ENUM_TYPE &value, FormatContext &ctx) const                                                      \
    {                                                                                                             \
      return std::format_to(ctx.out(), "{}", Enum<ENUM_TYPE>::ToString(value));                                   \
    }                                                                                                             \
  }

// Must be used at global namespace scope; ENUM_TYPE may be qualified.
#define PREDEFINED_ENUM_TYPE_METADATA(ENUM_TYPE, DETAIL_NAME, FOR_EACH)                                           \
  namespace detail::DETAIL_NAME##Scope {                                                                           \
  using enum ENUM_TYPE;                                                                                           \
  static constexpr auto DETAIL_NAME##Ids = std::to_array<ENUM_TYPE>({ FOR_EACH(DEFAULT_ENUM) });                  \
  static constexpr auto DETAIL_NAME##Names = std::to_array<std::string_view>({ FOR_EACH(STRINGIFY_VAL) });        \
  }                                                                                                               \
  namespace detail {                                                                                              \
  using DETAIL_NAME##Scope::DETAIL_NAME##Ids;                                                                     \
  using DETAIL_NAME##Scope::DETAIL_NAME##Names;                                                                   \
  }                                                                                                               \
  template <> struct Enum<ENUM_TYPE>                                                                              \
  {                                                                                                               \
    static consteval auto                                                                                         \
    EnumBaseOffset() noexcept                                                                                     \
    {                                                                                                             \
      return std::to_underlying(detail::DETAIL_NAME##Ids[0]);                                                     \
    }                                                                                                             \
                                                                                                                  \
    static constexpr u32                                                                                          \
    Count() noexcept                                                                                              \
    {                                                                                                             \
      return detail::DETAIL_NAME##Ids.size();                                                                     \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::optional<ENUM_TYPE>                                                                     \
    FromInt(auto value) noexcept                                                                                  \
    {                                                                                                             \
      using enum ENUM_TYPE;                                                                                       \
      for (auto id : detail::DETAIL_NAME##Ids) {                                                                  \
        if (std::to_underlying(id) == value) {                                                                    \
          return id;                                                                                              \
        }                                                                                                         \
      }                                                                                                           \
      return std::nullopt;                                                                                        \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::span<const ENUM_TYPE>                                                                   \
    Variants() noexcept                                                                                           \
    {                                                                                                             \
      return std::span{ detail::DETAIL_NAME##Ids };                                                               \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::string_view                                                                             \
    ToString(ENUM_TYPE value) noexcept                                                                            \
    {                                                                                                             \
      static constexpr auto INDEX_OFFSET = EnumBaseOffset();                                                      \
      return detail::DETAIL_NAME##Names[std::to_underlying(value) - INDEX_OFFSET];                                \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::span<const std::string_view>                                                            \
    Names() noexcept                                                                                              \
    {                                                                                                             \
      return std::span{ detail::DETAIL_NAME##Names };                                                             \
    }                                                                                                             \
                                                                                                                  \
    static constexpr std::optional<ENUM_TYPE>                                                                     \
    FromString(std::string_view str) noexcept                                                                     \
    {                                                                                                             \
      auto index = 0;                                                                                             \
      for (const auto &n : Names()) {                                                                             \
        if (n == str)                                                                                             \
          return detail::DETAIL_NAME##Ids[index];                                                                 \
        ++index;                                                                                                  \
      }                                                                                                           \
      return {};                                                                                                  \
    }                                                                                                             \
  };                                                                                                              \
  ENUM_FMT(ENUM_TYPE);

// Declares a contiguous enum starting at 0 in the global namespace and generates its metadata.
#define ENUM_TYPE_METADATA(ENUM_TYPE, FOR_EACH, EACH_FN, UNDERLYING_TYPE)                                         \
  enum class ENUM_TYPE : UNDERLYING_TYPE                                                                          \
  {                                                                                                               \
    FOR_EACH(EACH_FN)                                                                                             \
  };                                                                                                              \
  PREDEFINED_ENUM_TYPE_METADATA(ENUM_TYPE, ENUM_TYPE, FOR_EACH)
