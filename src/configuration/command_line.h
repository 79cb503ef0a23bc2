/** LICENSE TEMPLATE */
#pragma once

// ldb
#include <common.h>
#include <common/formatter.h>
#include <common/typedefs.h>
#include <utils/command.h>
#include <utils/util.h>
// std
#include <charconv>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

using namespace std::string_view_literals;

namespace ldb::cfg {

#define FOR_CLI_EACH_PARSE_ERROR(MAKE_ERR)                                                                        \
  MAKE_ERR(None, "Error not set.")                                                                                \
  MAKE_ERR(ArgNotFound, "Argument not found.")                                                                    \
  MAKE_ERR(MissingArgValue, "Command line option is missing it's value.")                                         \
  MAKE_ERR(InvalidFormat, "Invalid format of argument.")                                                          \
  MAKE_ERR(OptionIsNotFlag, "Option is not a flag.")                                                              \
  MAKE_ERR(UnrecognizedArgument, "Argument is not a recognized option.")                                          \
  MAKE_ERR(UnknownProtocol, "Protocol must be one of: emmy-attach, luapanda-client, luapanda-server")             \
  MAKE_ERR(UnknownArchitecture, "Architecture must be one of: x86, x64")                                          \
  MAKE_ERR(DirectoryDoesNotExist, "Directory does not exist")

enum class ParseErrorType : u8
{
  FOR_CLI_EACH_PARSE_ERROR(DEFAULT_ENUM)
};

struct ParseOk
{
};

struct ParserError
{
  ParseErrorType mError;
  std::vector<std::string_view> mInputs;

  operator std::unexpected<ParserError>() && noexcept { return std::unexpected<ParserError>(std::move(*this)); }
};

template <typename T> using ParseResult = std::expected<T, ParserError>;

class ArgIterator
{
public:
  constexpr ArgIterator(int argc, const char **argv) : mArgCount(argc), mArgs(argv) {}

  bool
  HasNext() const noexcept
  {
    return mIndex < mArgCount;
  }

  // Marks the start of the next option. Everything consumed until the next call is reported by Error().
  std::string_view
  BeginNext() noexcept
  {
    RememberPosition();
    return *GetNext();
  }

  std::optional<std::string_view>
  GetNext() noexcept
  {
    if (mInsideInlineArgument) {
      std::string_view value = mArgs[mIndex];
      value.remove_prefix(mInsideInlineArgument.value());
      mInsideInlineArgument = {};
      ++mIndex;
      return value;
    }

    if (!HasNext()) {
      return std::nullopt;
    }
    std::string_view value = mArgs[mIndex];
    auto inlineValuePos = value.find_first_of('=');
    if (value.starts_with('-') && inlineValuePos != value.npos) {
      mInsideInlineArgument = inlineValuePos + 1;
      return value.substr(0, inlineValuePos);
    } else {
      ++mIndex;
    }
    return value;
  }

  std::span<const char *>
  Args() const noexcept
  {
    return std::span{ mArgs, mArgs + mArgCount };
  }

  std::unexpected<ParserError>
  Error(ParseErrorType type) noexcept
  {
    return std::unexpected(ParserError{ type, GetArgsCurrentlyBeingParsed() });
  }

private:
  std::vector<std::string_view>
  GetArgsCurrentlyBeingParsed()
  {
    // Include the current argument, which may only have been partially parsed (inline `--foo=bar` values)
    const auto count = std::min(mIndex + 1, mArgCount) - mRememberedIndex;
    std::vector<std::string_view> result;
    CopyTo(Args().subspan(mRememberedIndex, count), result);
    return result;
  }

  void
  RememberPosition() noexcept
  {
    mRememberedIndex = mIndex;
  }

  int mArgCount;
  const char **mArgs;
  int mIndex{ 1 };
  std::optional<size_t> mInsideInlineArgument{};
  int mRememberedIndex{ 0 };
};

#ifndef TryExpected
#define TryExpected(iterator)                                                                                     \
  ({                                                                                                              \
    auto ___MAYBE_VALUE___ = iterator.GetNext();                                                                  \
    if (!___MAYBE_VALUE___) {                                                                                     \
      return iterator.Error(ParseErrorType::MissingArgValue);                                                     \
    }                                                                                                             \
    *___MAYBE_VALUE___;                                                                                           \
  })
#endif

struct OptionMetadata
{
  std::string mShortName;
  std::string mLongName;
  HelpMessage mInfo;
  bool mIsFlag;
};

template <typename ParseInput> struct IOption : OptionMetadata
{
  using Input = ParseInput;
  virtual std::expected<ParseOk, ParserError> Parse(ParseInput it) noexcept = 0;
  virtual void ApplyDefault() noexcept = 0;
  virtual ~IOption() noexcept = default;
};

template <typename T, typename ParseInput> class DirectOption : public IOption<ParseInput>
{
  using Data = OptionMetadata;
  using IBase = IOption<ParseInput>;

public:
  using ParserFn = ParseResult<T> (*)(typename IBase::Input &);

  DirectOption(std::string_view shortName,
    std::string_view longName,
    HelpMessage helpMessage,
    T &reference,
    ParserFn parser,
    T defaultValue)
      : mReference(&reference), mParseFn(parser), mDefault(std::move(defaultValue))
  {
    Data::mShortName = shortName;
    Data::mLongName = longName;
    Data::mInfo = helpMessage;
    Data::mIsFlag = std::is_same_v<T, bool>;
  }

  std::expected<ParseOk, ParserError>
  Parse(ParseInput it) noexcept override
  {
    auto result = mParseFn(it);
    if (!result) {
      return std::unexpected(std::move(result.error()));
    }
    *mReference = std::move(result.value());
    return ParseOk{};
  }

  void
  ApplyDefault() noexcept override
  {
    *mReference = mDefault;
  }

private:
  T *mReference;
  ParserFn mParseFn;
  T mDefault;
};

struct CommandLineResult
{
  std::vector<ParserError> mErrors;
  bool mHelpRequested{ false };
};

class CommandLineRegistry
{
  static constexpr auto UNIFORM_LINE_INDENT = 2;
  std::unordered_map<std::string_view, std::shared_ptr<IOption<ArgIterator &>>> mOptions;
  std::unordered_map<std::string_view, std::shared_ptr<IOption<std::string_view>>> mEnvironmentVariables;
  // Registration order, so that --help lists options the way they were added.
  std::vector<std::shared_ptr<IOption<ArgIterator &>>> mOptionOrder;
  // Width of the widest left column ("-c, --com <value>") for PrintHelp when the terminal size is unknown.
  size_t mLeftColumnDisplayWidth{ 0 };
  bool mParseCompleted{ false };

  void
  AssertUnique(std::string_view shortName, std::string_view longName) noexcept
  {
    VERIFY(!shortName.empty() || !longName.empty(), "You've not given this option a name!");
    if (!longName.empty()) {
      VERIFY(mOptions.count(longName) == 0, "Already added option {}", longName);
    }

    if (!shortName.empty()) {
      VERIFY(mOptions.count(shortName) == 0, "Already added option {}", shortName);
    }
  }

  void
  UpdateLeftColumnWidth(bool isFlag, std::string_view shortName, std::string_view longName) noexcept
  {
    const auto leftColumnWidth =
      shortName.size() + longName.size() + (isFlag ? 0 : kValuePlaceHolder.size()) + UNIFORM_LINE_INDENT;

    mLeftColumnDisplayWidth = std::max(mLeftColumnDisplayWidth, leftColumnWidth);
  }

  void
  AddOption(std::string_view shortName,
    std::string_view longName,
    std::shared_ptr<IOption<ArgIterator &>> &&item) noexcept
  {
    VERIFY(!mParseCompleted, "You are adding options after parse has completed.");
    AssertUnique(shortName, longName);
    mOptionOrder.push_back(item);
    // Keys view into the option's own name storage, which lives as long as the registry.
    if (!shortName.empty()) {
      mOptions.emplace(item->mShortName, item);
    }

    if (!longName.empty()) {
      mOptions.emplace(item->mLongName, std::move(item));
    }
  }

  void
  AddEnvironmentVariable(std::string_view name, std::shared_ptr<IOption<std::string_view>> &&item) noexcept
  {
    VERIFY(!mParseCompleted, "You are adding options after parse has completed.");
    VERIFY(mEnvironmentVariables.count(name) == 0, "Environment variable option already configured.");
    mEnvironmentVariables.emplace(item->mLongName, std::move(item));
  }

public:
  static constexpr auto kValuePlaceHolder = " <value> "sv;

  std::vector<std::shared_ptr<IOption<std::string_view>>>
  GetEnvironmentVariableOptions() const noexcept
  {
    std::vector<std::shared_ptr<IOption<std::string_view>>> result;
    result.reserve(mEnvironmentVariables.size());
    for (const auto &[k, v] : mEnvironmentVariables) {
      result.push_back(v);
    }
    return result;
  }

  const std::vector<std::shared_ptr<IOption<ArgIterator &>>> &
  GetOptions() const noexcept
  {
    return mOptionOrder;
  }

  template <typename ParseInput, typename T, typename ConvertibleToT>
  void
  AddOption(std::string_view shortName,
    std::string_view longName,
    HelpMessage message,
    T &variable,
    typename DirectOption<T, ParseInput>::ParserFn parser,
    ConvertibleToT defaultVal) noexcept
    requires(std::is_convertible_v<ConvertibleToT, T>)
  {
    UpdateLeftColumnWidth(std::is_same_v<T, bool>, shortName, longName);

    auto opt = std::make_shared<DirectOption<T, ParseInput>>(
      shortName, longName, message, variable, parser, T{ std::move(defaultVal) });

    AddOption(shortName, longName, std::move(opt));
  }

  template <typename T, typename ConvertibleToT = T>
  void
  AddEnvironmentVariable(std::string_view name,
    HelpMessage message,
    T &variable,
    typename DirectOption<T, std::string_view>::ParserFn parser,
    ConvertibleToT defaultVal = T{}) noexcept
    requires(std::is_convertible_v<ConvertibleToT, T>)
  {
    UpdateLeftColumnWidth(/* isFlag */ false, "", name);

    auto opt = std::make_shared<DirectOption<T, std::string_view>>(
      "", name, message, variable, parser, T{ std::move(defaultVal) });

    AddEnvironmentVariable(name, std::move(opt));
  }

  CommandLineResult Parse(int argc, const char **argv) noexcept;
  void ParseEnvironmentVariableOptions() noexcept;

  void PrintHelp() const noexcept;
  void PrintHelpAbout(const OptionMetadata &option, u16 leftColumn, u16 rightColumn) const noexcept;
  std::pair<u16, u16> GetTerminalSize() const noexcept;
};

template <typename ResultType> struct FromTraits;

#define NumberTrait(NumberType)                                                                                   \
  template <> struct FromTraits<NumberType>                                                                       \
  {                                                                                                               \
    static ParseResult<NumberType>                                                                                \
    From(ArgIterator &it)                                                                                         \
    {                                                                                                             \
      auto arg = TryExpected(it);                                                                                 \
                                                                                                                  \
      NumberType number;                                                                                          \
      auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), number);                              \
      if (ec == std::errc() && ptr == arg.data() + arg.size()) {                                                  \
        return number;                                                                                            \
      } else {                                                                                                    \
        return it.Error(ParseErrorType::InvalidFormat);                                                           \
      }                                                                                                           \
    }                                                                                                             \
                                                                                                                  \
    static ParseResult<NumberType>                                                                                \
    From(std::string_view &arg) noexcept                                                                          \
    {                                                                                                             \
      if (arg.empty())                                                                                            \
        return std::unexpected(ParserError{ ParseErrorType::MissingArgValue, {} });                               \
      NumberType number;                                                                                          \
      auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), number);                              \
      if (ec == std::errc() && ptr == arg.data() + arg.size()) {                                                  \
        return number;                                                                                            \
      } else {                                                                                                    \
        return std::unexpected(ldb::cfg::ParserError{ ParseErrorType::InvalidFormat, { arg } });                  \
      }                                                                                                           \
    }                                                                                                             \
  };

#define FOR_EACH_PRIMITIVE(PRIM)                                                                                  \
  PRIM(i32)                                                                                                       \
  PRIM(i64)                                                                                                       \
  PRIM(u32)                                                                                                       \
  PRIM(u64)

#define AsIsTrait(Type)                                                                                           \
  template <> struct FromTraits<Type>                                                                             \
  {                                                                                                               \
    static ParseResult<Type>                                                                                      \
    From(ArgIterator &it)                                                                                         \
    {                                                                                                             \
      auto arg = TryExpected(it);                                                                                 \
      return Type{ arg };                                                                                         \
    }                                                                                                             \
                                                                                                                  \
    static ParseResult<Type>                                                                                      \
    From(std::string_view &arg) noexcept                                                                          \
    {                                                                                                             \
      return Type{ arg };                                                                                         \
    }                                                                                                             \
  };

#define FOR_EACH_AS_IS(AS_IS)                                                                                     \
  AS_IS(std::string)                                                                                              \
  AS_IS(std::filesystem::path)

FOR_EACH_AS_IS(AsIsTrait)

FOR_EACH_PRIMITIVE(NumberTrait)

// Flags take no value; their presence means true.
template <> struct FromTraits<bool>
{
  static ParseResult<bool>
  From(ArgIterator &) noexcept
  {
    return true;
  }
};

} // namespace ldb::cfg

template <> struct std::formatter<ldb::cfg::ParseErrorType>
{
  BASIC_PARSE

  template <typename FormatContext>
  constexpr auto
  format(const ldb::cfg::ParseErrorType &option, FormatContext &context) const noexcept
  {
#define PARSE_ERROR_MSG(EnumValue, Message, ...)                                                                  \
  case ldb::cfg::ParseErrorType::EnumValue:                                                                       \
    return std::format_to(context.out(), Message);

    switch (option) {
      FOR_CLI_EACH_PARSE_ERROR(PARSE_ERROR_MSG)
    }
#undef PARSE_ERROR_MSG
    LDB_UNREACHABLE
  }
};

template <typename T> struct UsagePrintFormatting
{
  using Type = T;
  const T &mValue;
  const std::uint16_t mLeftColumnWidth{ 20 };
  const std::uint16_t mRightColumnWidth{ 80 };
};

template <> struct std::formatter<UsagePrintFormatting<ldb::cfg::OptionMetadata>>
{
  BASIC_PARSE

  template <typename FormatContext>
  constexpr auto
  format(const UsagePrintFormatting<ldb::cfg::OptionMetadata> &option, FormatContext &context) const noexcept
  {
    i64 columnSpaceLeft = option.mLeftColumnWidth;
    auto it = std::format_to(context.out(), "  ");
    columnSpaceLeft -= 2;
    const auto &opt = option.mValue;

    if (!opt.mShortName.empty()) {
      it = std::format_to(it, "{}, ", opt.mShortName);
      columnSpaceLeft -= static_cast<i64>(opt.mShortName.size() + 2);
    }

    if (!opt.mLongName.empty()) {
      columnSpaceLeft -= static_cast<i64>(opt.mLongName.size());
      it = std::format_to(it, "{}", opt.mLongName);
    }

    if (!opt.mIsFlag) {
      columnSpaceLeft -= static_cast<i64>(ldb::cfg::CommandLineRegistry::kValuePlaceHolder.size());
      it = std::format_to(it, "{}", ldb::cfg::CommandLineRegistry::kValuePlaceHolder);
    }
    it = std::format_to(it, "{:<{}}", "", std::max<i64>(columnSpaceLeft, 1));

    auto lines = opt.mInfo.CreateLinesOfWidth(option.mRightColumnWidth);
    auto span = std::span{ lines };
    for (const auto &line : span.subspan(0, std::min<size_t>(1, span.size()))) {
      it = std::format_to(it, "{}\n", line);
    }

    if (span.size() > 1) {
      for (const auto &line : span.subspan(1)) {
        it = std::format_to(it, "{:<{}}{}\n", "", option.mLeftColumnWidth, line);
      }
    }
    return it;
  }
};

template <> struct std::formatter<ldb::cfg::ParserError>
{
  BASIC_PARSE

  template <typename FormatContext>
  constexpr auto
  format(const ldb::cfg::ParserError &error, FormatContext &ctx) const noexcept
  {
    auto it = std::format_to(ctx.out(), "Parse error: {}", error.mError);
    for (const auto input : error.mInputs) {
      it = std::format_to(it, " {}", input);
    }
    return it;
  }
};

#undef FOR_CLI_EACH_PARSE_ERROR
