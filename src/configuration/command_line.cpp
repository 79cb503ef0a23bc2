/** LICENSE TEMPLATE */
#include "command_line.h"

// ldb
#include <common.h>
#include <utils/logger.h>

// std
#include <cstdlib>
#include <print>

// system
#include <sys/ioctl.h>
#include <unistd.h>

namespace ldb::cfg {
CommandLineResult
CommandLineRegistry::Parse(int argc, const char **argv) noexcept
{
  CommandLineResult result{};

  result.mErrors.reserve(argc > 1 ? argc - 1 : 0);
  for (auto &opt : GetOptions()) {
    opt->ApplyDefault();
  }
  ArgIterator it(argc, argv);
  while (it.HasNext()) {
    auto current = it.BeginNext();

    if (current == "-h" || current == "--help") {
      result.mHelpRequested = true;
      continue;
    }

    if (auto optionIter = mOptions.find(current); optionIter != std::end(mOptions)) {
      auto res = optionIter->second->Parse(it);
      if (!res) {
        result.mErrors.push_back(std::move(res.error()));
      }
    } else {
      result.mErrors.push_back(it.Error(ParseErrorType::UnrecognizedArgument).error());
    }
  }

  // Environment variables are soft options: a bad value leaves the default in place.
  ParseEnvironmentVariableOptions();
  mParseCompleted = true;
  return result;
}

void
CommandLineRegistry::ParseEnvironmentVariableOptions() noexcept
{
  for (auto &opt : GetEnvironmentVariableOptions()) {
    opt->ApplyDefault();
  }

  for (const auto &[k, v] : mEnvironmentVariables) {
    const std::string name{ k };
    if (auto value = getenv(name.c_str()); value) {
      if (auto res = v->Parse(std::string_view{ value }); !res) {
        std::println(stderr, "ignoring environment variable {}={}: {}", name, value, res.error());
      }
    }
  }
}

std::pair<u16, u16>
CommandLineRegistry::GetTerminalSize() const noexcept
{
  struct winsize terminalSize;

  if (isatty(STDOUT_FILENO) && ioctl(STDOUT_FILENO, TIOCGWINSZ, &terminalSize) == 0 && terminalSize.ws_col > 0) {
    auto leftColumnWidth = static_cast<u16>(terminalSize.ws_col * 0.25);
    if (leftColumnWidth <= mLeftColumnDisplayWidth) {
      leftColumnWidth = static_cast<u16>(mLeftColumnDisplayWidth + 1);
    } else {
      // Give the left column at most a few characters of trailing white space.
      leftColumnWidth = std::min<u16>(leftColumnWidth, static_cast<u16>(mLeftColumnDisplayWidth + 4));
    }
    const auto rightColumnWidth = static_cast<u16>(terminalSize.ws_col - leftColumnWidth);

    return std::pair<u16, u16>{ leftColumnWidth, rightColumnWidth };
  }
  const auto left = static_cast<u16>(mLeftColumnDisplayWidth + 1);
  return std::pair<u16, u16>{ left, static_cast<u16>(std::max(40, 120 - left)) };
}

void
CommandLineRegistry::PrintHelpAbout(const OptionMetadata &option, u16 leftColumn, u16 rightColumn) const noexcept
{
  UsagePrintFormatting arg{ option, leftColumn, rightColumn };
  std::print("{}", arg);
}

void
CommandLineRegistry::PrintHelp() const noexcept
{
  std::println("Usage:\n");
  std::println("  ldb [options]\n");
  std::println("Options:\n");

  auto [leftColumn, rightColumn] = GetTerminalSize();

  for (const auto &option : GetOptions()) {
    PrintHelpAbout(*option, leftColumn, rightColumn);
  }

  std::println("\nEnvironment variables:\n");
  for (const auto &envVar : GetEnvironmentVariableOptions()) {
    PrintHelpAbout(*envVar, leftColumn, rightColumn);
  }
}

} // namespace ldb::cfg
