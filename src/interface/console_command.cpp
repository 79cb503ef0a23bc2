/** LICENSE TEMPLATE */
#include "console_command.h"
#include <bp_spec.h>
#include <algorithm>
#include <fmt/core.h>
#include <format>
#include <session/debug_session.h>
#include <utility>
#include <utils/logger.h>
#include <utils/util.h>

/// ConsoleCommandRegistry implementation
namespace ldb {
void
ConsoleCommandRegistry::RegisterConsoleCommand(std::string_view name,
  std::shared_ptr<ConsoleCommand> command) noexcept
{
  mCommands[std::string{ name }] = std::move(command);
}

std::shared_ptr<ConsoleCommand>
ConsoleCommandRegistry::GetConsoleCommand(std::string_view name) noexcept
{
  auto it = mCommands.find(std::string{ name });
  if (it != mCommands.end()) {
    return it->second;
  } else {
    return nullptr;
  }
}

std::vector<std::string_view>
ConsoleCommandRegistry::GetCommandNameList() const noexcept
{
  std::vector<std::string_view> result;
  result.reserve(mCommands.size());
  for (const auto &[name, command] : mCommands) {
    result.push_back(name);
  }
  std::ranges::sort(result);
  return result;
}

/// ConsoleCommandInterpreter Implementations
void
ConsoleCommandInterpreter::RegisterConsoleCommand(std::string_view name,
  std::shared_ptr<ConsoleCommand> command) noexcept
{
  registry.RegisterConsoleCommand(name, std::move(command));
}

ConsoleCommandResult
ConsoleCommandInterpreter::Interpret(std::string_view input) noexcept
{
  auto words = SplitString(TrimWhitespace(input), ' ');
  std::erase_if(words, [](std::string_view word) { return TrimWhitespace(word).empty(); });
  if (words.empty()) {
    return ConsoleCommandResult{ true, "" };
  }
  auto command = registry.GetConsoleCommand(words.front());
  if (!command) {
    return ConsoleCommandResult{ false, std::format("unknown command '{}'", words.front()) };
  }
  auto args = std::span{ words }.subspan(1);
  return command->execute(args);
}

std::vector<std::string_view>
ConsoleCommandInterpreter::GetCommandNameList() const noexcept
{
  return registry.GetCommandNameList();
}

GenericCommand::GenericCommand(std::string functionName, Function &&function) noexcept
    : mFunction(std::move(function)), mFunctionName(std::move(functionName))
{
}

/* static */
std::shared_ptr<GenericCommand>
GenericCommand::CreateCommand(std::string name, GenericCommand::Function &&function) noexcept
{
  return std::shared_ptr<GenericCommand>(new GenericCommand{ std::move(name), std::move(function) });
}

ConsoleCommandResult
GenericCommand::execute(std::span<std::string_view> args) noexcept
{
  return mFunction(args);
}

std::optional<SourceLocation>
ParseSourceLocation(std::string_view text) noexcept
{
  const auto colon = text.rfind(':');
  if (colon == std::string_view::npos || colon == 0) {
    return std::nullopt;
  }
  const auto line = ParseInteger<u32>(text.substr(colon + 1));
  if (!line || *line == 0) {
    return std::nullopt;
  }
  return SourceLocation{ std::string{ text.substr(0, colon) }, *line };
}

std::string
JoinArguments(std::span<std::string_view> args) noexcept
{
  std::string result;
  for (const auto arg : args) {
    if (!result.empty()) {
      result.push_back(' ');
    }
    result.append(arg);
  }
  return result;
}

static std::string
FormatVariable(const Variable &variable, int depth) noexcept
{
  auto text = std::format("{:{}}{} = {} ({})", "", depth * 2, variable.mName, variable.mValue, variable.mTypeName);
  for (const auto &child : variable.mChildren) {
    text.push_back('\n');
    text.append(FormatVariable(child, depth + 1));
  }
  return text;
}

static std::string
FormatFrames(const PausedEvent &paused) noexcept
{
  std::string text;
  for (size_t i = 0; i < paused.mFrames.size(); ++i) {
    const auto &frame = paused.mFrames[i];
    text.append(std::format("{} #{} {} {}:{}\n",
      i == paused.mTopFrame ? '*' : ' ',
      frame.mIndex,
      frame.mFunctionName.empty() ? std::string_view{ "?" } : std::string_view{ frame.mFunctionName },
      frame.mFile,
      frame.mLine));
  }
  return text;
}

void
RegisterSessionCommands(ConsoleCommandInterpreter &interpreter,
  std::shared_ptr<DebugSession> session,
  BreakpointStore &breakpoints,
  std::function<void()> quit) noexcept
{
  const auto runControl = [&interpreter, session](std::string name, void (DebugSession::*fn)() noexcept) {
    interpreter.RegisterConsoleCommand(
      name, GenericCommand::CreateCommand(name, [session, fn](std::span<std::string_view>) {
        ((*session).*fn)();
        return ConsoleCommandResult{ true, "" };
      }));
  };
  runControl("c", &DebugSession::Resume);
  runControl("n", &DebugSession::StepOver);
  runControl("s", &DebugSession::StepIn);
  runControl("o", &DebugSession::StepOut);
  runControl("p", &DebugSession::Pause);

  interpreter.RegisterConsoleCommand(
    "b", GenericCommand::CreateCommand("b", [session, &breakpoints](std::span<std::string_view> args) {
      if (args.empty()) {
        return ConsoleCommandResult{ false, "usage: b <file>:<line> [condition]" };
      }
      auto location = ParseSourceLocation(args.front());
      if (!location) {
        return ConsoleCommandResult{ false, std::format("bad source location '{}'", args.front()) };
      }
      BreakpointDescriptor descriptor{ .mFilePath = location->mFile, .mLine = location->mLine };
      if (args.size() > 1) {
        descriptor.mCondition = JoinArguments(args.subspan(1));
      }
      if (auto replaced = breakpoints.Remove(location->mFile, location->mLine); replaced) {
        session->OnBreakpointRemoved(std::move(replaced));
      }
      session->OnBreakpointAdded(breakpoints.Add(std::move(descriptor)));
      return ConsoleCommandResult{ true, std::format("breakpoint at {}:{}", location->mFile, location->mLine) };
    }));

  interpreter.RegisterConsoleCommand(
    "d", GenericCommand::CreateCommand("d", [session, &breakpoints](std::span<std::string_view> args) {
      auto location = args.empty() ? std::nullopt : ParseSourceLocation(args.front());
      if (!location) {
        return ConsoleCommandResult{ false, "usage: d <file>:<line>" };
      }
      auto removed = breakpoints.Remove(location->mFile, location->mLine);
      if (!removed) {
        return ConsoleCommandResult{ false, std::format("no breakpoint at {}:{}", location->mFile, location->mLine) };
      }
      session->OnBreakpointRemoved(std::move(removed));
      return ConsoleCommandResult{ true, "" };
    }));

  interpreter.RegisterConsoleCommand(
    "e", GenericCommand::CreateCommand("e", [session](std::span<std::string_view> args) {
      if (args.empty()) {
        return ConsoleCommandResult{ false, "usage: e <expression>" };
      }
      auto expression = JoinArguments(args);
      session->Evaluate(expression, std::nullopt, [expression](EvaluationResult result) {
        if (result) {
          fmt::print("{}\n", FormatVariable(*result, 0));
        } else {
          fmt::print("error evaluating '{}': {}\n", expression, result.error());
        }
      });
      return ConsoleCommandResult{ true, "" };
    }));

  interpreter.RegisterConsoleCommand(
    "frames", GenericCommand::CreateCommand("frames", [session](std::span<std::string_view>) {
      auto paused = session->CurrentPause();
      if (!paused) {
        return ConsoleCommandResult{ false, "not paused" };
      }
      return ConsoleCommandResult{ true, FormatFrames(*paused) };
    }));

  interpreter.RegisterConsoleCommand(
    "q", GenericCommand::CreateCommand("q", [session, quit = std::move(quit)](std::span<std::string_view>) {
      session->Stop();
      quit();
      return ConsoleCommandResult{ true, "" };
    }));
}
} // namespace ldb
