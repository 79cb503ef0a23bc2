/** LICENSE TEMPLATE */
#pragma once
#include <common/typedefs.h>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ldb {

class BreakpointStore;
class DebugSession;

struct ConsoleCommandResult
{
  bool mSuccess;
  std::string mContents;
};

// Abstract base class for commands read from the console, one per line
class ConsoleCommand
{
public:
  virtual ~ConsoleCommand() = default;
  virtual ConsoleCommandResult execute(std::span<std::string_view> args) noexcept = 0;
};

// Console Command Registry to store and retrieve commands
class ConsoleCommandRegistry
{
private:
  std::unordered_map<std::string, std::shared_ptr<ConsoleCommand>> mCommands;

public:
  void RegisterConsoleCommand(std::string_view name, std::shared_ptr<ConsoleCommand> command) noexcept;
  std::shared_ptr<ConsoleCommand> GetConsoleCommand(std::string_view name) noexcept;
  std::vector<std::string_view> GetCommandNameList() const noexcept;
};

// Splits a line into the command name and its whitespace separated arguments, then runs the command.
class ConsoleCommandInterpreter
{
private:
  ConsoleCommandRegistry registry;

public:
  void RegisterConsoleCommand(std::string_view name, std::shared_ptr<ConsoleCommand> command) noexcept;
  ConsoleCommandResult Interpret(std::string_view input) noexcept;
  std::vector<std::string_view> GetCommandNameList() const noexcept;
};

/// A command backed by a callable. The commands of the ldb console are all of this kind and are installed by
/// `RegisterSessionCommands`.
class GenericCommand : public ConsoleCommand
{
  using Function = std::function<ConsoleCommandResult(std::span<std::string_view>)>;
  Function mFunction;

  GenericCommand(std::string functionName, Function &&function) noexcept;

public:
  std::string mFunctionName;

  static std::shared_ptr<GenericCommand> CreateCommand(std::string name, Function &&function) noexcept;

  std::string_view
  CommandName() const noexcept
  {
    return mFunctionName;
  }
  ConsoleCommandResult execute(std::span<std::string_view> args) noexcept override;
};

struct SourceLocation
{
  std::string mFile;
  u32 mLine;
};

// Parses `<file>:<line>`. The last ':' separates the two, so paths may contain colons.
std::optional<SourceLocation> ParseSourceLocation(std::string_view text) noexcept;

// Joins `args` with single spaces.
std::string JoinArguments(std::span<std::string_view> args) noexcept;

// c, n, s, o, p, b, d, e, frames, q. `quit` is set by q.
void RegisterSessionCommands(ConsoleCommandInterpreter &interpreter,
  std::shared_ptr<DebugSession> session,
  BreakpointStore &breakpoints,
  std::function<void()> quit) noexcept;
} // namespace ldb
