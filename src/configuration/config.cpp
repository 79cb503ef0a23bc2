/** LICENSE TEMPLATE */
#include "config.h"

// ldb
#include <configuration/command_line.h>
#include <utils/util.h>

// std
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

namespace ldb::cfg {

SessionConfig
InitializationConfiguration::BuildSessionConfig() const noexcept
{
  SessionConfig config{};
  config.mProtocol = mProtocol;
  config.mHost = mHost;
  config.mPort = mPort;
  config.mAttach.mPid = mPid;
  config.mAttach.mArch = mArch;
  config.mAttach.mToolDirectory = mToolDirectory;
  config.mAttach.mCaptureLog = mCaptureLog;
  config.mAttach.mRetryCount = mAttachRetries;
  config.mAttach.mRetryDelay = std::chrono::milliseconds{ mAttachRetryDelayMs };
  config.mAttach.mSettleDelay = std::chrono::milliseconds{ mAttachSettleMs };
  config.mDetachSettle = std::chrono::milliseconds{ mDetachSettleMs };
  config.mHelperScriptRoot = mHelperScriptRoot;
  if (!mTypeRegistryScript.empty()) {
    config.mTypeRegistryScript = mTypeRegistryScript;
  }
  config.mStopOnEntry = mStopOnEntry;
  config.mUseCHook = mUseCHook;
  config.mLuaLogLevel = mLuaLogLevel;
  config.mWorkingDirectory = mWorkingDirectory;
  return config;
}

InitializationConfiguration *
InitializationConfiguration::ConfigureWithParser(CommandLineRegistry &parser) noexcept
{
  auto *config = new InitializationConfiguration{};
  // hardware_concurrency may report 0 or 1 (containers, rr).
  const u32 minimumThreadPoolSize =
    std::thread::hardware_concurrency() > 4 ? std::min(std::thread::hardware_concurrency() - 2, 8u) : 2u;

  parser.AddOption<ArgIterator &>("-t",
    "--threads",
    "Configure the worker thread pool size. Connection setup, attach and detach run on this pool.",
    config->mThreadPoolSize,
    &FromTraits<u32>::From,
    minimumThreadPoolSize);

  parser.AddOption<ArgIterator &>(
    "-l",
    "--log",
    "The directory where log files should be saved. If that directory doesn't exist, it will not be created for "
    "you, and ldb will terminate.",
    config->mLogDirectory,
    [](ArgIterator &it) noexcept -> ParseResult<fs::path> {
      auto arg = TryExpected(it);
      if (fs::exists(arg) && fs::is_directory(arg)) {
        return fs::path{ arg };
      }
      return it.Error(ParseErrorType::DirectoryDoesNotExist);
    },
    fs::current_path());

  parser.AddOption<ArgIterator &>(
    "-p",
    "--protocol",
    "Debug protocol: 'emmy-attach' injects into --pid through the helper tool, 'luapanda-client' dials "
    "--host:--port, 'luapanda-server' listens on --port for the debuggee.",
    config->mProtocol,
    [](ArgIterator &it) noexcept -> ParseResult<ProtocolKind> {
      auto arg = TryExpected(it);
      if (auto protocol = ProtocolFromCliName(ToLower(arg)); protocol) {
        return *protocol;
      }
      return it.Error(ParseErrorType::UnknownProtocol);
    },
    ProtocolKind::EmmyAttach);

  parser.AddOption<ArgIterator &>(
    "", "--pid", "Target process to attach to (emmy-attach).", config->mPid, &FromTraits<i32>::From, 0);

  parser.AddOption<ArgIterator &>(
    "",
    "--arch",
    "Expected architecture of the target process, x86 or x64. The detected architecture wins on mismatch.",
    config->mArch,
    [](ArgIterator &it) noexcept -> ParseResult<Arch> {
      auto arg = TryExpected(it);
      const auto lowered = ToLower(arg);
      if (lowered == "x64") {
        return Arch::X64;
      }
      if (lowered == "x86") {
        return Arch::X86;
      }
      return it.Error(ParseErrorType::UnknownArchitecture);
    },
    Arch::X64);

  parser.AddOption<ArgIterator &>("",
    "--tool-dir",
    "Directory containing <arch>/emmy_tool and <arch>/emmy_hook.so.",
    config->mToolDirectory,
    &FromTraits<fs::path>::From,
    fs::current_path() / "debugger" / "emmy" / "linux");

  parser.AddOption<ArgIterator &>(
    "", "--host", "Host the luapanda client dials.", config->mHost, &FromTraits<std::string>::From, "localhost");

  parser.AddOption<ArgIterator &>(
    "", "--port", "LuaPanda port (client and server).", config->mPort, &FromTraits<i32>::From, 8818);

  parser.AddOption<ArgIterator &>("",
    "--attach-retries",
    "Number of connection attempts after injecting.",
    config->mAttachRetries,
    &FromTraits<u32>::From,
    15u);

  parser.AddOption<ArgIterator &>("",
    "--attach-retry-delay",
    "Milliseconds between connection attempts.",
    config->mAttachRetryDelayMs,
    &FromTraits<u32>::From,
    2000u);

  parser.AddOption<ArgIterator &>("",
    "--attach-settle",
    "Milliseconds to wait after injection before the first connection attempt.",
    config->mAttachSettleMs,
    &FromTraits<u32>::From,
    100u);

  parser.AddOption<ArgIterator &>("",
    "--detach-settle",
    "Milliseconds the detach cleanup waits after closing the connection.",
    config->mDetachSettleMs,
    &FromTraits<u32>::From,
    300u);

  parser.AddOption<ArgIterator &>("",
    "--capture-log",
    "Ask the helper tool to capture the target's log output.",
    config->mCaptureLog,
    &FromTraits<bool>::From,
    false);

  parser.AddOption<ArgIterator &>("",
    "--helper-script",
    "Root directory of the Emmy bootstrap scripts (debugger/emmy/emmyHelper.lua is resolved under it).",
    config->mHelperScriptRoot,
    &FromTraits<fs::path>::From,
    fs::current_path());

  parser.AddOption<ArgIterator &>("",
    "--type-registry",
    "Custom type registry script spliced into the Emmy bootstrap.",
    config->mTypeRegistryScript,
    &FromTraits<fs::path>::From,
    fs::path{});

  parser.AddOption<ArgIterator &>("",
    "--stop-on-entry",
    "LuaPanda: break on the first line.",
    config->mStopOnEntry,
    &FromTraits<bool>::From,
    false);

  parser.AddOption<ArgIterator &>(
    "", "--use-chook", "LuaPanda: use the C hook library.", config->mUseCHook, &FromTraits<bool>::From, false);

  parser.AddOption<ArgIterator &>("",
    "--lua-log-level",
    "LuaPanda debugger-side log level.",
    config->mLuaLogLevel,
    &FromTraits<i32>::From,
    1);

  parser.AddOption<ArgIterator &>("",
    "--cwd",
    "LuaPanda: working directory reported to the debuggee.",
    config->mWorkingDirectory,
    &FromTraits<std::string>::From,
    fs::current_path().string());

#define LOG_HELP(channel, name, help) "\n - " #channel ": " help

  parser.AddEnvironmentVariable<std::vector<Channel>>("LOG",
    "Configure what logging channels should be opened\n" FOR_EACH_LOG(LOG_HELP),
    config->mLogChannels,
    [](std::string_view &stringView) -> ParseResult<std::vector<Channel>> {
      std::vector<Channel> result{};
      auto splits = SplitString(stringView, ',');
      if (std::ranges::any_of(splits, [](std::string_view cfg) { return cfg == "all"; })) {
        auto channels = Enum<Channel>::Variants();
        CopyTo(channels, result);
        return result;
      }

      result.reserve(splits.size());
      for (const auto &el : splits) {
        if (const auto chan = Enum<Channel>::FromString(el); chan) {
          result.push_back(*chan);
        }
      }
      return result;
    });
#undef LOG_HELP

  return config;
}
} // namespace ldb::cfg
