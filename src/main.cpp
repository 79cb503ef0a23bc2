/** LICENSE TEMPLATE */
#include "./utils/logger.h"
#include "attach/attachment_registry.h"
#include "bp_spec.h"
#include "configuration/command_line.h"
#include "configuration/config.h"
#include "interface/console_command.h"
#include "session/debug_session.h"
#include "session/script_provider.h"
#include "utils/thread_pool.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fmt/core.h>
#include <iostream>
#include <poll.h>
#include <string>
#include <unistd.h>

namespace {
std::atomic<bool> sInterrupted{ false };

class ConsolePrinter final : public ldb::SessionListener
{
public:
  void
  OnStateChanged(ldb::SessionId id, ldb::SessionState from, ldb::SessionState to) noexcept final
  {
    fmt::print("[session {}] {} -> {}\n", id, Enum<ldb::SessionState>::ToString(from),
      Enum<ldb::SessionState>::ToString(to));
  }

  void
  OnPaused(ldb::SessionId id, const ldb::PausedEvent &event) noexcept final
  {
    const auto &top = event.TopFrame();
    fmt::print("[session {}] paused ({}) at {}:{} in {}\n", id, event.mReason, top.mFile, top.mLine,
      top.mFunctionName);
  }

  void
  OnLog(ldb::SessionId id, ldb::LogSeverity severity, std::string_view text) noexcept final
  {
    fmt::print("[session {}] {}: {}\n", id, Enum<ldb::LogSeverity>::ToString(severity), text);
  }

  void
  OnTerminated(ldb::SessionId id, const std::optional<ldb::SessionError> &error) noexcept final
  {
    if (error) {
      fmt::print("[session {}] terminated: {} - {}\n", id, Enum<ldb::SessionErrorKind>::ToString(error->mKind),
        error->mMessage);
    } else {
      fmt::print("[session {}] terminated\n", id);
    }
  }
};

// True when a line can be read from stdin without blocking.
bool
WaitForInput(std::chrono::milliseconds timeout) noexcept
{
  pollfd fd{ .fd = STDIN_FILENO, .events = POLLIN, .revents = 0 };
  return ::poll(&fd, 1, static_cast<int>(timeout.count())) > 0 && (fd.revents & (POLLIN | POLLHUP)) != 0;
}
} // namespace

int
main(int argc, const char **argv)
{
  using ldb::logging::Logger;
  signal(SIGINT, [](int) { sInterrupted = true; });
  signal(SIGTERM, [](int) { sInterrupted = true; });

  ldb::cfg::CommandLineRegistry parser{};
  auto *config = ldb::cfg::InitializationConfiguration::ConfigureWithParser(parser);
  auto parsed = parser.Parse(argc, argv);
  if (parsed.mHelpRequested) {
    parser.PrintHelp();
    return 0;
  }
  if (!parsed.mErrors.empty()) {
    for (const auto &err : parsed.mErrors) {
      fmt::print("{}\n", std::format("{}", err));
    }
    return -1;
  }
  if (config->mProtocol == ldb::ProtocolKind::EmmyAttach && config->mPid <= 0) {
    fmt::print("--pid is required for {}\n", ldb::ProtocolCliName(config->mProtocol));
    return -1;
  }

  Logger::ConfigureLogging(*config);

  std::span<const char *> args(argv, argc);
  DBGLOG(core, "LDB CLI Arguments");
  for (const auto arg : args.subspan(1)) {
    DBGLOG(core, "{}", arg);
  }

  ldb::ThreadPool::InitGlobalPool(config->mThreadPoolSize);

  ldb::AttachmentRegistry registry{};
  ldb::BreakpointStore breakpoints{};
  ldb::FileScriptProvider scripts{ config->mHelperScriptRoot };

  auto session = ldb::DebugSession::Create(config->BuildSessionConfig(),
    ldb::SessionDependencies{ .mBreakpoints = breakpoints, .mScripts = scripts, .mRegistry = &registry });
  session->AddListener(std::make_shared<ConsolePrinter>());

  std::atomic<bool> quit{ false };
  ldb::ConsoleCommandInterpreter interpreter{};
  ldb::RegisterSessionCommands(interpreter, session, breakpoints, [&quit]() { quit = true; });

  session->Start();

  std::string line;
  while (!quit && session->State() != ldb::SessionState::Terminated) {
    if (sInterrupted) {
      session->Stop();
      break;
    }
    if (!WaitForInput(std::chrono::milliseconds{ 100 })) {
      continue;
    }
    if (!std::getline(std::cin, line)) {
      session->Stop();
      break;
    }
    auto result = interpreter.Interpret(line);
    if (!result.mContents.empty()) {
      fmt::print("{}{}", result.mContents, result.mContents.ends_with('\n') ? "" : "\n");
    }
  }

  // Stop returns immediately. Give the peer its acknowledge window before tearing down.
  const auto grace = session->Config().mStopAcknowledgeTimeout + std::chrono::milliseconds{ 1000 };
  if (!session->WaitForTermination(grace)) {
    DBGLOG(warning, "session {} did not terminate within {}ms", session->Id(), grace.count());
  }
  session.reset();

  DBGLOG(core, "attached at exit: {}", registry.Summary());
  registry.ClearAll();
  ldb::ThreadPool::ShutdownGlobalPool();
  DBGLOG(core, "Exited...");
  return 0;
}
