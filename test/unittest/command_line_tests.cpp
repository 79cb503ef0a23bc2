#include <bp_spec.h>
#include <configuration/command_line.h>
#include <configuration/config.h>
#include <gtest/gtest.h>
#include <interface/console_command.h>
#include <memory>
#include <session/debug_session.h>
#include <session/script_provider.h>

using namespace ldb;

namespace {
struct ParsedConfiguration
{
  cfg::CommandLineRegistry mParser{};
  std::unique_ptr<cfg::InitializationConfiguration> mConfig{ cfg::InitializationConfiguration::ConfigureWithParser(
    mParser) };
  cfg::CommandLineResult mResult{};

  explicit ParsedConfiguration(std::vector<const char *> args)
  {
    args.insert(args.begin(), "ldb");
    mResult = mParser.Parse(static_cast<int>(args.size()), args.data());
  }
};
} // namespace

TEST(CommandLine, DefaultsDescribeAnEmmyAttach)
{
  ParsedConfiguration parsed{ std::vector<const char *>{} };
  EXPECT_TRUE(parsed.mResult.mErrors.empty());
  EXPECT_FALSE(parsed.mResult.mHelpRequested);
  EXPECT_EQ(parsed.mConfig->mProtocol, ProtocolKind::EmmyAttach);
  EXPECT_EQ(parsed.mConfig->mArch, Arch::X64);
  EXPECT_EQ(parsed.mConfig->mPort, 8818);
  EXPECT_EQ(parsed.mConfig->mHost, "localhost");
  EXPECT_GE(parsed.mConfig->mThreadPoolSize, 2u);

  auto session = parsed.mConfig->BuildSessionConfig();
  EXPECT_EQ(session.mAttach.mRetryCount, parsed.mConfig->mAttachRetries);
  EXPECT_FALSE(session.mTypeRegistryScript.has_value());
}

TEST(CommandLine, LuaPandaClientOptions)
{
  ParsedConfiguration parsed{ { "--protocol", "LuaPanda-Client", "--host", "10.0.0.2", "--port=9000", "--stop-on-entry",
    "--cwd", "/srv/game" } };
  ASSERT_TRUE(parsed.mResult.mErrors.empty());
  auto session = parsed.mConfig->BuildSessionConfig();
  EXPECT_EQ(session.mProtocol, ProtocolKind::LuaPandaClient);
  EXPECT_EQ(session.mHost, "10.0.0.2");
  EXPECT_EQ(session.mPort, 9000);
  EXPECT_TRUE(session.mStopOnEntry);
  EXPECT_EQ(session.mWorkingDirectory, "/srv/game");
}

TEST(CommandLine, AttachOptionsReachTheAttachConfig)
{
  ParsedConfiguration parsed{ { "--pid", "4242", "--arch", "x86", "--tool-dir", "/opt/emmy", "--attach-retries", "3",
    "--attach-retry-delay", "50", "--capture-log", "--type-registry", "/opt/ue.lua" } };
  ASSERT_TRUE(parsed.mResult.mErrors.empty());
  auto session = parsed.mConfig->BuildSessionConfig();
  EXPECT_EQ(session.mAttach.mPid, 4242);
  EXPECT_EQ(session.mAttach.mArch, Arch::X86);
  EXPECT_EQ(session.mAttach.mToolDirectory, Path{ "/opt/emmy" });
  EXPECT_EQ(session.mAttach.mRetryCount, 3u);
  EXPECT_EQ(session.mAttach.mRetryDelay, std::chrono::milliseconds{ 50 });
  EXPECT_TRUE(session.mAttach.mCaptureLog);
  ASSERT_TRUE(session.mTypeRegistryScript);
  EXPECT_EQ(*session.mTypeRegistryScript, Path{ "/opt/ue.lua" });
}

TEST(CommandLine, BadValuesAreReported)
{
  ParsedConfiguration parsed{ { "--protocol", "gdb", "--arch", "arm", "--port", "eighty", "--frobnicate", "--pid" } };
  ASSERT_EQ(parsed.mResult.mErrors.size(), 5u);
  EXPECT_EQ(parsed.mResult.mErrors[0].mError, cfg::ParseErrorType::UnknownProtocol);
  EXPECT_EQ(parsed.mResult.mErrors[1].mError, cfg::ParseErrorType::UnknownArchitecture);
  EXPECT_EQ(parsed.mResult.mErrors[2].mError, cfg::ParseErrorType::InvalidFormat);
  EXPECT_EQ(parsed.mResult.mErrors[3].mError, cfg::ParseErrorType::UnrecognizedArgument);
  EXPECT_EQ(parsed.mResult.mErrors[4].mError, cfg::ParseErrorType::MissingArgValue);
  EXPECT_TRUE(std::format("{}", parsed.mResult.mErrors[3])
                .starts_with("Parse error: Argument is not a recognized option. --frobnicate"));
}

TEST(CommandLine, LogDirectoryMustExist)
{
  ParsedConfiguration parsed{ { "-l", "/nonexistent/ldb-logs" } };
  ASSERT_EQ(parsed.mResult.mErrors.size(), 1u);
  EXPECT_EQ(parsed.mResult.mErrors[0].mError, cfg::ParseErrorType::DirectoryDoesNotExist);
}

TEST(CommandLine, HelpIsAFlag)
{
  ParsedConfiguration parsed{ { "--help" } };
  EXPECT_TRUE(parsed.mResult.mHelpRequested);
  EXPECT_TRUE(parsed.mResult.mErrors.empty());
}

TEST(CommandLine, ProtocolNamesRoundTrip)
{
  for (auto kind : { ProtocolKind::EmmyAttach, ProtocolKind::LuaPandaClient, ProtocolKind::LuaPandaServer }) {
    EXPECT_EQ(ProtocolFromCliName(ProtocolCliName(kind)), kind);
  }
  EXPECT_FALSE(ProtocolFromCliName("emmy"));
}

TEST(ConsoleCommand, SourceLocations)
{
  auto location = ParseSourceLocation("scripts/main.lua:42");
  ASSERT_TRUE(location);
  EXPECT_EQ(location->mFile, "scripts/main.lua");
  EXPECT_EQ(location->mLine, 42u);

  location = ParseSourceLocation("C:/game/main.lua:7");
  ASSERT_TRUE(location);
  EXPECT_EQ(location->mFile, "C:/game/main.lua");

  EXPECT_FALSE(ParseSourceLocation("main.lua"));
  EXPECT_FALSE(ParseSourceLocation("main.lua:0"));
  EXPECT_FALSE(ParseSourceLocation(":3"));
  EXPECT_FALSE(ParseSourceLocation("main.lua:x"));
}

TEST(ConsoleCommand, InterpreterDispatchesByFirstWord)
{
  ConsoleCommandInterpreter interpreter{};
  std::vector<std::string> seen{};
  interpreter.RegisterConsoleCommand("echo", GenericCommand::CreateCommand("echo", [&seen](std::span<std::string_view> args) {
    seen.emplace_back(JoinArguments(args));
    return ConsoleCommandResult{ true, std::string{ seen.back() } };
  }));
  interpreter.RegisterConsoleCommand("abort", GenericCommand::CreateCommand("abort", [](std::span<std::string_view>) {
    return ConsoleCommandResult{ false, "no" };
  }));

  auto result = interpreter.Interpret("  echo   a  b ");
  EXPECT_TRUE(result.mSuccess);
  EXPECT_EQ(result.mContents, "a b");
  EXPECT_FALSE(interpreter.Interpret("abort").mSuccess);

  result = interpreter.Interpret("jump 10");
  EXPECT_FALSE(result.mSuccess);
  EXPECT_EQ(result.mContents, "unknown command 'jump'");
  EXPECT_TRUE(interpreter.Interpret("").mSuccess);
  EXPECT_EQ(interpreter.GetCommandNameList(), (std::vector<std::string_view>{ "abort", "echo" }));
}

TEST(ConsoleCommand, BreakpointCommandsEditTheStore)
{
  BreakpointStore breakpoints{};
  FileScriptProvider scripts{ "/nonexistent/ldb-scripts" };
  ThreadPool pool{};
  pool.Init(1);
  SessionConfig config{};
  config.mProtocol = ProtocolKind::LuaPandaClient;
  auto session = DebugSession::Create(config, SessionDependencies{ .mBreakpoints = breakpoints, .mScripts = scripts, .mPool = &pool });

  ConsoleCommandInterpreter interpreter{};
  bool quit = false;
  RegisterSessionCommands(interpreter, session, breakpoints, [&quit]() { quit = true; });

  EXPECT_TRUE(interpreter.Interpret("b main.lua:10").mSuccess);
  auto result = interpreter.Interpret("b main.lua:10 hp < 10");
  EXPECT_TRUE(result.mSuccess);
  EXPECT_EQ(result.mContents, "breakpoint at main.lua:10");
  ASSERT_EQ(breakpoints.Count(), 1u);
  EXPECT_EQ(breakpoints.Find("main.lua", 10)->Descriptor().mCondition, "hp < 10");

  EXPECT_FALSE(interpreter.Interpret("b main.lua").mSuccess);
  EXPECT_FALSE(interpreter.Interpret("d main.lua:11").mSuccess);
  EXPECT_TRUE(interpreter.Interpret("d main.lua:10").mSuccess);
  EXPECT_EQ(breakpoints.Count(), 0u);

  EXPECT_FALSE(interpreter.Interpret("frames").mSuccess);
  EXPECT_TRUE(interpreter.Interpret("q").mSuccess);
  EXPECT_TRUE(quit);
  EXPECT_TRUE(session->WaitForTermination(std::chrono::seconds{ 5 }));
}
