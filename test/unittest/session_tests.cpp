#include <algorithm>
#include <attach/attachment_registry.h>
#include <bp_spec.h>
#include <condition_variable>
#include <fake_process.h>
#include <future>
#include <gtest/gtest.h>
#include <loopback_peer.h>
#include <session/debug_session.h>
#include <session/script_provider.h>
#include <session/stack_frame.h>

using namespace ldb;
using namespace std::chrono_literals;

namespace {
class RecordingListener final : public SessionListener
{
public:
  void
  OnStateChanged(SessionId, SessionState, SessionState next) noexcept final
  {
    std::lock_guard lock(mMutex);
    mStates.push_back(next);
  }

  void
  OnPaused(SessionId, const PausedEvent &event) noexcept final
  {
    std::lock_guard lock(mMutex);
    mPauses.push_back(event);
  }

  void
  OnLog(SessionId, LogSeverity severity, std::string_view text) noexcept final
  {
    std::lock_guard lock(mMutex);
    mLogs.emplace_back(severity, std::string{ text });
    mChanged.notify_all();
  }

  void
  OnTerminated(SessionId, const std::optional<SessionError> &error) noexcept final
  {
    std::lock_guard lock(mMutex);
    ++mTerminations;
    mError = error;
    mChanged.notify_all();
  }

  bool
  WaitForLog(std::chrono::milliseconds timeout)
  {
    std::unique_lock lock(mMutex);
    return mChanged.wait_for(lock, timeout, [this]() { return !mLogs.empty(); });
  }

  std::mutex mMutex{};
  std::condition_variable mChanged{};
  std::vector<SessionState> mStates{};
  std::vector<PausedEvent> mPauses{};
  std::vector<std::pair<LogSeverity, std::string>> mLogs{};
  int mTerminations{ 0 };
  std::optional<SessionError> mError{};
};

// Everything a session needs, with a private worker pool so tests don't share state.
struct SessionHarness
{
  SessionHarness() { mPool.Init(2); }

  std::shared_ptr<DebugSession>
  Create(SessionConfig config)
  {
    config.mDetachSettle = 1ms;
    auto session = DebugSession::Create(std::move(config),
      SessionDependencies{ .mBreakpoints = mBreakpoints,
        .mScripts = mScripts,
        .mRegistry = &mRegistry,
        .mLauncher = &mLauncher,
        .mLister = &mLister,
        .mPool = &mPool });
    session->AddListener(mListener);
    return session;
  }

  ThreadPool mPool{};
  BreakpointStore mBreakpoints{};
  FileScriptProvider mScripts{ "/nonexistent/ldb-scripts" };
  AttachmentRegistry mRegistry{};
  FakeLauncher mLauncher{};
  FixedLister mLister{};
  std::shared_ptr<RecordingListener> mListener{ std::make_shared<RecordingListener>() };
};

SessionConfig
LuaPandaClientConfig(int port)
{
  SessionConfig config{};
  config.mProtocol = ProtocolKind::LuaPandaClient;
  config.mHost = "127.0.0.1";
  config.mPort = port;
  config.mWorkingDirectory = "/work";
  return config;
}

// Answers initSuccess and waits for the session to become ready.
void
CompleteLuaPandaHandshake(LoopbackPeer &peer, DebugSession &session)
{
  ASSERT_TRUE(peer.Accept());
  auto init = peer.Receive();
  ASSERT_TRUE(init);
  ASSERT_EQ(init->mProtocolCommand, "initSuccess");
  ASSERT_TRUE(init->ExpectsReply());

  WireMessage reply = WireMessage::Make(WireCommand::Init, Dict{ { "UseHookLib", "1" }, { "UseLoadstring", "0" } });
  reply.mCorrelationId = init->mCorrelationId;
  peer.Send(reply);
  ASSERT_TRUE(session.WaitForState(SessionState::Ready, 5s));
}

WireMessage
LuaPandaStop(std::string_view reason, Dict frames)
{
  auto message = WireMessage::Make(WireCommand::BreakNotify, std::move(frames));
  message.mProtocolCommand = std::string{ reason };
  return message;
}

Dict
PandaFrame(std::string file, std::string line, std::string name, std::string index)
{
  return Dict{ { "file", std::move(file) },
               { "oPath", "" },
               { "line", std::move(line) },
               { "name", std::move(name) },
               { "index", std::move(index) } };
}

int
UnusedPort()
{
  auto socket = ScopedFd::OpenListeningSocket(0);
  EXPECT_TRUE(socket.has_value());
  return socket ? socket->LocalPort().value_or(1) : 1;
}
} // namespace

TEST(StackFrames, TopFrameSkipsFramesWithoutSource)
{
  std::vector<StackFrameSnapshot> frames{
    StackFrameSnapshot{ .mFile = "[C]", .mLine = -1 },
    StackFrameSnapshot{ .mFile = "=loadstring", .mLine = 3 },
    StackFrameSnapshot{ .mFile = "game/main.lua", .mLine = 12 },
  };
  EXPECT_EQ(SelectTopFrame(frames), 2u);

  frames.pop_back();
  EXPECT_EQ(SelectTopFrame(frames), 1u);

  std::vector<StackFrameSnapshot> noLines{ StackFrameSnapshot{ .mFile = "[C]" }, StackFrameSnapshot{ .mFile = "[C]" } };
  EXPECT_EQ(SelectTopFrame(noLines), 0u);
}

TEST(StackFrames, LuaPandaFramesFromEnvelopeOrInfo)
{
  auto message = LuaPandaStop("stopOnBreakpoint", Dict::object());
  message.mEnvelope["stack"] = Dict::array({ PandaFrame("a.lua", "4", "f", "2") });
  auto frames = ParseLuaPandaStacks(message);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].mFile, "a.lua");
  EXPECT_EQ(frames[0].mLine, 4);
  EXPECT_EQ(frames[0].mIndex, 2);

  message = LuaPandaStop("stopOnStep", Dict::array({ PandaFrame("b.lua", "7", "g", "1"), Dict("junk") }));
  frames = ParseLuaPandaStacks(message);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].mFunctionName, "g");
}

TEST(StackFrames, EmmyFramesCarryVariables)
{
  const auto payload = Dict::parse(R"({"stacks":[{"file":"main.lua","line":9,"functionName":"tick","level":0,
    "localVariables":[{"name":"t","value":"table: 0x1","valueTypeName":"table","cacheId":7,
      "children":[{"name":"x","value":"1","valueTypeName":"number"}]}],
    "upvalueVariables":[]}]})");
  auto frames = ParseEmmyStacks(payload);
  ASSERT_EQ(frames.size(), 1u);
  ASSERT_EQ(frames[0].mLocals.size(), 1u);
  const auto &table = frames[0].mLocals[0];
  EXPECT_EQ(table.mChildRef, 7);
  EXPECT_TRUE(table.HasChildren());
  ASSERT_EQ(table.mChildren.size(), 1u);
  EXPECT_EQ(table.mChildren[0].mValue, "1");
}

TEST(DebugSession, LuaPandaHandshakeSendsInitInfoAndBreakpoints)
{
  SessionHarness harness{};
  harness.mBreakpoints.Add(BreakpointDescriptor{ .mFilePath = "main.lua", .mLine = 10 });
  harness.mBreakpoints.Add(BreakpointDescriptor{ .mFilePath = "main.lua", .mLine = 20, .mCondition = "x > 1" });
  harness.mBreakpoints.Add(BreakpointDescriptor{ .mFilePath = "util.lua", .mLine = 5 });

  LoopbackPeer peer{ CreateLineJsonCodec() };
  auto session = harness.Create(LuaPandaClientConfig(peer.Port()));
  session->Start();

  ASSERT_TRUE(peer.Accept());
  auto init = peer.Receive();
  ASSERT_TRUE(init);
  EXPECT_EQ(init->mProtocolCommand, "initSuccess");
  EXPECT_EQ(init->mPayload["stopOnEntry"], "false");
  EXPECT_EQ(init->mPayload["cwd"], "/work");
  EXPECT_EQ(session->State(), SessionState::Handshaking);

  WireMessage reply = WireMessage::Make(WireCommand::Init);
  reply.mCorrelationId = init->mCorrelationId;
  peer.Send(reply);

  std::vector<WireMessage> sets{};
  for (int i = 0; i < 3; ++i) {
    auto set = peer.Receive();
    ASSERT_TRUE(set);
    EXPECT_EQ(set->mProtocolCommand, "setBreakPoint");
    sets.push_back(std::move(*set));
  }
  EXPECT_EQ(sets[1].mPayload["path"], "main.lua");
  ASSERT_EQ(sets[1].mPayload["bks"].size(), 2u);
  EXPECT_EQ(sets[1].mPayload["bks"][1]["condition"], "x > 1");
  EXPECT_EQ(sets[2].mPayload["path"], "util.lua");
  EXPECT_TRUE(session->WaitForState(SessionState::Ready, 5s));

  session->Stop();
  EXPECT_TRUE(session->WaitForTermination(5s));
}

TEST(DebugSession, BreakpointAddedWhileConnectedIsSentImmediately)
{
  SessionHarness harness{};
  LoopbackPeer peer{ CreateLineJsonCodec() };
  auto session = harness.Create(LuaPandaClientConfig(peer.Port()));
  session->Start();
  CompleteLuaPandaHandshake(peer, *session);

  auto breakpoint = harness.mBreakpoints.Add(BreakpointDescriptor{ .mFilePath = "main.lua", .mLine = 3 });
  session->OnBreakpointAdded(breakpoint);
  auto set = peer.ReceiveUntil(WireCommand::AddBreakpoint);
  ASSERT_TRUE(set);
  EXPECT_EQ(set->mPayload["bks"].size(), 1u);

  harness.mBreakpoints.Remove("main.lua", 3);
  session->OnBreakpointRemoved(breakpoint);
  auto cleared = peer.Receive();
  ASSERT_TRUE(cleared);
  EXPECT_EQ(cleared->mProtocolCommand, "setBreakPoint");
  EXPECT_TRUE(cleared->mPayload["bks"].empty());

  session->Stop();
  EXPECT_TRUE(session->WaitForTermination(5s));
}

TEST(DebugSession, PausesOnBreakpointAndEvaluatesInTopFrame)
{
  SessionHarness harness{};
  LoopbackPeer peer{ CreateLineJsonCodec() };
  auto session = harness.Create(LuaPandaClientConfig(peer.Port()));
  session->Start();
  CompleteLuaPandaHandshake(peer, *session);

  peer.Send(LuaPandaStop("stopOnBreakpoint",
    Dict::array({ PandaFrame("[C]", "-1", "pcall", "1"), PandaFrame("main.lua", "10", "update", "2") })));
  ASSERT_TRUE(session->WaitForState(SessionState::Paused, 5s));

  auto pause = session->CurrentPause();
  ASSERT_TRUE(pause);
  EXPECT_EQ(pause->mTopFrame, 1u);
  EXPECT_EQ(pause->TopFrame().mFile, "main.lua");
  EXPECT_EQ(pause->mReason, "stopOnBreakpoint");

  std::promise<EvaluationResult> evaluated{};
  session->Evaluate("score", std::nullopt, [&evaluated](EvaluationResult result) {
    evaluated.set_value(std::move(result));
  });
  auto request = peer.ReceiveUntil(WireCommand::Eval);
  ASSERT_TRUE(request);
  EXPECT_EQ(request->mProtocolCommand, "getWatchedVariable");
  EXPECT_EQ(request->mPayload["varName"], "score");
  EXPECT_EQ(request->mPayload["stackId"], "2");

  auto answer = WireMessage::Make(WireCommand::Eval, Dict{ { "name", "score" }, { "value", "42" }, { "type", "number" } });
  answer.mCorrelationId = request->mCorrelationId;
  peer.Send(answer);

  auto result = evaluated.get_future();
  ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
  auto value = result.get();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(value->mValue, "42");
  EXPECT_EQ(value->mTypeName, "number");

  session->Resume();
  auto resumed = peer.ReceiveUntil(WireCommand::Continue);
  ASSERT_TRUE(resumed);
  EXPECT_TRUE(session->WaitForState(SessionState::Running, 5s));
  EXPECT_FALSE(session->CurrentPause().has_value());
  {
    std::lock_guard lock(harness.mListener->mMutex);
    ASSERT_EQ(harness.mListener->mPauses.size(), 1u);
  }

  session->Stop();
  EXPECT_TRUE(session->WaitForTermination(5s));
}

TEST(DebugSession, EvaluateWhileRunningFails)
{
  SessionHarness harness{};
  LoopbackPeer peer{ CreateLineJsonCodec() };
  auto session = harness.Create(LuaPandaClientConfig(peer.Port()));
  session->Start();
  CompleteLuaPandaHandshake(peer, *session);

  std::promise<EvaluationResult> evaluated{};
  session->Evaluate("x", std::nullopt, [&evaluated](EvaluationResult result) { evaluated.set_value(std::move(result)); });
  auto result = evaluated.get_future();
  ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
  EXPECT_FALSE(result.get().has_value());

  session->Stop();
  EXPECT_TRUE(session->WaitForTermination(5s));
}

TEST(DebugSession, OutputIsForwardedToListeners)
{
  SessionHarness harness{};
  LoopbackPeer peer{ CreateLineJsonCodec() };
  auto session = harness.Create(LuaPandaClientConfig(peer.Port()));
  session->Start();
  CompleteLuaPandaHandshake(peer, *session);

  auto output = WireMessage::Make(WireCommand::Log, Dict{ { "logType", "1" }, { "content", "hello from lua" } });
  peer.Send(output);
  ASSERT_TRUE(harness.mListener->WaitForLog(5s));
  {
    std::lock_guard lock(harness.mListener->mMutex);
    EXPECT_EQ(harness.mListener->mLogs.front().second, "hello from lua");
  }

  session->Stop();
  EXPECT_TRUE(session->WaitForTermination(5s));
}

TEST(DebugSession, StopIsAcknowledgedOnceAndTerminatesCleanly)
{
  SessionHarness harness{};
  LoopbackPeer peer{ CreateLineJsonCodec() };
  auto session = harness.Create(LuaPandaClientConfig(peer.Port()));
  session->Start();
  CompleteLuaPandaHandshake(peer, *session);

  session->Stop();
  session->Stop();
  auto stop = peer.ReceiveUntil(WireCommand::Stop);
  ASSERT_TRUE(stop);
  EXPECT_EQ(stop->mProtocolCommand, "stopRun");
  auto ack = WireMessage::Make(WireCommand::Stop);
  ack.mCorrelationId = stop->mCorrelationId;
  peer.Send(ack);

  ASSERT_TRUE(session->WaitForTermination(5s));
  EXPECT_FALSE(session->TerminalError().has_value());
  EXPECT_TRUE(peer.WaitForClose());
  session->Stop();
  EXPECT_FALSE(peer.Receive(100ms).has_value());

  std::lock_guard lock(harness.mListener->mMutex);
  EXPECT_EQ(harness.mListener->mTerminations, 1);
  EXPECT_FALSE(harness.mListener->mError.has_value());
  EXPECT_EQ(harness.mListener->mStates.back(), SessionState::Terminated);
}

TEST(DebugSession, UnansweredStopStillTerminates)
{
  SessionHarness harness{};
  LoopbackPeer peer{ CreateLineJsonCodec() };
  auto config = LuaPandaClientConfig(peer.Port());
  config.mStopAcknowledgeTimeout = 100ms;
  auto session = harness.Create(config);
  session->Start();
  CompleteLuaPandaHandshake(peer, *session);

  session->Stop();
  ASSERT_TRUE(peer.ReceiveUntil(WireCommand::Stop));
  EXPECT_TRUE(session->WaitForTermination(5s));
  EXPECT_FALSE(session->TerminalError().has_value());
}

TEST(DebugSession, PeerDisconnectIsATerminalError)
{
  SessionHarness harness{};
  LoopbackPeer peer{ CreateLineJsonCodec() };
  auto session = harness.Create(LuaPandaClientConfig(peer.Port()));
  session->Start();
  CompleteLuaPandaHandshake(peer, *session);

  peer.Disconnect();
  ASSERT_TRUE(session->WaitForTermination(5s));
  auto error = session->TerminalError();
  ASSERT_TRUE(error);
  EXPECT_EQ(error->mKind, SessionErrorKind::PeerDisconnected);

  std::lock_guard lock(harness.mListener->mMutex);
  EXPECT_EQ(harness.mListener->mTerminations, 1);
  ASSERT_TRUE(harness.mListener->mError);
  EXPECT_EQ(harness.mListener->mError->mKind, SessionErrorKind::PeerDisconnected);
}

TEST(DebugSession, PeerClosingBeforeHandshakeEndsTheSession)
{
  for (int round = 0; round < 20; ++round) {
    SessionHarness harness{};
    LoopbackPeer peer{ CreateLineJsonCodec() };
    auto session = harness.Create(LuaPandaClientConfig(peer.Port()));
    session->Start();
    ASSERT_TRUE(peer.Accept());
    peer.Disconnect();

    ASSERT_TRUE(session->WaitForTermination(5s))
      << "round " << round << " stuck in " << Enum<SessionState>::ToString(session->State());
    auto error = session->TerminalError();
    ASSERT_TRUE(error);
    EXPECT_EQ(error->mKind, SessionErrorKind::PeerDisconnected);
    std::lock_guard lock(harness.mListener->mMutex);
    EXPECT_EQ(harness.mListener->mTerminations, 1);
  }
}

TEST(DebugSession, PeerRequestedStopEndsWithoutError)
{
  SessionHarness harness{};
  LoopbackPeer peer{ CreateLineJsonCodec() };
  auto session = harness.Create(LuaPandaClientConfig(peer.Port()));
  session->Start();
  CompleteLuaPandaHandshake(peer, *session);

  peer.Send(WireMessage::Make(WireCommand::Stop));
  ASSERT_TRUE(session->WaitForTermination(5s));
  EXPECT_FALSE(session->TerminalError().has_value());
}

TEST(DebugSession, ConnectFailureIsReported)
{
  SessionHarness harness{};
  auto session = harness.Create(LuaPandaClientConfig(UnusedPort()));
  session->Start();
  ASSERT_TRUE(session->WaitForTermination(5s));
  auto error = session->TerminalError();
  ASSERT_TRUE(error);
  EXPECT_EQ(error->mKind, SessionErrorKind::TransportFailed);
}

TEST(DebugSession, StopWhileListeningCancelsAccept)
{
  SessionHarness harness{};
  SessionConfig config{};
  config.mProtocol = ProtocolKind::LuaPandaServer;
  config.mPort = 0;
  auto session = harness.Create(config);
  session->Start();
  ASSERT_TRUE(session->WaitForState(SessionState::Connecting, 5s));
  std::this_thread::sleep_for(50ms);

  session->Stop();
  EXPECT_TRUE(session->WaitForTermination(5s));
}

TEST(DebugSession, StopBeforeStartTerminates)
{
  SessionHarness harness{};
  auto session = harness.Create(LuaPandaClientConfig(UnusedPort()));
  session->Stop();
  EXPECT_TRUE(session->WaitForTermination(5s));
  session->Start();
  EXPECT_EQ(session->State(), SessionState::Terminated);
}

class EmmyAttachSession : public ::testing::Test
{
protected:
  SessionConfig
  AttachConfigFor(int port) const
  {
    SessionConfig config{};
    config.mProtocol = ProtocolKind::EmmyAttach;
    config.mAttach.mPid = 4242;
    config.mAttach.mToolDirectory = mTools.Root();
    config.mAttach.mSettleDelay = 1ms;
    config.mAttach.mRetryCount = 3;
    config.mAttach.mRetryDelay = 10ms;
    config.mAttach.mWaitSlice = 1ms;
    config.mAttach.mProbePort = false;
    config.mAttach.mHosts = { "127.0.0.1" };
    config.mAttach.mPortOverride = port;
    return config;
  }

  ToolDirectory mTools{ "x64/emmy_tool", "x64/emmy_hook.so" };
  SessionHarness mHarness{};
};

TEST_F(EmmyAttachSession, AttachPauseEvaluateAndDetach)
{
  mHarness.mBreakpoints.Add(BreakpointDescriptor{ .mFilePath = "main.lua", .mLine = 3 });
  LoopbackPeer peer{ CreateEmmyCodec() };
  auto session = mHarness.Create(AttachConfigFor(peer.Port()));
  session->Start();

  ASSERT_TRUE(peer.Accept());
  // No helper script is installed, so initialization starts with the breakpoints.
  auto breakpoints = peer.Receive();
  ASSERT_TRUE(breakpoints);
  EXPECT_EQ(breakpoints->mCommand, WireCommand::AddBreakpoint);
  EXPECT_EQ(breakpoints->mPayload["breakPoints"][0]["line"], 3);
  auto ready = peer.Receive();
  ASSERT_TRUE(ready);
  EXPECT_EQ(ready->mCommand, WireCommand::Ready);
  ASSERT_TRUE(session->WaitForState(SessionState::Ready, 5s));
  EXPECT_TRUE(mHarness.mRegistry.IsProcessAttached(4242));

  peer.Send(WireMessage::Make(WireCommand::BreakNotify,
    Dict::parse(R"({"stacks":[{"file":"main.lua","line":3,"functionName":"f","level":0,"localVariables":[],
      "upvalueVariables":[]}]})")));
  ASSERT_TRUE(session->WaitForState(SessionState::Paused, 5s));

  std::promise<EvaluationResult> evaluated{};
  session->Evaluate("x", std::nullopt, [&evaluated](EvaluationResult result) { evaluated.set_value(std::move(result)); });
  auto request = peer.ReceiveUntil(WireCommand::Eval);
  ASSERT_TRUE(request);
  EXPECT_EQ(request->mPayload["expr"], "x");
  EXPECT_EQ(request->mPayload["stackLevel"], 0);

  auto answer = WireMessage::Make(WireCommand::EvalResult,
    Dict{ { "success", true }, { "value", Dict{ { "name", "x" }, { "value", "1" }, { "valueTypeName", "number" } } } });
  answer.mCorrelationId = request->mCorrelationId;
  peer.Send(answer);
  auto result = evaluated.get_future();
  ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
  auto value = result.get();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(value->mValue, "1");

  session->Stop();
  auto stop = peer.ReceiveUntil(WireCommand::Stop);
  ASSERT_TRUE(stop);
  EXPECT_EQ(stop->mPayload["action"], 5);
  ASSERT_TRUE(session->WaitForTermination(5s));
  EXPECT_FALSE(session->TerminalError().has_value());
  EXPECT_FALSE(mHarness.mRegistry.IsProcessAttached(4242));
  EXPECT_TRUE(peer.WaitForClose());
}

TEST_F(EmmyAttachSession, SecondSessionForSameProcessIsRejected)
{
  LoopbackPeer peer{ CreateEmmyCodec() };
  auto first = mHarness.Create(AttachConfigFor(peer.Port()));
  first->Start();
  ASSERT_TRUE(peer.Accept());
  ASSERT_TRUE(first->WaitForState(SessionState::Ready, 5s));

  auto second = mHarness.Create(AttachConfigFor(peer.Port()));
  second->Start();
  ASSERT_TRUE(second->WaitForTermination(5s));
  auto error = second->TerminalError();
  ASSERT_TRUE(error);
  EXPECT_EQ(error->mKind, SessionErrorKind::DoubleAttach);
  auto record = mHarness.mRegistry.GetAttachedProcessInfo(4242);
  ASSERT_TRUE(record);
  EXPECT_EQ(record->mSession, first->Id());
  EXPECT_FALSE(record->mPending);
  EXPECT_EQ(record->mProcessName, "game");
  {
    std::lock_guard lock(mHarness.mLauncher.mMutex);
    EXPECT_EQ(std::ranges::count_if(mHarness.mLauncher.mRequests,
                [](const LaunchRequest &request) { return request.mArguments.front() == "attach"; }),
      1);
  }

  first->Stop();
  EXPECT_TRUE(first->WaitForTermination(5s));
  EXPECT_EQ(mHarness.mRegistry.Count(), 0u);
}

TEST_F(EmmyAttachSession, StopWhileConnectingFreesTheProcess)
{
  auto config = AttachConfigFor(UnusedPort());
  config.mAttach.mRetryCount = 100000;
  auto session = mHarness.Create(config);
  session->Start();
  ASSERT_TRUE(session->WaitForState(SessionState::Connecting, 5s));
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (!mHarness.mRegistry.IsProcessAttached(4242) && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  ASSERT_TRUE(mHarness.mRegistry.IsProcessAttached(4242));
  EXPECT_TRUE(mHarness.mRegistry.GetAttachedProcessInfo(4242)->mPending);

  session->Stop();
  ASSERT_TRUE(session->WaitForTermination(5s));
  EXPECT_EQ(mHarness.mRegistry.Count(), 0u);
}

TEST_F(EmmyAttachSession, InjectionFailureEndsTheSession)
{
  mHarness.mLauncher.mOutputs["attach"] = ProcessOutput{ .mExitCode = 1, .mStdout = "", .mStderr = "no such process" };
  auto session = mHarness.Create(AttachConfigFor(UnusedPort()));
  session->Start();
  ASSERT_TRUE(session->WaitForTermination(5s));
  auto error = session->TerminalError();
  ASSERT_TRUE(error);
  EXPECT_EQ(error->mKind, SessionErrorKind::AttachFailed);
  EXPECT_NE(error->mMessage.find("no such process"), std::string::npos);
  EXPECT_FALSE(mHarness.mRegistry.IsProcessAttached(4242));
}
