/** LICENSE TEMPLATE */
#include "debug_session.h"
#include <common.h>
#include <interface/transport/socket_transporters.h>
#include <algorithm>
#include <thread>
#include <utils/logger.h>

namespace ldb {

namespace {
std::atomic<SessionId> sNextSessionId{ 1 };

SessionErrorKind
FromAttachError(AttachErrorKind kind) noexcept
{
  switch (kind) {
  case AttachErrorKind::UnsupportedPlatform:
    return SessionErrorKind::UnsupportedPlatform;
  case AttachErrorKind::ToolMissing:
    return SessionErrorKind::ToolMissing;
  case AttachErrorKind::AttachFailed:
    return SessionErrorKind::AttachFailed;
  case AttachErrorKind::ConnectTimeout:
  case AttachErrorKind::Cancelled:
    return SessionErrorKind::ConnectTimeout;
  case AttachErrorKind::DoubleAttach:
    return SessionErrorKind::DoubleAttach;
  }
  return SessionErrorKind::AttachFailed;
}
} // namespace

DebugSession::DebugSession(Private, SessionConfig config, SessionDependencies dependencies) noexcept
    : mId(sNextSessionId.fetch_add(1)), mConfig(std::move(config)), mDependencies(dependencies),
      mDriver(CreateProtocolDriver(mConfig, mDependencies.mScripts)), mSynchronizer(*mDriver)
{
  if (mDependencies.mLauncher == nullptr) {
    mOwnedLauncher = std::make_unique<ForkExecLauncher>();
    mDependencies.mLauncher = mOwnedLauncher.get();
  }
  if (mDependencies.mLister == nullptr) {
    if (mConfig.mProtocol == ProtocolKind::EmmyAttach) {
      mOwnedTool = std::make_unique<HelperTool>(mConfig.mAttach.mToolDirectory, *mDependencies.mLauncher);
      mOwnedLister = std::make_unique<HelperToolProcessLister>(*mOwnedTool, mConfig.mAttach.mArch);
    } else {
      mOwnedLister = std::make_unique<ProcFsProcessLister>();
    }
    mDependencies.mLister = mOwnedLister.get();
  }
  mThread = DebuggerThread::SpawnDebuggerThread(
    std::format("ldb-session-{}", mId), [this](std::stop_token &token) { EventLoop(token); });
}

DebugSession::~DebugSession() noexcept
{
  Stop();
  mThread->Join();
  mThread.reset();
}

/* static */
std::shared_ptr<DebugSession>
DebugSession::Create(SessionConfig config, SessionDependencies dependencies) noexcept
{
  return std::make_shared<DebugSession>(Private{}, std::move(config), dependencies);
}

SessionId
DebugSession::Id() const noexcept
{
  return mId;
}

SessionState
DebugSession::State() const noexcept
{
  return mState.load(std::memory_order_acquire);
}

const SessionConfig &
DebugSession::Config() const noexcept
{
  return mConfig;
}

void
DebugSession::AddListener(std::shared_ptr<SessionListener> listener) noexcept
{
  std::lock_guard lock(mListenersMutex);
  mListeners.push_back(std::move(listener));
}

std::optional<PausedEvent>
DebugSession::CurrentPause() const noexcept
{
  std::lock_guard lock(mSnapshotMutex);
  return mPause;
}

std::optional<SessionError>
DebugSession::TerminalError() const noexcept
{
  std::lock_guard lock(mSnapshotMutex);
  return mTerminalError;
}

bool
DebugSession::WaitForState(SessionState state, std::chrono::milliseconds timeout) const noexcept
{
  std::unique_lock lock(mStateMutex);
  return mStateChanged.wait_for(lock, timeout, [&]() { return State() == state; });
}

bool
DebugSession::WaitForTermination(std::chrono::milliseconds timeout) const noexcept
{
  return WaitForState(SessionState::Terminated, timeout);
}

void
DebugSession::Post(std::string name, std::function<void()> fn) noexcept
{
  mQueue.Push(SessionCommand{ .mName = std::move(name), .mRun = std::move(fn) });
}

// Receive thread

void
DebugSession::OnMessage(WireMessage message) noexcept
{
  mQueue.Push(InboundMessage{ std::move(message) });
}

void
DebugSession::OnReply(ReplyContinuation continuation, ReplyResult result) noexcept
{
  mQueue.Push(InboundReply{ std::move(continuation), std::move(result) });
}

void
DebugSession::OnDisconnect() noexcept
{
  mQueue.Push(PeerDisconnected{});
}

// Session thread

void
DebugSession::EventLoop(std::stop_token &token) noexcept
{
  std::vector<SessionEvent> events{};
  while (!mTerminated && !token.stop_requested()) {
    std::optional<std::chrono::milliseconds> timeout{};
    if (mStopDeadline) {
      timeout = std::max(std::chrono::milliseconds{ 0 },
        std::chrono::duration_cast<std::chrono::milliseconds>(*mStopDeadline - std::chrono::steady_clock::now()));
    }
    events.clear();
    mQueue.PollBlocking(events, timeout);
    for (auto &event : events) {
      Handle(event);
    }
    if (mStopDeadline && std::chrono::steady_clock::now() >= *mStopDeadline) {
      DBGLOG(session, "[{}] stop was not acknowledged within {}ms", mId, mConfig.mStopAcknowledgeTimeout.count());
      FinishStop();
    }
  }
  DBGLOG(session, "[{}] event loop exited", mId);
}

void
DebugSession::Handle(SessionEvent &event) noexcept
{
  std::visit(
    [this](auto &e) {
      using T = std::remove_cvref_t<decltype(e)>;
      if constexpr (std::is_same_v<T, InboundMessage>) {
        OnInboundMessage(std::move(e.mMessage));
      } else if constexpr (std::is_same_v<T, InboundReply>) {
        e.mContinuation(std::move(e.mResult));
      } else if constexpr (std::is_same_v<T, PeerDisconnected>) {
        OnPeerDisconnected();
      } else if constexpr (std::is_same_v<T, ConnectFinished>) {
        OnConnectFinished(std::move(e));
      } else if constexpr (std::is_same_v<T, SessionCommand>) {
        DBGLOG(session, "[{}] command {}", mId, e.mName);
        e.mRun();
      } else {
        static_assert(always_false<T>, "unhandled session event");
      }
    },
    event);
}

void
DebugSession::Transition(SessionState next) noexcept
{
  SessionState previous;
  {
    std::lock_guard lock(mStateMutex);
    previous = mState.exchange(next, std::memory_order_acq_rel);
  }
  mStateChanged.notify_all();
  if (previous == next) {
    return;
  }
  DBGLOG(session, "[{}] {} -> {}", mId, previous, next);
  NotifyListeners([&](SessionListener &listener) { listener.OnStateChanged(mId, previous, next); });
}

bool
DebugSession::IsInteractive() const noexcept
{
  switch (State()) {
  case SessionState::Ready:
  case SessionState::Running:
  case SessionState::Paused:
    return !mStopping.load(std::memory_order_acquire);
  default:
    return false;
  }
}

void
DebugSession::Start() noexcept
{
  Post("start", [this]() { OnStart(); });
}

void
DebugSession::OnStart() noexcept
{
  if (State() != SessionState::Created || mStopping) {
    return;
  }
  Transition(SessionState::Initializing);
  auto *pool = mDependencies.mPool ? mDependencies.mPool : ThreadPool::GetGlobalPool();
  VERIFY(pool != nullptr, "a worker pool is required to connect");
  if (mConfig.mProtocol == ProtocolKind::EmmyAttach) {
    VERIFY(mDependencies.mRegistry != nullptr, "process attach requires an attachment registry");
  }

  Transition(SessionState::Connecting);
  if (mConfig.mProtocol == ProtocolKind::EmmyAttach) {
    Transition(SessionState::Attaching);
  }
  mConnectInFlight = true;
  pool->Post(std::format("connect-session-{}", mId), [self = shared_from_this()]() { self->RunConnect(); });
}

// Worker pool

void
DebugSession::SetPendingTransporter(Transporter *transporter) noexcept
{
  std::lock_guard lock(mPendingMutex);
  mPendingTransporter = transporter;
  // A Stop that ran before the transporter existed could not close it.
  if (transporter != nullptr && mStopping) {
    transporter->Close();
  }
}

void
DebugSession::RunConnect() noexcept
{
  auto finished = mConfig.mProtocol == ProtocolKind::EmmyAttach ? ConnectAttach() : ConnectLineJson();
  mQueue.Push(std::move(finished));
}

ConnectFinished
DebugSession::ConnectAttach() noexcept
{
  AttachWorkflow workflow{
    mConfig.mAttach, *mDependencies.mRegistry, *mDependencies.mLauncher, *mDependencies.mLister, mStopping
  };
  workflow.SetTransportListener(this);
  workflow.SetOwner(mId);
  workflow.SetWorkerPool(mDependencies.mPool ? mDependencies.mPool : ThreadPool::GetGlobalPool());
  auto result = workflow.Run();
  if (!result) {
    return ConnectFinished{ .mTransporter = nullptr,
                            .mError = SessionError{ FromAttachError(result.error().mKind), result.error().mMessage } };
  }
  return ConnectFinished{ .mTransporter = std::move(result->mTransporter),
                          .mError = std::nullopt,
                          .mAttachedPid = mConfig.mAttach.mPid,
                          .mProcessName = std::move(result->mProcessName) };
}

ConnectFinished
DebugSession::ConnectLineJson() noexcept
{
  std::unique_ptr<Transporter> transporter{};
  if (mConfig.mProtocol == ProtocolKind::LuaPandaServer) {
    transporter = std::make_unique<LineJsonServerTransporter>(mConfig.mPort);
  } else {
    transporter = std::make_unique<LineJsonClientTransporter>(mConfig.mHost, mConfig.mPort);
  }
  transporter->SetListener(this);
  SetPendingTransporter(transporter.get());
  DBGLOG(session, "[{}] connecting {}", mId, transporter->Describe());
  auto connected = transporter->Connect();
  SetPendingTransporter(nullptr);
  if (!connected) {
    return ConnectFinished{ .mTransporter = nullptr,
                            .mError = SessionError{ SessionErrorKind::TransportFailed,
                              std::format("{}: {}", transporter->Describe(), connected.error().Describe()) } };
  }
  return ConnectFinished{ .mTransporter = std::move(transporter), .mError = std::nullopt };
}

// Session thread

void
DebugSession::OnConnectFinished(ConnectFinished finished) noexcept
{
  mConnectInFlight = false;
  if (mStopping) {
    // Stopped while connecting: a connection that arrived late must not revive the session.
    if (finished.mTransporter) {
      DBGLOG(session, "[{}] dropping connection that completed after stop", mId);
      finished.mTransporter->Close();
    }
    if (finished.mAttachedPid) {
      mDependencies.mRegistry->Release(*finished.mAttachedPid, mId);
    }
    if (mFinishing) {
      mFinishing = false;
      FinishStop();
    }
    return;
  }

  if (finished.mError) {
    mStopping = true;
    BeginStop(std::move(finished.mError), false);
    return;
  }

  mTransporter = std::move(finished.mTransporter);
  mDriver->Bind(mTransporter.get());
  if (finished.mAttachedPid) {
    mAttachedPid = finished.mAttachedPid;
    if (!mDependencies.mRegistry->Record(*mAttachedPid, std::move(finished.mProcessName), *this)) {
      mStopping = true;
      BeginStop(SessionError{ SessionErrorKind::DoubleAttach,
                  std::format("Process {} was attached by another session while connecting.", *mAttachedPid) },
        false);
      return;
    }
  }
  if (mEarlyDisconnect) {
    // The receive loop ended before this result arrived; no reply to the handshake can come back.
    mStopping = true;
    DBGLOG(session, "[{}] peer disconnected before the handshake", mId);
    BeginStop(SessionError{ SessionErrorKind::PeerDisconnected, "The debuggee closed the connection." }, false);
    return;
  }
  DBGLOG(session, "[{}] connected: {}", mId, mTransporter->Describe());
  Transition(SessionState::Handshaking);
  StartHandshake();
}

void
DebugSession::StartHandshake() noexcept
{
  const auto mode = mDriver->SendInit([this](ReplyResult result) {
    if (State() != SessionState::Handshaking || mStopping) {
      return;
    }
    if (!result) {
      // A disconnect event follows a failed transport; that is what ends the session.
      DBGLOG(session, "[{}] initialization was not acknowledged: {}", mId, result.error().mMessage);
      return;
    }
    CompleteHandshake();
  });
  if (mode == AcknowledgeMode::None) {
    CompleteHandshake();
  }
}

void
DebugSession::CompleteHandshake() noexcept
{
  mSynchronizer.Resync(mDependencies.mBreakpoints);
  mDriver->SendReady();
  Transition(SessionState::Ready);

  auto early = std::move(mEarlyMessages);
  mEarlyMessages.clear();
  for (auto &message : early) {
    OnInboundMessage(std::move(message));
  }
}

void
DebugSession::OnInboundMessage(WireMessage message) noexcept
{
  if (mStopping) {
    DBGLOG(session, "[{}] stopping; dropped {}", mId, message.mProtocolCommand);
    return;
  }
  switch (State()) {
  case SessionState::Ready:
  case SessionState::Running:
  case SessionState::Paused:
    break;
  default:
    // Sent by the peer before the handshake finished.
    mEarlyMessages.push_back(std::move(message));
    return;
  }

  auto event = mDriver->Interpret(message);
  std::visit(
    [this](auto &e) {
      using T = std::remove_cvref_t<decltype(e)>;
      if constexpr (std::is_same_v<T, BreakEvent>) {
        OnBreak(std::move(e));
      } else if constexpr (std::is_same_v<T, LogEvent>) {
        OnLog(e.mSeverity, e.mText);
      } else if constexpr (std::is_same_v<T, PeerStopEvent>) {
        DBGLOG(session, "[{}] peer requested stop", mId);
        if (!mStopping.exchange(true)) {
          BeginStop(std::nullopt, false);
        }
      } else {
        static_assert(std::is_same_v<T, IgnoredEvent>);
      }
    },
    event);
}

void
DebugSession::OnPeerDisconnected() noexcept
{
  if (!mTransporter) {
    // The receive loop ended before the connect result reached us.
    mEarlyDisconnect = true;
    return;
  }
  if (mStopping.exchange(true)) {
    return;
  }
  DBGLOG(session, "[{}] peer disconnected", mId);
  BeginStop(SessionError{ SessionErrorKind::PeerDisconnected, "The debuggee closed the connection." }, false);
}

void
DebugSession::OnBreak(BreakEvent event) noexcept
{
  if (event.mFrames.empty()) {
    DBGLOG(warning, "[{}] {} without stack frames", mId, event.mReason);
    return;
  }
  PausedEvent paused{ .mFrames = std::move(event.mFrames), .mTopFrame = 0, .mReason = std::move(event.mReason) };
  paused.mTopFrame = SelectTopFrame(paused.mFrames);
  DBGLOG(session,
    "[{}] paused ({}) at {}:{}",
    mId,
    paused.mReason,
    paused.TopFrame().mFile,
    paused.TopFrame().mLine);
  {
    std::lock_guard lock(mSnapshotMutex);
    mPause = paused;
  }
  Transition(SessionState::Paused);
  NotifyListeners([&](SessionListener &listener) { listener.OnPaused(mId, paused); });
}

void
DebugSession::OnLog(LogSeverity severity, std::string_view text) noexcept
{
  DBGLOG(session, "[{}] peer log ({}): {}", mId, severity, text);
  NotifyListeners([&](SessionListener &listener) { listener.OnLog(mId, severity, text); });
}

// Run control

void
DebugSession::SendRunControl(RunControl action, std::string_view name) noexcept
{
  if (!IsInteractive()) {
    DBGLOG(session, "[{}] {} ignored in state {}", mId, name, State());
    return;
  }
  if (action != RunControl::Pause && State() == SessionState::Running) {
    DBGLOG(session, "[{}] {} ignored: already running", mId, name);
    return;
  }
  if (!mDriver->SendRunControl(action)) {
    DBGLOG(warning, "[{}] {} could not be sent", mId, name);
    return;
  }
  if (action != RunControl::Pause) {
    {
      std::lock_guard lock(mSnapshotMutex);
      mPause.reset();
    }
    Transition(SessionState::Running);
  }
}

void
DebugSession::Resume() noexcept
{
  Post("continue", [this]() { SendRunControl(RunControl::Continue, "continue"); });
}

void
DebugSession::StepOver() noexcept
{
  Post("step-over", [this]() { SendRunControl(RunControl::StepOver, "step-over"); });
}

void
DebugSession::StepIn() noexcept
{
  Post("step-in", [this]() { SendRunControl(RunControl::StepIn, "step-in"); });
}

void
DebugSession::StepOut() noexcept
{
  Post("step-out", [this]() { SendRunControl(RunControl::StepOut, "step-out"); });
}

void
DebugSession::Pause() noexcept
{
  Post("pause", [this]() { SendRunControl(RunControl::Pause, "pause"); });
}

void
DebugSession::RunToPosition(std::string filePath, u32 line) noexcept
{
  Post("run-to-position", [this, filePath = std::move(filePath), line]() {
    if (!IsInteractive()) {
      DBGLOG(session, "[{}] run to position ignored in state {}", mId, State());
      return;
    }
    BreakpointDescriptor target{ .mFilePath = filePath, .mLine = line };
    auto sameFile = mSynchronizer.DescriptorsForFile(filePath);
    if (std::ranges::find(sameFile, target) == sameFile.end()) {
      sameFile.push_back(target);
    }
    if (mDriver->RunToPosition(target, sameFile)) {
      {
        std::lock_guard lock(mSnapshotMutex);
        mPause.reset();
      }
      Transition(SessionState::Running);
    }
  });
}

// Breakpoints

void
DebugSession::OnBreakpointAdded(std::shared_ptr<SourceBreakpoint> breakpoint) noexcept
{
  Post("breakpoint-added", [this, breakpoint = std::move(breakpoint)]() {
    if (IsInteractive()) {
      mSynchronizer.Register(*breakpoint);
    }
  });
}

void
DebugSession::OnBreakpointRemoved(std::shared_ptr<SourceBreakpoint> breakpoint) noexcept
{
  Post("breakpoint-removed", [this, breakpoint = std::move(breakpoint)]() {
    if (IsInteractive()) {
      mSynchronizer.Unregister(*breakpoint);
    }
  });
}

// Evaluation

void
DebugSession::Evaluate(std::string expression, std::optional<size_t> frameIndex, EvaluationCallback callback) noexcept
{
  Post("evaluate", [this, expression = std::move(expression), frameIndex, callback = std::move(callback)]() {
    if (State() != SessionState::Paused || !mPause) {
      callback(std::unexpected(std::string{ "the debuggee is not paused" }));
      return;
    }
    const auto index = frameIndex.value_or(mPause->mTopFrame);
    if (index >= mPause->mFrames.size()) {
      callback(std::unexpected(std::format("no stack frame {}", index)));
      return;
    }
    if (!mDriver->Evaluate(expression, mPause->mFrames[index], callback)) {
      DBGLOG(warning, "[{}] evaluation of '{}' was not sent", mId, expression);
    }
  });
}

void
DebugSession::FetchChildren(Variable variable, std::optional<size_t> frameIndex, ChildrenCallback callback) noexcept
{
  Post("fetch-children", [this, variable = std::move(variable), frameIndex, callback = std::move(callback)]() {
    if (State() != SessionState::Paused || !mPause) {
      callback(std::unexpected(std::string{ "the debuggee is not paused" }));
      return;
    }
    if (!variable.mChildren.empty()) {
      callback(variable.mChildren);
      return;
    }
    const auto index = frameIndex.value_or(mPause->mTopFrame);
    if (index >= mPause->mFrames.size()) {
      callback(std::unexpected(std::format("no stack frame {}", index)));
      return;
    }
    if (!mDriver->FetchChildren(variable, mPause->mFrames[index], callback)) {
      DBGLOG(warning, "[{}] child fetch for '{}' was not sent", mId, variable.mName);
    }
  });
}

// Stop

void
DebugSession::Stop() noexcept
{
  if (mStopping.exchange(true)) {
    return;
  }
  DBGLOG(session, "[{}] stop requested", mId);
  {
    std::lock_guard lock(mPendingMutex);
    if (mPendingTransporter != nullptr) {
      mPendingTransporter->Close();
    }
  }
  Post("stop", [this]() { BeginStop(std::nullopt, true); });
}

void
DebugSession::BeginStop(std::optional<SessionError> error, bool notifyPeer) noexcept
{
  if (State() == SessionState::Stopping || State() == SessionState::Terminated) {
    return;
  }
  Transition(SessionState::Stopping);
  if (error) {
    DBGLOG(session, "[{}] stopping on {}: {}", mId, error->mKind, error->mMessage);
    std::lock_guard lock(mSnapshotMutex);
    mTerminalError = std::move(error);
  }

  if (notifyPeer && mTransporter && mTransporter->IsConnected()) {
    const auto mode = mDriver->SendStop([this](ReplyResult result) {
      if (result) {
        DBGLOG(session, "[{}] stop acknowledged", mId);
      }
      FinishStop();
    });
    if (mode == AcknowledgeMode::AwaitReply) {
      mStopDeadline = std::chrono::steady_clock::now() + mConfig.mStopAcknowledgeTimeout;
      return;
    }
  }
  FinishStop();
}

void
DebugSession::FinishStop() noexcept
{
  if (mFinishing || mTerminated) {
    return;
  }
  mFinishing = true;
  mStopDeadline.reset();
  if (mConnectInFlight) {
    // Resumed by OnConnectFinished once the pool task has observed the stop.
    DBGLOG(session, "[{}] waiting for the connect task to observe the stop", mId);
    return;
  }
  ReleaseTransport();
  Terminate();
}

void
DebugSession::ReleaseTransport() noexcept
{
  if (!mTransporter) {
    return;
  }
  mTransporter->Close();
  mTransporter->SetListener(nullptr);
  mDriver->Bind(nullptr);
  std::shared_ptr<Transporter> transporter = std::move(mTransporter);
  if (!mAttachedPid) {
    return;
  }

  auto *pool = mDependencies.mPool ? mDependencies.mPool : ThreadPool::GetGlobalPool();
  auto detach = [transporter, pid = *mAttachedPid, settle = mConfig.mDetachSettle]() mutable {
    try {
      transporter->Close();
      std::this_thread::sleep_for(settle);
      transporter.reset();
      DBGLOG(attach, "detached from process {}", pid);
    } catch (const std::exception &e) {
      DBGLOG(warning, "detach from process {} failed: {}", pid, e.what());
    }
  };
  if (pool != nullptr) {
    pool->Post(std::format("detach-{}", *mAttachedPid), std::move(detach));
  } else {
    detach();
  }
}

void
DebugSession::Terminate() noexcept
{
  // Fail whatever the closed transporter abandoned, so no caller waits forever.
  std::vector<SessionEvent> remaining{};
  mQueue.PollBlocking(remaining, std::chrono::milliseconds{ 0 });
  for (auto &event : remaining) {
    if (auto *reply = std::get_if<InboundReply>(&event); reply) {
      reply->mContinuation(std::move(reply->mResult));
    }
  }

  mTerminated = true;
  Transition(SessionState::Terminated);
  const auto error = TerminalError();
  NotifyListeners([&](SessionListener &listener) { listener.OnTerminated(mId, error); });
}
} // namespace ldb
