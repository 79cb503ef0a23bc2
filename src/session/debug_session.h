/** LICENSE TEMPLATE */
#pragma once
#include <attach/attach_workflow.h>
#include <attach/attachment_registry.h>
#include <attach/process_launcher.h>
#include <attach/process_lister.h>
#include <bp_spec.h>
#include <condition_variable>
#include <memory>
#include <session/breakpoint_synchronizer.h>
#include <session/event_queue.h>
#include <session/protocol_driver.h>
#include <session/script_provider.h>
#include <session/session_config.h>
#include <session/session_listener.h>
#include <utils/debugger_thread.h>
#include <utils/thread_pool.h>

namespace ldb {

/// Collaborators a session needs. Everything referenced must outlive the session.
struct SessionDependencies
{
  BreakpointSource &mBreakpoints;
  ScriptProvider &mScripts;
  // Required for process attach.
  AttachmentRegistry *mRegistry{ nullptr };
  // Defaults to fork + execve.
  ProcessLauncher *mLauncher{ nullptr };
  // Defaults to the helper tool's process list for attach, /proc otherwise.
  ProcessLister *mLister{ nullptr };
  // Defaults to the global pool.
  ThreadPool *mPool{ nullptr };
};

/// One debug session against one Lua runtime.
///
/// Every state transition, every protocol exchange and every listener callback happens on the session's own
/// event thread. The public member functions may be called from any thread; they queue work for that thread.
/// Connecting (including process attach) and detach cleanup run on the worker pool.
class DebugSession final : public std::enable_shared_from_this<DebugSession>, private TransportListener
{
  struct Private
  {
  };

public:
  DebugSession(Private, SessionConfig config, SessionDependencies dependencies) noexcept;
  ~DebugSession() noexcept override;
  NO_COPY(DebugSession);

  static std::shared_ptr<DebugSession> Create(SessionConfig config, SessionDependencies dependencies) noexcept;

  SessionId Id() const noexcept;
  SessionState State() const noexcept;
  const SessionConfig &Config() const noexcept;
  void AddListener(std::shared_ptr<SessionListener> listener) noexcept;

  // Created -> Initializing -> Connecting, with the connect handed to the worker pool.
  void Start() noexcept;
  // Idempotent. Returns immediately; the session reaches Terminated on its own thread.
  void Stop() noexcept;

  void Resume() noexcept;
  void StepOver() noexcept;
  void StepIn() noexcept;
  void StepOut() noexcept;
  void Pause() noexcept;
  void RunToPosition(std::string filePath, u32 line) noexcept;

  // The IDE added or removed a breakpoint. Synchronized now when connected, else at the next handshake.
  void OnBreakpointAdded(std::shared_ptr<SourceBreakpoint> breakpoint) noexcept;
  void OnBreakpointRemoved(std::shared_ptr<SourceBreakpoint> breakpoint) noexcept;

  // Evaluates in the given frame of the current pause, the top frame when not given. `callback` runs on the
  // session thread.
  void Evaluate(std::string expression, std::optional<size_t> frameIndex, EvaluationCallback callback) noexcept;
  void FetchChildren(Variable variable, std::optional<size_t> frameIndex, ChildrenCallback callback) noexcept;

  std::optional<PausedEvent> CurrentPause() const noexcept;
  std::optional<SessionError> TerminalError() const noexcept;

  bool WaitForState(SessionState state, std::chrono::milliseconds timeout) const noexcept;
  bool WaitForTermination(std::chrono::milliseconds timeout) const noexcept;

private:
  // TransportListener, called on a receive thread.
  void OnMessage(WireMessage message) noexcept final;
  void OnReply(ReplyContinuation continuation, ReplyResult result) noexcept final;
  void OnDisconnect() noexcept final;

  void Post(std::string name, std::function<void()> fn) noexcept;
  void EventLoop(std::stop_token &token) noexcept;
  void Handle(SessionEvent &event) noexcept;
  void Transition(SessionState next) noexcept;
  bool IsInteractive() const noexcept;

  // Runs on the worker pool.
  void RunConnect() noexcept;
  ConnectFinished ConnectAttach() noexcept;
  ConnectFinished ConnectLineJson() noexcept;
  void SetPendingTransporter(Transporter *transporter) noexcept;

  void OnStart() noexcept;
  void OnConnectFinished(ConnectFinished finished) noexcept;
  void StartHandshake() noexcept;
  void CompleteHandshake() noexcept;
  void OnInboundMessage(WireMessage message) noexcept;
  void OnPeerDisconnected() noexcept;
  void OnBreak(BreakEvent event) noexcept;
  void OnLog(LogSeverity severity, std::string_view text) noexcept;
  void SendRunControl(RunControl action, std::string_view name) noexcept;

  // Stop path. `notifyPeer` is false when the peer is gone or asked for the stop itself.
  void BeginStop(std::optional<SessionError> error, bool notifyPeer) noexcept;
  void FinishStop() noexcept;
  void ReleaseTransport() noexcept;
  void Terminate() noexcept;

  template <typename Fn>
  void
  NotifyListeners(Fn &&fn) noexcept
  {
    std::vector<std::shared_ptr<SessionListener>> listeners;
    {
      std::lock_guard lock(mListenersMutex);
      listeners = mListeners;
    }
    for (const auto &listener : listeners) {
      fn(*listener);
    }
  }

  SessionId mId;
  SessionConfig mConfig;
  SessionDependencies mDependencies;
  std::unique_ptr<ProcessLauncher> mOwnedLauncher{};
  std::unique_ptr<HelperTool> mOwnedTool{};
  std::unique_ptr<ProcessLister> mOwnedLister{};

  std::atomic<bool> mStopping{ false };
  std::atomic<SessionState> mState{ SessionState::Created };
  mutable std::mutex mStateMutex{};
  mutable std::condition_variable mStateChanged{};

  std::mutex mListenersMutex{};
  std::vector<std::shared_ptr<SessionListener>> mListeners{};

  SessionEventQueue mQueue{};
  std::unique_ptr<ProtocolDriver> mDriver;
  BreakpointSynchronizer mSynchronizer;

  // Session thread only.
  std::unique_ptr<Transporter> mTransporter{};
  std::optional<Pid> mAttachedPid{};
  bool mConnectInFlight{ false };
  bool mFinishing{ false };
  bool mTerminated{ false };
  bool mEarlyDisconnect{ false };
  std::vector<WireMessage> mEarlyMessages{};
  std::optional<std::chrono::steady_clock::time_point> mStopDeadline{};

  // Transporter being connected on the pool. Stop closes it to abort a blocking accept.
  std::mutex mPendingMutex{};
  Transporter *mPendingTransporter{ nullptr };

  // Read from any thread.
  mutable std::mutex mSnapshotMutex{};
  std::optional<PausedEvent> mPause{};
  std::optional<SessionError> mTerminalError{};

  DebuggerThread::OwnedPtr mThread{};
};
} // namespace ldb
