/** LICENSE TEMPLATE */
#pragma once
#include <chrono>
#include <functional>
#include <interface/transport/transporter.h>
#include <mutex>
#include <notify_pipe.h>
#include <optional>
#include <session/session_listener.h>
#include <string>
#include <variant>
#include <vector>

namespace ldb {

struct InboundMessage
{
  WireMessage mMessage;
};

struct InboundReply
{
  ReplyContinuation mContinuation;
  ReplyResult mResult;
};

struct PeerDisconnected
{
};

// Result of the background connect step. On success the session takes ownership of the transporter.
struct ConnectFinished
{
  std::unique_ptr<Transporter> mTransporter;
  std::optional<SessionError> mError;
  // Set for process attach.
  std::optional<Pid> mAttachedPid{};
  std::string mProcessName{};
};

struct SessionCommand
{
  std::string mName;
  std::function<void()> mRun;
};

using SessionEvent = std::variant<InboundMessage, InboundReply, PeerDisconnected, ConnectFinished, SessionCommand>;

/// Hands events from any thread to the one thread that runs a session. Producers push, the session thread blocks
/// in PollBlocking.
class SessionEventQueue
{
  std::mutex mEventsGuard{};
  std::vector<SessionEvent> mEvents{};
  Notifier mNotifier;

public:
  SessionEventQueue() noexcept;
  ~SessionEventQueue() noexcept;
  NO_COPY(SessionEventQueue);

  void Push(SessionEvent event) noexcept;
  // Wakes a blocked PollBlocking without an event.
  void Wake() noexcept;
  // Moves pending events into `out`. Blocks until there are some, until woken, or until `timeout` passed.
  // Returns false when nothing was received.
  bool PollBlocking(std::vector<SessionEvent> &out, std::optional<std::chrono::milliseconds> timeout) noexcept;
};
} // namespace ldb
