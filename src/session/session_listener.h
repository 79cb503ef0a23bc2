/** LICENSE TEMPLATE */
#pragma once
#include <common.h>
#include <session/stack_frame.h>
#include <optional>
#include <string>

namespace ldb {

using SessionId = u32;

#define FOR_EACH_SESSION_STATE(STATE)                                                                             \
  STATE(Created)                                                                                                  \
  STATE(Initializing)                                                                                             \
  STATE(Connecting)                                                                                               \
  STATE(Attaching)                                                                                                \
  STATE(Handshaking)                                                                                              \
  STATE(Ready)                                                                                                    \
  STATE(Running)                                                                                                  \
  STATE(Paused)                                                                                                   \
  STATE(Stopping)                                                                                                 \
  STATE(Terminated)

enum class SessionState : u8
{
  FOR_EACH_SESSION_STATE(DEFAULT_ENUM)
};

#define FOR_EACH_SESSION_ERROR(ERR)                                                                               \
  ERR(UnsupportedPlatform)                                                                                        \
  ERR(ToolMissing)                                                                                                \
  ERR(AttachFailed)                                                                                               \
  ERR(ConnectTimeout)                                                                                             \
  ERR(DoubleAttach)                                                                                               \
  ERR(PeerDisconnected)                                                                                           \
  ERR(TransportFailed)

enum class SessionErrorKind : u8
{
  FOR_EACH_SESSION_ERROR(DEFAULT_ENUM)
};

/// The single terminal error a session reports.
struct SessionError
{
  SessionErrorKind mKind;
  std::string mMessage;
};

#define FOR_EACH_LOG_SEVERITY(SEV)                                                                                \
  SEV(Debug)                                                                                                      \
  SEV(Info)                                                                                                       \
  SEV(Warning)                                                                                                    \
  SEV(Error)

enum class LogSeverity : u8
{
  FOR_EACH_LOG_SEVERITY(DEFAULT_ENUM)
};

struct PausedEvent
{
  std::vector<StackFrameSnapshot> mFrames;
  size_t mTopFrame;
  // The notification that caused the pause, e.g. "stopOnBreakpoint" or "BreakNotify".
  std::string mReason;

  const StackFrameSnapshot &
  TopFrame() const noexcept
  {
    return mFrames[mTopFrame];
  }
};

/// Observes a DebugSession. All callbacks run on the session's event thread.
class SessionListener
{
public:
  virtual ~SessionListener() noexcept = default;
  virtual void
  OnStateChanged(SessionId, SessionState, SessionState) noexcept
  {
  }
  virtual void
  OnPaused(SessionId, const PausedEvent &) noexcept
  {
  }
  // Output from the debuggee or the injected runtime.
  virtual void
  OnLog(SessionId, LogSeverity, std::string_view) noexcept
  {
  }
  // Raised exactly once, after the session reached Terminated. `error` is set for abnormal termination.
  virtual void OnTerminated(SessionId id, const std::optional<SessionError> &error) noexcept = 0;
};
} // namespace ldb

PREDEFINED_ENUM_TYPE_METADATA(ldb::SessionState, SessionState, FOR_EACH_SESSION_STATE)
PREDEFINED_ENUM_TYPE_METADATA(ldb::SessionErrorKind, SessionErrorKind, FOR_EACH_SESSION_ERROR)
PREDEFINED_ENUM_TYPE_METADATA(ldb::LogSeverity, LogSeverity, FOR_EACH_LOG_SEVERITY)
