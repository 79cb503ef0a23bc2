/** LICENSE TEMPLATE */
#pragma once
#include "attach_config.h"
#include "attachment_registry.h"
#include "helper_tool.h"
#include "process_lister.h"
#include <atomic>
#include <functional>
#include <interface/transport/socket_transporters.h>

namespace ldb {

class ThreadPool;

#if defined(__linux__)
static constexpr bool kProcessAttachSupported = true;
#else
static constexpr bool kProcessAttachSupported = false;
#endif

#define FOR_EACH_ATTACH_STATE(STATE)                                                                              \
  STATE(Idle)                                                                                                     \
  STATE(Validating)                                                                                               \
  STATE(Invoking)                                                                                                 \
  STATE(WaitingForService)                                                                                        \
  STATE(ProbingPort)                                                                                              \
  STATE(Connecting)                                                                                               \
  STATE(Connected)                                                                                                \
  STATE(Failed)

enum class AttachState : u8
{
  FOR_EACH_ATTACH_STATE(DEFAULT_ENUM)
};

#define FOR_EACH_ATTACH_ERROR(ERR)                                                                                \
  ERR(UnsupportedPlatform)                                                                                        \
  ERR(ToolMissing)                                                                                                \
  ERR(AttachFailed)                                                                                               \
  ERR(ConnectTimeout)                                                                                             \
  ERR(DoubleAttach)                                                                                               \
  ERR(Cancelled)

enum class AttachErrorKind : u8
{
  FOR_EACH_ATTACH_ERROR(DEFAULT_ENUM)
};

struct AttachError
{
  AttachErrorKind mKind;
  std::string mMessage;
};

struct AttachResult
{
  std::unique_ptr<AttachSocketTransporter> mTransporter;
  std::string mProcessName;
  Arch mArch;
  int mPort;
};

/// One attach attempt: inject through the helper tool, then connect to the listener the injected library opens.
/// Run blocks; it is meant for a worker thread. `cancelled` is polled between every step and during every wait.
class AttachWorkflow
{
public:
  using StateObserver = std::function<void(AttachState)>;

  AttachWorkflow(AttachConfig config,
    AttachmentRegistry &registry,
    ProcessLauncher &launcher,
    ProcessLister &lister,
    const std::atomic<bool> &cancelled) noexcept;

  std::expected<AttachResult, AttachError> Run() noexcept;

  AttachState State() const noexcept;
  void SetStateObserver(StateObserver observer) noexcept;
  // Installed on each transporter before it connects, so nothing the peer sends first is lost.
  void SetTransportListener(TransportListener *listener) noexcept;
  // The session the pid is reserved for in the registry. A successful Run leaves the reservation in place for
  // the owner to promote with AttachmentRegistry::Record or drop with AttachmentRegistry::Release.
  void SetOwner(SessionId owner) noexcept;
  // Runs the post-connect module scan. Without a pool the scan runs inline.
  void SetWorkerPool(ThreadPool *pool) noexcept;
  int Port() const noexcept;

  // Number of connect attempts made by the last Run.
  u32 ConnectAttempts() const noexcept;

private:
  void Transition(AttachState next) noexcept;
  std::expected<AttachResult, AttachError> Fail(AttachErrorKind kind, std::string message) noexcept;
  std::expected<AttachResult, AttachError> InjectAndConnect() noexcept;
  // Sleeps `duration` in slices. False if cancelled while waiting.
  bool InterruptibleWait(std::chrono::milliseconds duration) const noexcept;
  bool IsCancelled() const noexcept;
  void ProbePort() const noexcept;

  AttachConfig mConfig;
  AttachmentRegistry &mRegistry;
  HelperTool mTool;
  ProcessLister &mLister;
  const std::atomic<bool> &mCancelled;
  std::atomic<AttachState> mState{ AttachState::Idle };
  StateObserver mObserver{};
  TransportListener *mTransportListener{ nullptr };
  ThreadPool *mPool{ nullptr };
  SessionId mOwner{ 0 };
  u32 mConnectAttempts{ 0 };
};

std::string_view AttachFailureHints() noexcept;
} // namespace ldb

PREDEFINED_ENUM_TYPE_METADATA(ldb::AttachState, AttachState, FOR_EACH_ATTACH_STATE)
PREDEFINED_ENUM_TYPE_METADATA(ldb::AttachErrorKind, AttachErrorKind, FOR_EACH_ATTACH_ERROR)
