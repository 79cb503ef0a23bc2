/** LICENSE TEMPLATE */
#pragma once
#include <chrono>
#include <common.h>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <session/session_listener.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace ldb {

class DebugSession;

struct AttachmentRecord
{
  Pid mPid;
  std::string mProcessName;
  SessionId mSession;
  std::chrono::system_clock::time_point mAttachTime;
  // Reserved by an attach that has not connected yet.
  bool mPending{ false };

  std::string Describe() const noexcept;
};

/// Which OS processes currently have a debug session attached. This is the only state shared between
/// sessions; every member is safe to call from any thread.
///
/// Lifecycle: created once at start up and handed to every session that can attach. Records are removed by
/// the owning session's termination listener. ClearAll is called at shut down; the registry must outlive
/// every session it was handed to.
class AttachmentRegistry
{
  mutable std::mutex mMutex;
  std::unordered_map<Pid, AttachmentRecord> mRecords;

public:
  AttachmentRegistry() noexcept = default;
  NO_COPY(AttachmentRegistry);

  // Reserves `pid` for `owner` when it is free. Otherwise returns the record of the session that holds it.
  // The reservation blocks every other attach until it is promoted by Record or dropped by Release.
  std::expected<void, AttachmentRecord> AttemptAttach(Pid pid, SessionId owner) noexcept;
  // Drops a reservation still pending for `owner`. Records promoted by Record are left alone.
  bool Release(Pid pid, SessionId owner) noexcept;

  // Promotes the reservation `session` holds on `pid` (or installs a fresh record) and adds a lifecycle
  // listener on `session` that removes it when the session terminates. False when another session holds `pid`.
  bool Record(Pid pid, std::string processName, DebugSession &session) noexcept;
  // Installs a record with no lifecycle listener. The caller is responsible for calling Remove.
  bool Insert(AttachmentRecord record) noexcept;
  bool Remove(Pid pid) noexcept;

  bool IsProcessAttached(Pid pid) const noexcept;
  std::optional<AttachmentRecord> GetAttachedProcessInfo(Pid pid) const noexcept;
  std::vector<Pid> GetAttachedProcessIds() const noexcept;
  u32 Count() const noexcept;
  void ClearAll() noexcept;
  std::string Summary() const noexcept;
};
} // namespace ldb
