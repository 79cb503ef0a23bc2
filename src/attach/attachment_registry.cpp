/** LICENSE TEMPLATE */
#include "attachment_registry.h"
#include <algorithm>
#include <session/debug_session.h>
#include <utils/logger.h>

namespace ldb {

namespace {
class RegistryRemovalListener final : public SessionListener
{
  AttachmentRegistry &mRegistry;
  Pid mPid;

public:
  RegistryRemovalListener(AttachmentRegistry &registry, Pid pid) noexcept : mRegistry(registry), mPid(pid) {}

  void
  OnTerminated(SessionId id, const std::optional<SessionError> &error) noexcept final
  {
    DBGLOG(attach,
      "session {} terminated{}; releasing process {}",
      id,
      error ? std::format(" ({}: {})", error->mKind, error->mMessage) : std::string{},
      mPid);
    mRegistry.Remove(mPid);
  }
};
} // namespace

std::string
AttachmentRecord::Describe() const noexcept
{
  if (mPending) {
    return std::format("pid {} being attached by session {}", mPid, mSession);
  }
  return std::format("pid {} ({}) attached by session {} at {:%F %T}",
    mPid,
    mProcessName,
    mSession,
    std::chrono::floor<std::chrono::seconds>(mAttachTime));
}

std::expected<void, AttachmentRecord>
AttachmentRegistry::AttemptAttach(Pid pid, SessionId owner) noexcept
{
  std::lock_guard lock(mMutex);
  auto [it, reserved] = mRecords.try_emplace(pid,
    AttachmentRecord{ .mPid = pid,
                      .mProcessName = {},
                      .mSession = owner,
                      .mAttachTime = std::chrono::system_clock::now(),
                      .mPending = true });
  if (!reserved) {
    return std::unexpected(it->second);
  }
  DBGLOG(attach, "reserved process {} for session {}", pid, owner);
  return {};
}

bool
AttachmentRegistry::Release(Pid pid, SessionId owner) noexcept
{
  std::lock_guard lock(mMutex);
  auto it = mRecords.find(pid);
  if (it == mRecords.end() || !it->second.mPending || it->second.mSession != owner) {
    return false;
  }
  mRecords.erase(it);
  DBGLOG(attach, "released reservation of process {} by session {}", pid, owner);
  return true;
}

bool
AttachmentRegistry::Record(Pid pid, std::string processName, DebugSession &session) noexcept
{
  bool recorded = false;
  {
    std::lock_guard lock(mMutex);
    auto it = mRecords.find(pid);
    if (it == mRecords.end()) {
      it = mRecords
             .try_emplace(pid,
               AttachmentRecord{ .mPid = pid,
                                 .mProcessName = std::move(processName),
                                 .mSession = session.Id(),
                                 .mAttachTime = std::chrono::system_clock::now() })
             .first;
      recorded = true;
    } else if (it->second.mPending && it->second.mSession == session.Id()) {
      it->second.mProcessName = std::move(processName);
      it->second.mAttachTime = std::chrono::system_clock::now();
      it->second.mPending = false;
      recorded = true;
    }
    if (recorded) {
      DBGLOG(attach, "recorded {}", it->second.Describe());
    } else {
      DBGLOG(warning, "process {} is already attached: {}", pid, it->second.Describe());
    }
  }
  if (recorded) {
    session.AddListener(std::make_shared<RegistryRemovalListener>(*this, pid));
  }
  return recorded;
}

bool
AttachmentRegistry::Insert(AttachmentRecord record) noexcept
{
  std::lock_guard lock(mMutex);
  const auto pid = record.mPid;
  auto [it, inserted] = mRecords.try_emplace(pid, std::move(record));
  if (!inserted) {
    DBGLOG(warning, "process {} is already attached: {}", pid, it->second.Describe());
  } else {
    DBGLOG(attach, "recorded {}", it->second.Describe());
  }
  return inserted;
}

bool
AttachmentRegistry::Remove(Pid pid) noexcept
{
  std::lock_guard lock(mMutex);
  return mRecords.erase(pid) == 1;
}

bool
AttachmentRegistry::IsProcessAttached(Pid pid) const noexcept
{
  std::lock_guard lock(mMutex);
  return mRecords.contains(pid);
}

std::optional<AttachmentRecord>
AttachmentRegistry::GetAttachedProcessInfo(Pid pid) const noexcept
{
  std::lock_guard lock(mMutex);
  if (auto it = mRecords.find(pid); it != mRecords.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<Pid>
AttachmentRegistry::GetAttachedProcessIds() const noexcept
{
  std::vector<Pid> pids{};
  {
    std::lock_guard lock(mMutex);
    pids.reserve(mRecords.size());
    for (const auto &[pid, _] : mRecords) {
      pids.push_back(pid);
    }
  }
  std::ranges::sort(pids);
  return pids;
}

u32
AttachmentRegistry::Count() const noexcept
{
  std::lock_guard lock(mMutex);
  return static_cast<u32>(mRecords.size());
}

void
AttachmentRegistry::ClearAll() noexcept
{
  std::lock_guard lock(mMutex);
  DBGLOG(attach, "clearing {} attachment records", mRecords.size());
  mRecords.clear();
}

std::string
AttachmentRegistry::Summary() const noexcept
{
  std::string summary{};
  for (auto pid : GetAttachedProcessIds()) {
    if (auto record = GetAttachedProcessInfo(pid); record) {
      summary.append(record->Describe());
      summary.push_back('\n');
    }
  }
  if (summary.empty()) {
    summary = "no attached processes\n";
  }
  return summary;
}
} // namespace ldb
