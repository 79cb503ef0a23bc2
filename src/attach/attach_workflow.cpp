/** LICENSE TEMPLATE */
#include "attach_workflow.h"
#include "module_scan.h"
#include <filesystem>
#include <thread>
#include <utils/logger.h>
#include <utils/thread_pool.h>
#include <utils/util.h>

namespace ldb {

std::string_view
AttachFailureHints() noexcept
{
  return "Possible causes: the target has no Lua runtime loaded, the injection was blocked or the debug server "
         "did not start, the port is in use by another process, or a firewall rejects loopback connections.";
}

AttachWorkflow::AttachWorkflow(AttachConfig config,
  AttachmentRegistry &registry,
  ProcessLauncher &launcher,
  ProcessLister &lister,
  const std::atomic<bool> &cancelled) noexcept
    : mConfig(std::move(config)), mRegistry(registry), mTool(mConfig.mToolDirectory, launcher), mLister(lister),
      mCancelled(cancelled)
{
}

AttachState
AttachWorkflow::State() const noexcept
{
  return mState.load(std::memory_order_acquire);
}

void
AttachWorkflow::SetStateObserver(StateObserver observer) noexcept
{
  mObserver = std::move(observer);
}

void
AttachWorkflow::SetTransportListener(TransportListener *listener) noexcept
{
  mTransportListener = listener;
}

void
AttachWorkflow::SetOwner(SessionId owner) noexcept
{
  mOwner = owner;
}

void
AttachWorkflow::SetWorkerPool(ThreadPool *pool) noexcept
{
  mPool = pool;
}

int
AttachWorkflow::Port() const noexcept
{
  return mConfig.mPortOverride.value_or(DerivePort(mConfig.mPid));
}

u32
AttachWorkflow::ConnectAttempts() const noexcept
{
  return mConnectAttempts;
}

void
AttachWorkflow::Transition(AttachState next) noexcept
{
  const auto previous = mState.exchange(next, std::memory_order_acq_rel);
  DBGLOG(attach, "attach {}: {} -> {}", mConfig.mPid, previous, next);
  if (mObserver) {
    mObserver(next);
  }
}

std::expected<AttachResult, AttachError>
AttachWorkflow::Fail(AttachErrorKind kind, std::string message) noexcept
{
  DBGLOG(attach, "attach {} failed ({}): {}", mConfig.mPid, kind, message);
  Transition(AttachState::Failed);
  return std::unexpected(AttachError{ kind, std::move(message) });
}

bool
AttachWorkflow::IsCancelled() const noexcept
{
  return mCancelled.load(std::memory_order_acquire);
}

bool
AttachWorkflow::InterruptibleWait(std::chrono::milliseconds duration) const noexcept
{
  const auto slice = std::max(mConfig.mWaitSlice, std::chrono::milliseconds{ 1 });
  while (duration.count() > 0) {
    if (IsCancelled()) {
      return false;
    }
    const auto step = std::min(slice, duration);
    std::this_thread::sleep_for(step);
    duration -= step;
  }
  return !IsCancelled();
}

void
AttachWorkflow::ProbePort() const noexcept
{
  const auto port = Port();
  for (const auto &host : mConfig.mHosts) {
    auto probe = ScopedFd::OpenSocketConnectTo(host, port);
    if (probe) {
      DBGLOG(attach, "probe {}:{} accepted", host, port);
    } else {
      DBGLOG(attach, "probe {}:{} failed: {}", host, port, probe.error().Describe());
    }
  }
}

std::expected<AttachResult, AttachError>
AttachWorkflow::Run() noexcept
{
  const auto pid = mConfig.mPid;
  mConnectAttempts = 0;

  if (auto free = mRegistry.AttemptAttach(pid, mOwner); !free) {
    const auto &holder = free.error();
    if (holder.mPending) {
      return Fail(AttachErrorKind::DoubleAttach,
        std::format("Process {} is already being attached by session {}.", pid, holder.mSession));
    }
    return Fail(AttachErrorKind::DoubleAttach,
      std::format("Process {} is already attached ({}, since {:%F %T}).",
        pid,
        holder.mProcessName,
        std::chrono::floor<std::chrono::seconds>(holder.mAttachTime)));
  }

  auto result = InjectAndConnect();
  if (!result) {
    mRegistry.Release(pid, mOwner);
  }
  return result;
}

std::expected<AttachResult, AttachError>
AttachWorkflow::InjectAndConnect() noexcept
{
  const auto pid = mConfig.mPid;

  Transition(AttachState::Validating);
  if constexpr (!kProcessAttachSupported) {
    return Fail(AttachErrorKind::UnsupportedPlatform, "Attaching to a process is only supported on Linux.");
  }
  if (auto missing = mTool.Validate(); missing) {
    return Fail(AttachErrorKind::ToolMissing, std::move(missing).value());
  }
  if (IsCancelled()) {
    return Fail(AttachErrorKind::Cancelled, "Attach cancelled.");
  }

  Transition(AttachState::Invoking);
  auto arch = mTool.DetectArch(pid);
  if (arch != mConfig.mArch) {
    DBGLOG(attach,
      "process {} is {}, configured {}; using the detected architecture",
      pid,
      ArchDirectoryName(arch),
      ArchDirectoryName(mConfig.mArch));
  }
  if (auto missing = mTool.ToolPath(arch); !std::filesystem::exists(missing)) {
    return Fail(AttachErrorKind::ToolMissing, std::format("Helper tool not found. Missing: {}", missing.string()));
  }

  auto invocation = mTool.Attach(pid, arch, mConfig.mCaptureLog);
  if (!invocation) {
    return Fail(AttachErrorKind::AttachFailed,
      std::format("Could not run {}: {}", mTool.ToolPath(arch).string(), invocation.error().Describe()));
  }
  if (invocation->mExitCode != 0) {
    const auto &detail = invocation->mStderr.empty() ? invocation->mStdout : invocation->mStderr;
    return Fail(AttachErrorKind::AttachFailed,
      std::format("Injection into process {} failed with exit code {}: {}",
        pid,
        invocation->mExitCode,
        TrimWhitespace(detail)));
  }

  Transition(AttachState::WaitingForService);
  if (!InterruptibleWait(mConfig.mSettleDelay)) {
    return Fail(AttachErrorKind::Cancelled, "Attach cancelled.");
  }

  const auto port = Port();
  Transition(AttachState::ProbingPort);
  if (mConfig.mProbePort) {
    ProbePort();
  }

  Transition(AttachState::Connecting);
  std::string lastError{ "no connection attempt was made" };
  const auto attempts = std::max(mConfig.mRetryCount, 1u);
  for (u32 attempt = 1; attempt <= attempts; ++attempt) {
    if (IsCancelled()) {
      return Fail(AttachErrorKind::Cancelled, "Attach cancelled.");
    }
    ++mConnectAttempts;
    auto transporter = std::make_unique<AttachSocketTransporter>(mConfig.mHosts, port);
    transporter->SetListener(mTransportListener);
    auto connected = transporter->Connect();
    if (connected) {
      DBGLOG(attach,
        "connected to process {} via {}:{} on attempt {}",
        pid,
        transporter->ConnectedHost().value_or("?"),
        port,
        attempt);
      // A cancel that raced the connect wins: the caller must not see a live connection.
      if (IsCancelled()) {
        transporter->Close();
        return Fail(AttachErrorKind::Cancelled, "Attach cancelled.");
      }
      Transition(AttachState::Connected);
      if (mPool != nullptr) {
        mPool->Post("module-scan", [pid]() { LogModuleScan(pid); });
      } else {
        LogModuleScan(pid);
      }
      return AttachResult{ .mTransporter = std::move(transporter),
                           .mProcessName = mLister.ProcessName(pid).value_or(std::format("pid {}", pid)),
                           .mArch = arch,
                           .mPort = port };
    }

    if (const auto &errors = transporter->LastAttemptErrors(); !errors.empty()) {
      lastError = std::format("{}: {}", errors.back().first, errors.back().second.Describe());
    } else {
      lastError = connected.error().Describe();
    }
    DBGLOG(attach, "connect attempt {}/{} to port {} failed: {}", attempt, attempts, port, lastError);

    if (attempt < attempts && !InterruptibleWait(mConfig.mRetryDelay)) {
      return Fail(AttachErrorKind::Cancelled, "Attach cancelled.");
    }
  }

  return Fail(AttachErrorKind::ConnectTimeout,
    std::format("Could not connect to the debugger in process {} on port {} after {} attempts. Last error: {}. {}",
      pid,
      port,
      attempts,
      lastError,
      AttachFailureHints()));
}
} // namespace ldb
