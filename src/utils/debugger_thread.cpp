/** LICENSE TEMPLATE */
#include "debugger_thread.h"
#include <common.h>
#include <linux/prctl.h>
#include <stop_token>
#include <sys/prctl.h>
#include <utils/logger.h>

namespace ldb {
DebuggerThread::DebuggerThread(std::string &&name, std::function<void(std::stop_token &)> &&task) noexcept
    : mThreadName(std::move(name)), mWork(std::move(task)), mThread(), mStarted(false)
{
}

DebuggerThread::~DebuggerThread() noexcept
{
  mThread.request_stop();
  if (IsCurrentThread()) {
    // Last owner dropped us from within our own work function.
    mThread.detach();
    return;
  }
  if (mThread.joinable()) {
    mThread.join();
  }
}

/* static */
DebuggerThread::OwnedPtr
DebuggerThread::SpawnDebuggerThread(std::function<void(std::stop_token &)> task) noexcept
{
  auto thread = std::unique_ptr<DebuggerThread>(
    new DebuggerThread{ std::format("ldb-{}", GetNextDebuggerThreadNumber()), std::move(task) });
  thread->Start();
  return thread;
}

/* static */
DebuggerThread::OwnedPtr
DebuggerThread::SpawnDebuggerThread(std::string name, std::function<void(std::stop_token &)> task) noexcept
{
  auto thread = std::unique_ptr<DebuggerThread>(new DebuggerThread{ std::move(name), std::move(task) });
  thread->Start();
  return thread;
}

void
DebuggerThread::Start() noexcept
{
  LDB_ASSERT(mStarted == false, "Thread already started");
  mStarted = true;
  mThread = std::jthread([this](std::stop_token token) {
    // Kernel thread names are capped at 15 chars + NUL.
    const auto name = mThreadName.substr(0, 15);
    if (prctl(PR_SET_NAME, name.c_str()) == -1) {
      DBGLOG(warning, "Failed to set thread name {}", mThreadName);
    }
    mWork(token);
  });
}

void
DebuggerThread::Join() noexcept
{
  if (mThread.joinable() && !IsCurrentThread()) {
    mThread.join();
  }
}

bool
DebuggerThread::IsJoinable() const noexcept
{
  return mThread.joinable();
}

bool
DebuggerThread::RequestStop() noexcept
{
  return mThread.request_stop();
}

bool
DebuggerThread::IsCurrentThread() const noexcept
{
  return mThread.get_id() == std::this_thread::get_id();
}
} // namespace ldb
