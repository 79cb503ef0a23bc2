/** LICENSE TEMPLATE */
#include "thread_pool.h"
#include <common.h>
#include <format>
#include <stop_token>

namespace ldb {
/* static */ ThreadPool *ThreadPool::sGlobalThreadPool = nullptr;

/* static */ ThreadPool *
ThreadPool::GetGlobalPool() noexcept
{
  return sGlobalThreadPool;
}

/* static */ ThreadPool *
ThreadPool::InitGlobalPool(u32 poolSize) noexcept
{
  static std::once_flag initOnce;
  std::call_once(initOnce, [poolSize]() {
    sGlobalThreadPool = new ThreadPool{};
    sGlobalThreadPool->Init(poolSize);
  });
  return sGlobalThreadPool;
}

void
ThreadPool::PostTask(Task *task) noexcept
{
  std::lock_guard lock(mTaskMutex);
  mTaskQueue.push(task);
  mTaskConditionVariable.notify_one();
}

void
ThreadPool::PostTasks(std::span<Task *> tasks) noexcept
{
  std::lock_guard lock(mTaskMutex);
  for (auto t : tasks) {
    mTaskQueue.push(t);
  }
  mTaskConditionVariable.notify_all();
}

void
ThreadPool::Post(std::string name, std::function<void()> fn) noexcept
{
  PostTask(new FunctionTask{ std::move(name), std::move(fn) });
}

ThreadPool::ThreadPool() noexcept : mThreadPool(), mTaskQueue(), mTaskMutex(), mTaskConditionVariable() {}

ThreadPool::~ThreadPool()
{
  auto tasks = ShutdownTasks();
  for (auto &t : mThreadPool) {
    t->RequestStop();
  }
  // Wake every worker so it observes the stop request.
  PostTasks(tasks);

  for (auto &t : mThreadPool) {
    t->Join();
  }

  while (!mTaskQueue.empty()) {
    delete mTaskQueue.front();
    mTaskQueue.pop();
  }
}

void
ThreadPool::Init(u32 poolSize) noexcept
{
  mThreadPool.reserve(poolSize);
  for (auto i = 0u; i < poolSize; ++i) {
    mThreadPool.emplace_back(DebuggerThread::SpawnDebuggerThread(
      std::format("PoolWorker-{}", i), [this](std::stop_token &token) { WorkerLoop(token); }));
  }
}

u32
ThreadPool::WorkerCount() const noexcept
{
  return static_cast<u32>(mThreadPool.size());
}

std::vector<Task *>
ThreadPool::ShutdownTasks() noexcept
{
  std::vector<Task *> res;
  const auto sz = WorkerCount();
  res.reserve(sz);
  for (auto i = 0u; i < sz; ++i) {
    res.push_back(new NoOp{});
  }
  return res;
}

void
ThreadPool::WorkerLoop(std::stop_token &stopToken) noexcept
{
  while (!stopToken.stop_requested()) {
    Task *job = nullptr;
    {
      std::unique_lock lock(mTaskMutex);
      while (mTaskQueue.empty()) {
        mTaskConditionVariable.wait(lock);
      }
      job = mTaskQueue.front();
      mTaskQueue.pop();
    }
    LDB_ASSERT(job != nullptr, "Failed to retrieve work from task queue");
    job->Execute();
    delete job;
  }
}
} // namespace ldb
