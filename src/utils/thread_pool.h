/** LICENSE TEMPLATE */
#pragma once
#include <common/typedefs.h>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <span>
#include <utils/debugger_thread.h>
#include <utils/worker_task.h>
#include <vector>

namespace ldb {

class ThreadPool
{
public:
  ThreadPool() noexcept;
  ~ThreadPool();
  void Init(u32 poolSize) noexcept;
  u32 WorkerCount() const noexcept;
  static ThreadPool *GetGlobalPool() noexcept;
  // Creates the process wide pool on first use.
  static ThreadPool *InitGlobalPool(u32 poolSize) noexcept;
  void PostTask(Task *task) noexcept;
  void PostTasks(std::span<Task *> tasks) noexcept;
  void Post(std::string name, std::function<void()> fn) noexcept;
  std::vector<Task *> ShutdownTasks() noexcept;
  void WorkerLoop(std::stop_token &stopToken) noexcept;

  static void
  ShutdownGlobalPool() noexcept
  {
    delete sGlobalThreadPool;
    sGlobalThreadPool = nullptr;
  }

private:
  static ThreadPool *sGlobalThreadPool;
  std::vector<std::unique_ptr<DebuggerThread>> mThreadPool;
  std::queue<Task *> mTaskQueue;
  std::mutex mTaskMutex;
  std::condition_variable mTaskConditionVariable;
};
} // namespace ldb
