/** LICENSE TEMPLATE */
#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

namespace ldb {
class DebuggerThread
{
  static int
  GetNextDebuggerThreadNumber()
  {
    static std::atomic<int> i = 0;
    return i++;
  }

  std::string mThreadName;
  explicit DebuggerThread(std::string &&name, std::function<void(std::stop_token &)> &&task) noexcept;

public:
  using OwnedPtr = std::unique_ptr<DebuggerThread>;

  ~DebuggerThread() noexcept;
  /// Create a debugger thread
  static OwnedPtr SpawnDebuggerThread(std::function<void(std::stop_token &)> task) noexcept;
  static OwnedPtr SpawnDebuggerThread(std::string threadName, std::function<void(std::stop_token &)> task) noexcept;

  /// Start the thread.
  void Start() noexcept;
  /// Join the thread. Joining from the thread itself is a no-op.
  void Join() noexcept;
  /// Check if the thread is joinable.
  bool IsJoinable() const noexcept;
  /// Request jthread to stop
  bool RequestStop() noexcept;
  bool IsCurrentThread() const noexcept;

private:
  std::function<void(std::stop_token &tok)> mWork; // The task to run in the thread
  std::jthread mThread;                            // The underlying std::thread
  bool mStarted;
};
} // namespace ldb
