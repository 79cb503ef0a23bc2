/** LICENSE TEMPLATE */
#pragma once
#include <functional>
#include <string>

namespace ldb {

/// Unit of work executed by a ThreadPool worker. The pool takes ownership and deletes the task after it ran.
class Task
{
public:
  Task() noexcept = default;
  virtual ~Task() noexcept = default;
  void Execute() noexcept;

protected:
  virtual void ExecuteTask() noexcept = 0;
};

class NoOp final : public Task
{
public:
  NoOp() noexcept : Task() {}
  ~NoOp() noexcept override = default;

protected:
  void ExecuteTask() noexcept final;
};

// Runs a callable. Exceptions escaping the callable are logged to the warning channel.
class FunctionTask final : public Task
{
public:
  FunctionTask(std::string name, std::function<void()> fn) noexcept;
  ~FunctionTask() noexcept override = default;

protected:
  void ExecuteTask() noexcept final;

private:
  std::string mName;
  std::function<void()> mFunction;
};

using JobPtr = Task *;
} // namespace ldb
