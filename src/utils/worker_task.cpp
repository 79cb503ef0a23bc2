/** LICENSE TEMPLATE */
#include "worker_task.h"
#include <exception>
#include <utils/logger.h>

namespace ldb {
void
Task::Execute() noexcept
{
  ExecuteTask();
}

void
NoOp::ExecuteTask() noexcept
{
}

FunctionTask::FunctionTask(std::string name, std::function<void()> fn) noexcept
    : mName(std::move(name)), mFunction(std::move(fn))
{
}

void
FunctionTask::ExecuteTask() noexcept
{
  try {
    mFunction();
  } catch (const std::exception &e) {
    DBGLOG(warning, "task '{}' failed: {}", mName, e.what());
  }
}
} // namespace ldb
