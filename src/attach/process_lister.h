/** LICENSE TEMPLATE */
#pragma once
#include "helper_tool.h"

namespace ldb {

/// Answers "what is process X called". Enumeration heuristics live behind this interface.
class ProcessLister
{
public:
  virtual ~ProcessLister() noexcept = default;
  virtual std::vector<ProcessInfo> ListProcesses() noexcept = 0;
  virtual std::optional<std::string> ProcessName(Pid pid) noexcept;
};

/// Reads /proc/<pid>/comm and /proc/<pid>/exe.
class ProcFsProcessLister final : public ProcessLister
{
  Path mProcRoot;

public:
  explicit ProcFsProcessLister(Path procRoot = "/proc") noexcept;
  std::vector<ProcessInfo> ListProcesses() noexcept final;
  std::optional<std::string> ProcessName(Pid pid) noexcept final;
};

/// Asks the helper tool, falling back to /proc when it can't be run.
class HelperToolProcessLister final : public ProcessLister
{
  HelperTool &mTool;
  Arch mArch;
  ProcFsProcessLister mFallback{};

public:
  HelperToolProcessLister(HelperTool &tool, Arch arch) noexcept;
  std::vector<ProcessInfo> ListProcesses() noexcept final;
  std::optional<std::string> ProcessName(Pid pid) noexcept final;
};
} // namespace ldb
