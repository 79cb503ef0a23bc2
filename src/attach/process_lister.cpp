/** LICENSE TEMPLATE */
#include "process_lister.h"
#include <filesystem>
#include <fstream>
#include <utils/logger.h>
#include <utils/util.h>

namespace ldb {

std::optional<std::string>
ProcessLister::ProcessName(Pid pid) noexcept
{
  for (const auto &process : ListProcesses()) {
    if (process.mPid == pid) {
      return process.mPath.filename().string();
    }
  }
  return std::nullopt;
}

ProcFsProcessLister::ProcFsProcessLister(Path procRoot) noexcept : mProcRoot(std::move(procRoot)) {}

std::vector<ProcessInfo>
ProcFsProcessLister::ListProcesses() noexcept
{
  std::vector<ProcessInfo> processes{};
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator{ mProcRoot, ec }) {
    const auto pid = StrToPid(entry.path().filename().string());
    if (!pid) {
      continue;
    }
    auto name = ProcessName(*pid);
    if (!name) {
      continue;
    }
    std::error_code linkError;
    auto exe = std::filesystem::read_symlink(entry.path() / "exe", linkError);
    processes.push_back(ProcessInfo{ .mPid = *pid, .mTitle = *name, .mPath = linkError ? Path{ *name } : exe });
  }
  if (ec) {
    DBGLOG(attach, "could not enumerate {}: {}", mProcRoot.string(), ec.message());
  }
  return processes;
}

std::optional<std::string>
ProcFsProcessLister::ProcessName(Pid pid) noexcept
{
  std::ifstream comm{ mProcRoot / std::to_string(pid) / "comm" };
  std::string name;
  if (!comm || !std::getline(comm, name)) {
    return std::nullopt;
  }
  return std::string{ TrimWhitespace(name) };
}

HelperToolProcessLister::HelperToolProcessLister(HelperTool &tool, Arch arch) noexcept : mTool(tool), mArch(arch)
{
}

std::vector<ProcessInfo>
HelperToolProcessLister::ListProcesses() noexcept
{
  auto result = mTool.ListProcesses(mArch);
  if (!result) {
    DBGLOG(attach, "list_processes failed: {}; using /proc", result.error().Describe());
    return mFallback.ListProcesses();
  }
  return std::move(result).value();
}

std::optional<std::string>
HelperToolProcessLister::ProcessName(Pid pid) noexcept
{
  if (auto name = mFallback.ProcessName(pid); name) {
    return name;
  }
  return ProcessLister::ProcessName(pid);
}
} // namespace ldb
