/** LICENSE TEMPLATE */
#include "helper_tool.h"
#include <filesystem>
#include <utils/logger.h>
#include <utils/util.h>

namespace ldb {

HelperTool::HelperTool(Path toolRoot, ProcessLauncher &launcher) noexcept
    : mToolRoot(std::move(toolRoot)), mLauncher(launcher)
{
}

Path
HelperTool::ArchDirectory(Arch arch) const noexcept
{
  return mToolRoot / ArchDirectoryName(arch);
}

Path
HelperTool::ToolPath(Arch arch) const noexcept
{
  return ArchDirectory(arch) / kToolName;
}

Path
HelperTool::LibraryPath(Arch arch) const noexcept
{
  return ArchDirectory(arch) / kHookLibrary;
}

std::optional<std::string>
HelperTool::Validate() const noexcept
{
  std::error_code ec;
  std::vector<Path> missingTools{};
  std::vector<Path> missingLibraries{};
  for (auto arch : { Arch::X86, Arch::X64 }) {
    if (!std::filesystem::is_regular_file(ToolPath(arch), ec)) {
      missingTools.push_back(ToolPath(arch));
    }
    if (!std::filesystem::is_regular_file(LibraryPath(arch), ec)) {
      missingLibraries.push_back(LibraryPath(arch));
    }
  }

  auto describe = [](std::string_view what, const std::vector<Path> &files) {
    std::string reason{ what };
    for (const auto &file : files) {
      reason.append(" ");
      reason.append(file.string());
    }
    return reason;
  };

  if (missingTools.size() == 2) {
    return describe("Helper tool not found. Missing:", missingTools);
  }
  if (missingLibraries.size() == 2) {
    return describe("Injection library not found. Missing:", missingLibraries);
  }
  return std::nullopt;
}

Arch
HelperTool::DetectArch(Pid pid) noexcept
{
  // Prefer the 64-bit build to run the query; either build can answer it.
  auto arch = std::filesystem::exists(ToolPath(Arch::X64)) ? Arch::X64 : Arch::X86;
  LaunchRequest request{ .mProgram = ToolPath(arch),
                         .mArguments = { "arch_pid", std::to_string(pid) },
                         .mWorkingDirectory = ArchDirectory(arch) };
  auto result = mLauncher.Run(request);
  if (!result) {
    DBGLOG(attach, "arch_pid {} could not run: {}; assuming x86", pid, result.error().Describe());
    return Arch::X86;
  }
  DBGLOG(attach, "arch_pid {} exited with {}", pid, result->mExitCode);
  return result->mExitCode == 0 ? Arch::X64 : Arch::X86;
}

/* static */
std::vector<std::string>
HelperTool::AttachArguments(Pid pid, const Path &archDirectory, bool captureLog) noexcept
{
  std::vector<std::string> args{ "attach",
                                 "-p",
                                 std::to_string(pid),
                                 "-dir",
                                 archDirectory.string(),
                                 "-dll",
                                 std::string{ kHookLibrary } };
  if (captureLog) {
    args.push_back("-capture-log");
  }
  return args;
}

std::expected<ProcessOutput, SpawnError>
HelperTool::Attach(Pid pid, Arch arch, bool captureLog) noexcept
{
  LaunchRequest request{ .mProgram = ToolPath(arch),
                         .mArguments = AttachArguments(pid, ArchDirectory(arch), captureLog),
                         .mWorkingDirectory = ArchDirectory(arch) };
  auto result = mLauncher.Run(request);
  if (result) {
    DBGLOG(attach, "attach stdout:\n{}", result->mStdout);
    DBGLOG(attach, "attach stderr:\n{}", result->mStderr);
  }
  return result;
}

std::expected<std::vector<ProcessInfo>, SpawnError>
HelperTool::ListProcesses(Arch arch) noexcept
{
  LaunchRequest request{
    .mProgram = ToolPath(arch), .mArguments = { "list_processes" }, .mWorkingDirectory = ArchDirectory(arch)
  };
  auto result = mLauncher.Run(request);
  if (!result) {
    return std::unexpected(result.error());
  }
  return ParseProcessList(result->mStdout);
}

/* static */
std::vector<ProcessInfo>
HelperTool::ParseProcessList(std::string_view output) noexcept
{
  std::vector<std::string_view> lines{};
  while (!output.empty()) {
    const auto newline = output.find('\n');
    auto line = output.substr(0, newline);
    if (line.ends_with('\r')) {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    if (newline == std::string_view::npos) {
      break;
    }
    output.remove_prefix(newline + 1);
  }

  std::vector<ProcessInfo> processes{};
  // Records are pid, title, path and a separator line.
  for (size_t i = 0; i + 2 < lines.size(); i += 4) {
    auto pid = StrToPid(TrimWhitespace(lines[i]));
    if (!pid) {
      DBGLOG(attach, "skipping process record with bad pid '{}'", lines[i]);
      continue;
    }
    processes.push_back(
      ProcessInfo{ .mPid = *pid, .mTitle = std::string{ lines[i + 1] }, .mPath = Path{ lines[i + 2] } });
  }
  return processes;
}
} // namespace ldb
