/** LICENSE TEMPLATE */
#pragma once
#include "attach_config.h"
#include "process_launcher.h"
#include <optional>

namespace ldb {

struct ProcessInfo
{
  Pid mPid;
  std::string mTitle;
  Path mPath;
};

/// Wrapper around the external injection executable. The executable itself is opaque to us; only its
/// command line contract is relied upon.
class HelperTool
{
  Path mToolRoot;
  ProcessLauncher &mLauncher;

public:
  static constexpr std::string_view kToolName = "emmy_tool";
  static constexpr std::string_view kHookLibrary = "emmy_hook.so";

  HelperTool(Path toolRoot, ProcessLauncher &launcher) noexcept;

  Path ArchDirectory(Arch arch) const noexcept;
  Path ToolPath(Arch arch) const noexcept;
  Path LibraryPath(Arch arch) const noexcept;

  // Returns a description of what is missing, or nothing when some architecture can run an attach.
  std::optional<std::string> Validate() const noexcept;

  // x64 if the tool reports success, x86 on any failure.
  Arch DetectArch(Pid pid) noexcept;
  std::expected<ProcessOutput, SpawnError> Attach(Pid pid, Arch arch, bool captureLog) noexcept;
  std::expected<std::vector<ProcessInfo>, SpawnError> ListProcesses(Arch arch) noexcept;

  static std::vector<std::string> AttachArguments(Pid pid, const Path &archDirectory, bool captureLog) noexcept;
  static std::vector<ProcessInfo> ParseProcessList(std::string_view output) noexcept;
};
} // namespace ldb
