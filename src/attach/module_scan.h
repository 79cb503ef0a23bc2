/** LICENSE TEMPLATE */
#pragma once
#include <common.h>
#include <expected>
#include <string>
#include <vector>

namespace ldb {

static constexpr auto kMaxReportedModules = 50u;

struct ModuleScanReport
{
  Pid mPid;
  // Distinct mapped file paths in mapping order, capped at kMaxReportedModules.
  std::vector<std::string> mModules{};
  std::vector<std::string> mLuaRuntimes{};
  u32 mTotalModules{ 0 };

  bool
  HasLuaRuntime() const noexcept
  {
    return !mLuaRuntimes.empty();
  }
};

bool IsLuaRuntimeModule(std::string_view modulePath) noexcept;

// Parses the text of a /proc/<pid>/maps file.
ModuleScanReport ParseModuleMaps(Pid pid, std::string_view maps) noexcept;

std::expected<ModuleScanReport, std::string> ScanModules(Pid pid, const Path &procRoot = "/proc") noexcept;

void LogModuleScan(Pid pid, const Path &procRoot = "/proc") noexcept;
} // namespace ldb
