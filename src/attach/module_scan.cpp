/** LICENSE TEMPLATE */
#include "module_scan.h"
#include <cstring>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utils/logger.h>
#include <utils/util.h>

namespace ldb {

bool
IsLuaRuntimeModule(std::string_view modulePath) noexcept
{
  const auto slash = modulePath.find_last_of('/');
  const auto baseName = ToLower(slash == std::string_view::npos ? modulePath : modulePath.substr(slash + 1));
  // "lua" covers luajit and lua5x names as well.
  return baseName.contains("lua");
}

ModuleScanReport
ParseModuleMaps(Pid pid, std::string_view maps) noexcept
{
  ModuleScanReport report{ .mPid = pid };
  std::unordered_set<std::string_view> seen{};
  while (!maps.empty()) {
    const auto newline = maps.find('\n');
    const auto line = maps.substr(0, newline);
    maps.remove_prefix(newline == std::string_view::npos ? maps.size() : newline + 1);

    // address perms offset dev inode [pathname]
    const auto path = line.find('/');
    if (path == std::string_view::npos) {
      continue;
    }
    const auto modulePath = TrimWhitespace(line.substr(path));
    if (!seen.insert(modulePath).second) {
      continue;
    }
    ++report.mTotalModules;
    if (report.mModules.size() < kMaxReportedModules) {
      report.mModules.emplace_back(modulePath);
    }
    if (IsLuaRuntimeModule(modulePath)) {
      report.mLuaRuntimes.emplace_back(modulePath);
    }
  }
  return report;
}

std::expected<ModuleScanReport, std::string>
ScanModules(Pid pid, const Path &procRoot) noexcept
{
  const auto mapsPath = procRoot / std::to_string(pid) / "maps";
  std::ifstream maps{ mapsPath };
  if (!maps) {
    return std::unexpected(std::format("could not open {}: {}", mapsPath.string(), strerror(errno)));
  }
  std::stringstream contents;
  contents << maps.rdbuf();
  return ParseModuleMaps(pid, contents.str());
}

void
LogModuleScan(Pid pid, const Path &procRoot) noexcept
{
  auto report = ScanModules(pid, procRoot);
  if (!report) {
    DBGLOG(attach, "module scan of {} failed: {}", pid, report.error());
    return;
  }
  DBGLOG(attach,
    "module scan of {}: {} modules, lua runtime {}",
    pid,
    report->mTotalModules,
    report->HasLuaRuntime() ? "present" : "not found");
  for (const auto &runtime : report->mLuaRuntimes) {
    DBGLOG(attach, "  lua runtime: {}", runtime);
  }
  for (const auto &module : report->mModules) {
    DBGLOG(attach, "  module: {}", module);
  }
}
} // namespace ldb
