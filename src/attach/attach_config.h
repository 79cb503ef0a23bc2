/** LICENSE TEMPLATE */
#pragma once
#include <chrono>
#include <optional>
#include <common.h>
#include <common/typedefs.h>
#include <string>
#include <vector>

namespace ldb {

enum class Arch : u8
{
  X86,
  X64
};

constexpr std::string_view
ArchDirectoryName(Arch arch) noexcept
{
  switch (arch) {
  case Arch::X86:
    return "x86";
  case Arch::X64:
    return "x64";
  }
  LDB_UNREACHABLE
}

// The injected listener binds every loopback interface the target supports; try them in this order.
inline const std::vector<std::string> kLoopbackHosts{ "127.0.0.1", "::1", "localhost" };

struct AttachConfig
{
  Pid mPid{ 0 };
  Arch mArch{ Arch::X64 };
  Path mToolDirectory{};
  bool mCaptureLog{ false };
  u32 mRetryCount{ 15 };
  std::chrono::milliseconds mRetryDelay{ 2000 };
  // Time given to the injected library to open its listener before the first connect.
  std::chrono::milliseconds mSettleDelay{ 100 };
  // Granularity at which waits observe cancellation.
  std::chrono::milliseconds mWaitSlice{ 100 };
  bool mProbePort{ true };
  std::vector<std::string> mHosts{ kLoopbackHosts };
  // Overrides the port derived from the pid. Tests use it to reach a local listener.
  std::optional<int> mPortOverride{};
};
} // namespace ldb
