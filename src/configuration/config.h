/** LICENSE TEMPLATE */
#pragma once

// ldb
#include <common.h>
#include <configuration/command_line.h>
#include <session/session_config.h>
#include <utils/log_channel.h>
// std
#include <filesystem>
#include <string>
#include <vector>

namespace ldb::cfg {

class InitializationConfiguration
{
  // Construction only allowed via `ConfigureWithParser`
  InitializationConfiguration() noexcept = default;

public:
  u32 mThreadPoolSize;
  std::filesystem::path mLogDirectory;
  std::vector<Channel> mLogChannels;

  ProtocolKind mProtocol;
  Pid mPid;
  Arch mArch;
  std::filesystem::path mToolDirectory;
  std::string mHost;
  i32 mPort;
  u32 mAttachRetries;
  u32 mAttachRetryDelayMs;
  u32 mAttachSettleMs;
  u32 mDetachSettleMs;
  bool mCaptureLog;
  std::filesystem::path mHelperScriptRoot;
  std::filesystem::path mTypeRegistryScript;
  bool mStopOnEntry;
  bool mUseCHook;
  i32 mLuaLogLevel;
  std::string mWorkingDirectory;

  SessionConfig BuildSessionConfig() const noexcept;

  static InitializationConfiguration *ConfigureWithParser(CommandLineRegistry &parser) noexcept;
};
} // namespace ldb::cfg
