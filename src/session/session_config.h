/** LICENSE TEMPLATE */
#pragma once
#include <attach/attach_config.h>
#include <chrono>
#include <common.h>
#include <optional>
#include <string>
#include <vector>

namespace ldb {

#define FOR_EACH_PROTOCOL(PROTOCOL)                                                                               \
  PROTOCOL(EmmyAttach, "emmy-attach")                                                                             \
  PROTOCOL(LuaPandaClient, "luapanda-client")                                                                     \
  PROTOCOL(LuaPandaServer, "luapanda-server")

enum class ProtocolKind : u8
{
  FOR_EACH_PROTOCOL(DEFAULT_ENUM)
};

constexpr std::string_view
ProtocolCliName(ProtocolKind kind) noexcept
{
#define PROTOCOL_NAME(Kind, Name)                                                                                 \
  case ProtocolKind::Kind:                                                                                        \
    return Name;
  switch (kind) {
    FOR_EACH_PROTOCOL(PROTOCOL_NAME)
  }
#undef PROTOCOL_NAME
  LDB_UNREACHABLE
}

constexpr std::optional<ProtocolKind>
ProtocolFromCliName(std::string_view name) noexcept
{
#define PROTOCOL_FROM(Kind, Name)                                                                                 \
  if (name == Name) {                                                                                             \
    return ProtocolKind::Kind;                                                                                    \
  }
  FOR_EACH_PROTOCOL(PROTOCOL_FROM)
#undef PROTOCOL_FROM
  return std::nullopt;
}

struct SessionConfig
{
  ProtocolKind mProtocol{ ProtocolKind::EmmyAttach };
  // Line-JSON client dials mHost:mPort, the server listens on mPort.
  std::string mHost{ "localhost" };
  int mPort{ 8818 };
  AttachConfig mAttach{};
  std::chrono::milliseconds mDetachSettle{ 300 };
  std::chrono::milliseconds mStopAcknowledgeTimeout{ 3000 };

  // Emmy bootstrap
  Path mHelperScriptRoot{};
  std::optional<Path> mTypeRegistryScript{};
  std::vector<std::string> mFileExtensions{ "lua" };

  // LuaPanda init info
  bool mStopOnEntry{ false };
  bool mUseCHook{ true };
  int mLuaLogLevel{ 1 };
  std::string mWorkingDirectory{};
};
} // namespace ldb
