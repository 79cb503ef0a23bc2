/** LICENSE TEMPLATE */
#include "protocol_driver.h"
#include <utils/logger.h>

namespace ldb {

ProtocolDriver::ProtocolDriver(const SessionConfig &config) noexcept : mConfig(config) {}

void
ProtocolDriver::Bind(Transporter *transporter) noexcept
{
  mTransporter = transporter;
}

bool
ProtocolDriver::Post(WireMessage message) noexcept
{
  if (mTransporter == nullptr) {
    DBGLOG(session, "[{}] dropped {}: not connected", Name(), message.mCommand);
    return false;
  }
  return mTransporter->Send(message);
}

bool
ProtocolDriver::Request(WireMessage message, ReplyContinuation continuation) noexcept
{
  if (mTransporter == nullptr) {
    DBGLOG(session, "[{}] dropped request {}: not connected", Name(), message.mCommand);
    continuation(std::unexpected(ReplyError{ ReplyError::Kind::Disconnected, "not connected" }));
    return false;
  }
  return mTransporter->Send(std::move(message), std::move(continuation));
}

std::unique_ptr<ProtocolDriver>
CreateProtocolDriver(const SessionConfig &config, ScriptProvider &scripts) noexcept
{
  switch (config.mProtocol) {
  case ProtocolKind::EmmyAttach:
    return std::make_unique<EmmyDriver>(config, scripts);
  case ProtocolKind::LuaPandaClient:
  case ProtocolKind::LuaPandaServer:
    return std::make_unique<LuaPandaDriver>(config);
  }
  NEVER("Unknown protocol");
}
} // namespace ldb
