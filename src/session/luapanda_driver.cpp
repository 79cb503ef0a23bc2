/** LICENSE TEMPLATE */
#include "protocol_driver.h"
#include <algorithm>
#include <filesystem>
#include <utils/logger.h>

namespace ldb {

namespace {
std::string
BoolString(bool value) noexcept
{
  return value ? "true" : "false";
}

std::string
InfoString(const Dict &info, const char *key, std::string_view fallback) noexcept
{
  if (!info.is_object() || !info.contains(key)) {
    return std::string{ fallback };
  }
  const auto &value = info[key];
  return value.is_string() ? value.get<std::string>() : value.dump();
}

std::expected<Dict, std::string>
ReplyInfo(ReplyResult &result) noexcept
{
  if (!result) {
    return std::unexpected(result.error().mMessage.empty() ? std::string{ "request failed" } : result.error().mMessage);
  }
  return std::move(result->mPayload);
}
} // namespace

LuaPandaDriver::LuaPandaDriver(const SessionConfig &config) noexcept : ProtocolDriver(config) {}

std::string_view
LuaPandaDriver::Name() const noexcept
{
  return "luapanda";
}

Dict
LuaPandaDriver::InitInfo() const noexcept
{
  const auto cwd =
    mConfig.mWorkingDirectory.empty() ? std::filesystem::current_path().string() : mConfig.mWorkingDirectory;
  const auto clibPath =
    mConfig.mHelperScriptRoot.empty() ? std::string{} : (mConfig.mHelperScriptRoot / "debugger" / "luapanda").string() + "/";
  const auto extension = mConfig.mFileExtensions.empty() ? std::string{ "lua" } : mConfig.mFileExtensions.front();
  return Dict{ { "stopOnEntry", BoolString(mConfig.mStopOnEntry) },
               { "useCHook", BoolString(mConfig.mUseCHook) },
               { "logLevel", std::to_string(mConfig.mLuaLogLevel) },
               { "luaFileExtension", extension },
               { "cwd", cwd },
               { "isNeedB64EncodeStr", "false" },
               { "TempFilePath", cwd },
               { "pathCaseSensitivity", "true" },
               { "osType", "Linux" },
               { "clibPath", clibPath },
               { "adapterVersion", "1.0.0" },
               { "autoPathMode", "false" },
               { "distinguishSameNameFile", "false" },
               { "truncatedOPath", "" },
               { "developmentMode", "false" } };
}

AcknowledgeMode
LuaPandaDriver::SendInit(ReplyContinuation onAcknowledged) noexcept
{
  auto sent = Request(WireMessage::Make(WireCommand::Init, InitInfo()),
    [onAcknowledged = std::move(onAcknowledged)](ReplyResult result) {
      if (result) {
        const auto &info = result->mPayload;
        DBGLOG(session,
          "[luapanda] initialized: UseHookLib={}, UseLoadstring={}, isNeedB64EncodeStr={}",
          InfoString(info, "UseHookLib", "0"),
          InfoString(info, "UseLoadstring", "0"),
          InfoString(info, "isNeedB64EncodeStr", "false"));
      }
      onAcknowledged(std::move(result));
    });
  if (!sent) {
    DBGLOG(session, "[luapanda] initSuccess could not be sent");
  }
  return AcknowledgeMode::AwaitReply;
}

void
LuaPandaDriver::SendReady() noexcept
{
  // Breakpoints sent after initSuccess are all the peer waits for.
}

bool
LuaPandaDriver::SendRunControl(RunControl action) noexcept
{
  // Run control is fire and forget: the peer answers a step with a stop notification, which has to reach the
  // general handler rather than a continuation.
  switch (action) {
  case RunControl::Continue:
    return Post(WireMessage::Make(WireCommand::Continue));
  case RunControl::StepOver:
    return Post(WireMessage::Make(WireCommand::StepOver));
  case RunControl::StepIn:
    return Post(WireMessage::Make(WireCommand::StepIn));
  case RunControl::StepOut:
    return Post(WireMessage::Make(WireCommand::StepOut));
  case RunControl::Pause:
    return Post(WireMessage::Make(WireCommand::Break));
  }
  return false;
}

bool
LuaPandaDriver::RunToPosition(const BreakpointDescriptor &target, std::span<const BreakpointDescriptor> sameFile) noexcept
{
  std::vector<BreakpointDescriptor> breakpoints{ sameFile.begin(), sameFile.end() };
  if (std::ranges::find(breakpoints, target) == breakpoints.end()) {
    breakpoints.push_back(target);
  }
  Post(WireMessage::Make(WireCommand::AddBreakpoint, BreakpointsToWire(target.mFilePath, breakpoints)));
  return SendRunControl(RunControl::Continue);
}

bool
LuaPandaDriver::Evaluate(std::string expression, const StackFrameSnapshot &frame, EvaluationCallback callback) noexcept
{
  Dict info{ { "varName", std::move(expression) }, { "stackId", std::to_string(frame.mIndex) } };
  return Request(WireMessage::Make(WireCommand::Eval, std::move(info)),
    [callback = std::move(callback)](ReplyResult result) {
      auto info = ReplyInfo(result);
      if (!info) {
        callback(std::unexpected(std::move(info).error()));
        return;
      }
      if (info->is_array()) {
        if (info->empty() || !info->front().is_object()) {
          callback(std::unexpected(std::string{ "evaluation returned no value" }));
          return;
        }
        callback(Variable::FromLuaPanda(info->front()));
        return;
      }
      callback(Variable::FromLuaPanda(*info));
    });
}

bool
LuaPandaDriver::FetchChildren(
  const Variable &variable, const StackFrameSnapshot &frame, ChildrenCallback callback) noexcept
{
  Dict info{ { "varRef", std::to_string(variable.mChildRef) }, { "stackId", std::to_string(frame.mIndex) } };
  return Request(WireMessage::Make(WireCommand::GetVariable, std::move(info)),
    [callback = std::move(callback)](ReplyResult result) {
      auto info = ReplyInfo(result);
      if (!info) {
        callback(std::unexpected(std::move(info).error()));
        return;
      }
      const Dict *list = &*info;
      if (info->is_object() && info->contains("variables")) {
        list = &(*info)["variables"];
      }
      std::vector<Variable> children{};
      if (list->is_array()) {
        for (const auto &child : *list) {
          if (child.is_object()) {
            children.push_back(Variable::FromLuaPanda(child));
          }
        }
      }
      callback(std::move(children));
    });
}

AcknowledgeMode
LuaPandaDriver::SendStop(ReplyContinuation onAcknowledged) noexcept
{
  if (!Request(WireMessage::Make(WireCommand::Stop), std::move(onAcknowledged))) {
    DBGLOG(session, "[luapanda] stopRun could not be sent");
  }
  return AcknowledgeMode::AwaitReply;
}

ProtocolEvent
LuaPandaDriver::Interpret(const WireMessage &message) noexcept
{
  switch (message.mCommand) {
  case WireCommand::BreakNotify:
    return BreakEvent{ .mFrames = ParseLuaPandaStacks(message), .mReason = message.mProtocolCommand };
  case WireCommand::Log:
    return LogEvent{ .mSeverity = LogSeverity::Info, .mText = InfoString(message.mPayload, "content", "") };
  case WireCommand::Stop:
    return PeerStopEvent{};
  default:
    DBGLOG(session, "[luapanda] ignoring {}", message.mProtocolCommand);
    return IgnoredEvent{};
  }
}

/* static */
Dict
LuaPandaDriver::BreakpointsToWire(std::string_view path, std::span<const BreakpointDescriptor> breakpoints) noexcept
{
  Dict bks = Dict::array();
  for (const auto &bp : breakpoints) {
    Dict entry{ { "line", bp.mLine } };
    if (bp.mCondition) {
      entry["condition"] = *bp.mCondition;
    }
    if (bp.mLogMessage) {
      entry["logMessage"] = *bp.mLogMessage;
    }
    bks.push_back(std::move(entry));
  }
  return Dict{ { "path", std::string{ path } }, { "bks", std::move(bks) } };
}

void
LuaPandaDriver::SendAddBreakpoint(const BreakpointDescriptor &added, std::span<const BreakpointDescriptor> sameFile) noexcept
{
  Post(WireMessage::Make(WireCommand::AddBreakpoint, BreakpointsToWire(added.mFilePath, sameFile)));
}

void
LuaPandaDriver::SendRemoveBreakpoint(
  const BreakpointDescriptor &removed, std::span<const BreakpointDescriptor> sameFile) noexcept
{
  // setBreakPoint replaces the file's set; an empty list clears it.
  Post(WireMessage::Make(WireCommand::RemoveBreakpoint, BreakpointsToWire(removed.mFilePath, sameFile)));
}
} // namespace ldb
