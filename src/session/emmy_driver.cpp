/** LICENSE TEMPLATE */
#include "protocol_driver.h"
#include <utils/logger.h>

namespace ldb {

namespace {
std::optional<WireCommand>
ActionCommand(RunControl action) noexcept
{
  switch (action) {
  case RunControl::Continue:
    return WireCommand::Continue;
  case RunControl::StepOver:
    return WireCommand::StepOver;
  case RunControl::StepIn:
    return WireCommand::StepIn;
  case RunControl::StepOut:
    return WireCommand::StepOut;
  case RunControl::Pause:
    return WireCommand::Break;
  }
  return std::nullopt;
}

LogSeverity
SeverityFromEmmy(i64 type) noexcept
{
  switch (type) {
  case 0:
    return LogSeverity::Debug;
  case 2:
    return LogSeverity::Warning;
  case 3:
    return LogSeverity::Error;
  default:
    return LogSeverity::Info;
  }
}

std::string
ReplyErrorText(const ReplyError &error) noexcept
{
  return error.mMessage.empty() ? std::string{ "request failed" } : error.mMessage;
}

// EvalRsp {seq, success, error, value}
std::expected<Dict, std::string>
EvaluationValue(ReplyResult &result) noexcept
{
  if (!result) {
    return std::unexpected(ReplyErrorText(result.error()));
  }
  const auto &payload = result->mPayload;
  const auto success = payload.contains("success") && payload["success"].is_boolean() && payload["success"].get<bool>();
  if (!success) {
    const auto error = payload.contains("error") && payload["error"].is_string()
                         ? payload["error"].get<std::string>()
                         : std::string{ "evaluation failed" };
    return std::unexpected(error);
  }
  if (!payload.contains("value") || !payload["value"].is_object()) {
    return std::unexpected(std::string{ "evaluation returned no value" });
  }
  return payload["value"];
}
} // namespace

EmmyDriver::EmmyDriver(const SessionConfig &config, ScriptProvider &scripts) noexcept
    : ProtocolDriver(config), mScripts(scripts)
{
}

std::string_view
EmmyDriver::Name() const noexcept
{
  return "emmy";
}

AcknowledgeMode
EmmyDriver::SendInit(ReplyContinuation) noexcept
{
  auto helper = BuildEmmyHelperScript(mScripts, mConfig.mTypeRegistryScript);
  if (!helper) {
    DBGLOG(session, "[emmy] no helper script; skipping InitReq");
    return AcknowledgeMode::None;
  }
  Post(WireMessage::Make(WireCommand::Init, Dict{ { "emmyHelper", *helper }, { "ext", mConfig.mFileExtensions } }));
  return AcknowledgeMode::None;
}

void
EmmyDriver::SendReady() noexcept
{
  Post(WireMessage::Make(WireCommand::Ready));
}

bool
EmmyDriver::SendRunControl(RunControl action) noexcept
{
  const auto command = ActionCommand(action);
  if (!command) {
    return false;
  }
  return Post(WireMessage::Make(*command));
}

bool
EmmyDriver::RunToPosition(const BreakpointDescriptor &target, std::span<const BreakpointDescriptor>) noexcept
{
  Post(WireMessage::Make(WireCommand::AddBreakpoint, Dict{ { "breakPoints", Dict::array({ BreakpointToWire(target) }) } }));
  return SendRunControl(RunControl::Continue);
}

bool
EmmyDriver::Evaluate(std::string expression, const StackFrameSnapshot &frame, EvaluationCallback callback) noexcept
{
  Dict payload{ { "expr", std::move(expression) }, { "stackLevel", frame.mIndex }, { "depth", 1 }, { "cacheId", 0 } };
  return Request(WireMessage::Make(WireCommand::Eval, std::move(payload)),
    [callback = std::move(callback)](ReplyResult result) {
      auto value = EvaluationValue(result);
      if (!value) {
        callback(std::unexpected(std::move(value).error()));
        return;
      }
      callback(Variable::FromEmmy(*value));
    });
}

bool
EmmyDriver::FetchChildren(const Variable &variable, const StackFrameSnapshot &frame, ChildrenCallback callback) noexcept
{
  Dict payload{
    { "expr", variable.mName }, { "stackLevel", frame.mIndex }, { "depth", 1 }, { "cacheId", variable.mChildRef }
  };
  return Request(WireMessage::Make(WireCommand::Eval, std::move(payload)),
    [callback = std::move(callback)](ReplyResult result) {
      auto value = EvaluationValue(result);
      if (!value) {
        callback(std::unexpected(std::move(value).error()));
        return;
      }
      callback(Variable::FromEmmy(*value).mChildren);
    });
}

AcknowledgeMode
EmmyDriver::SendStop(ReplyContinuation) noexcept
{
  Post(WireMessage::Make(WireCommand::Stop));
  return AcknowledgeMode::None;
}

ProtocolEvent
EmmyDriver::Interpret(const WireMessage &message) noexcept
{
  const auto &payload = message.mPayload;
  switch (message.mCommand) {
  case WireCommand::BreakNotify:
    return BreakEvent{ .mFrames = ParseEmmyStacks(payload), .mReason = "BreakNotify" };
  case WireCommand::Log: {
    const auto type = payload.contains("type") && payload["type"].is_number_integer() ? payload["type"].get<i64>() : 1;
    auto text = payload.contains("message") && payload["message"].is_string() ? payload["message"].get<std::string>()
                                                                              : payload.dump();
    return LogEvent{ .mSeverity = SeverityFromEmmy(type), .mText = std::move(text) };
  }
  case WireCommand::AttachedNotify: {
    if (payload.contains("state") && payload["state"].is_number_integer()) {
      return LogEvent{ .mSeverity = LogSeverity::Info,
                       .mText = std::format("Attached to Lua state 0x{:x}", payload["state"].get<u64>()) };
    }
    return LogEvent{ .mSeverity = LogSeverity::Info, .mText = "Attached to Lua state" };
  }
  default:
    DBGLOG(session, "[emmy] ignoring {} ({})", message.mCommand, message.mProtocolCommand);
    return IgnoredEvent{};
  }
}

/* static */
Dict
EmmyDriver::BreakpointToWire(const BreakpointDescriptor &descriptor) noexcept
{
  Dict bp{ { "file", descriptor.mFilePath }, { "line", descriptor.mLine } };
  if (descriptor.mCondition) {
    bp["condition"] = *descriptor.mCondition;
  }
  if (descriptor.mLogMessage) {
    bp["logMessage"] = *descriptor.mLogMessage;
  }
  return bp;
}

void
EmmyDriver::SendAddBreakpoint(const BreakpointDescriptor &added, std::span<const BreakpointDescriptor>) noexcept
{
  Post(WireMessage::Make(WireCommand::AddBreakpoint, Dict{ { "breakPoints", Dict::array({ BreakpointToWire(added) }) } }));
}

void
EmmyDriver::SendRemoveBreakpoint(const BreakpointDescriptor &removed, std::span<const BreakpointDescriptor>) noexcept
{
  Dict bp{ { "file", removed.mFilePath }, { "line", removed.mLine } };
  Post(WireMessage::Make(WireCommand::RemoveBreakpoint, Dict{ { "breakPoints", Dict::array({ std::move(bp) }) } }));
}
} // namespace ldb
