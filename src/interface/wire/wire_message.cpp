/** LICENSE TEMPLATE */
#include "wire_message.h"
// ldb
#include <utils/logger.h>
#include <utils/util.h>
// dependency
#include <fmt/format.h>

namespace ldb {
using namespace std::string_view_literals;

namespace {
std::string
DumpCompact(const Dict &dict) noexcept
{
  // Peer strings are not guaranteed to be UTF-8; never let serialization throw.
  return dict.dump(-1, ' ', false, Dict::error_handler_t::replace);
}

std::string
CorrelationIdFrom(const Dict &value) noexcept
{
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<i64>());
  }
  return {};
}

// Peers may send JSON with a trailing carriage return.
std::string_view
StripLineEnding(std::string_view line) noexcept
{
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
    line.remove_suffix(1);
  }
  return line;
}
} // namespace

/* static */ WireMessage
WireMessage::Make(WireCommand command, Dict payload) noexcept
{
  WireMessage message{};
  message.mCommand = command;
  message.mPayload = payload.is_null() ? Dict::object() : std::move(payload);
  return message;
}

// Emmy

std::string_view
EmmyCodec::Name() const noexcept
{
  return "emmy";
}

/* static */ std::optional<EmmyCodec::MessageId>
EmmyCodec::MessageIdFor(WireCommand command) noexcept
{
  using enum WireCommand;
  switch (command) {
  case Init:
    return MessageId::InitReq;
  case InitResponse:
    return MessageId::InitRsp;
  case Ready:
    return MessageId::ReadyReq;
  case ReadyResponse:
    return MessageId::ReadyRsp;
  case AddBreakpoint:
    return MessageId::AddBreakPointReq;
  case AddBreakpointResponse:
    return MessageId::AddBreakPointRsp;
  case RemoveBreakpoint:
    return MessageId::RemoveBreakPointReq;
  case RemoveBreakpointResponse:
    return MessageId::RemoveBreakPointRsp;
  case Break:
  case Continue:
  case StepOver:
  case StepIn:
  case StepOut:
  case Stop:
    return MessageId::ActionReq;
  case ActionResponse:
    return MessageId::ActionRsp;
  case Eval:
  case GetVariable:
    return MessageId::EvalReq;
  case EvalResult:
    return MessageId::EvalRsp;
  case BreakNotify:
    return MessageId::BreakNotify;
  case AttachedNotify:
    return MessageId::AttachedNotify;
  case StartHook:
    return MessageId::StartHookReq;
  case StartHookResponse:
    return MessageId::StartHookRsp;
  case Log:
    return MessageId::LogNotify;
  case Unknown:
  case SetVariable:
    return std::nullopt;
  }
  return std::nullopt;
}

/* static */ std::optional<EmmyCodec::DebugAction>
EmmyCodec::ActionFor(WireCommand command) noexcept
{
  switch (command) {
  case WireCommand::Break:
    return DebugAction::Break;
  case WireCommand::Continue:
    return DebugAction::Continue;
  case WireCommand::StepOver:
    return DebugAction::StepOver;
  case WireCommand::StepIn:
    return DebugAction::StepIn;
  case WireCommand::StepOut:
    return DebugAction::StepOut;
  case WireCommand::Stop:
    return DebugAction::Stop;
  default:
    return std::nullopt;
  }
}

/* static */ WireCommand
EmmyCodec::CommandFor(MessageId id) noexcept
{
  switch (id) {
  case MessageId::InitReq:
    return WireCommand::Init;
  case MessageId::InitRsp:
    return WireCommand::InitResponse;
  case MessageId::ReadyReq:
    return WireCommand::Ready;
  case MessageId::ReadyRsp:
    return WireCommand::ReadyResponse;
  case MessageId::AddBreakPointReq:
    return WireCommand::AddBreakpoint;
  case MessageId::AddBreakPointRsp:
    return WireCommand::AddBreakpointResponse;
  case MessageId::RemoveBreakPointReq:
    return WireCommand::RemoveBreakpoint;
  case MessageId::RemoveBreakPointRsp:
    return WireCommand::RemoveBreakpointResponse;
  case MessageId::ActionReq:
    // Refined from the "action" field by Decode.
    return WireCommand::Continue;
  case MessageId::ActionRsp:
    return WireCommand::ActionResponse;
  case MessageId::EvalReq:
    return WireCommand::Eval;
  case MessageId::EvalRsp:
    return WireCommand::EvalResult;
  case MessageId::BreakNotify:
    return WireCommand::BreakNotify;
  case MessageId::AttachedNotify:
    return WireCommand::AttachedNotify;
  case MessageId::StartHookReq:
    return WireCommand::StartHook;
  case MessageId::StartHookRsp:
    return WireCommand::StartHookResponse;
  case MessageId::LogNotify:
    return WireCommand::Log;
  case MessageId::Unknown:
    return WireCommand::Unknown;
  }
  return WireCommand::Unknown;
}

std::string
EmmyCodec::Encode(const WireMessage &message) const noexcept
{
  const auto id = MessageIdFor(message.mCommand);
  i32 numericId = 0;
  if (id) {
    numericId = std::to_underlying(*id);
  } else if (auto raw = ParseInteger<i32>(message.mProtocolCommand); raw) {
    numericId = *raw;
  }

  Dict body = message.mPayload.is_object() ? message.mPayload : Dict::object();
  body["cmd"] = numericId;
  if (const auto action = ActionFor(message.mCommand); action) {
    body["action"] = std::to_underlying(*action);
  }
  // Emmy correlates evaluations through "seq".
  if (message.ExpectsReply()) {
    if (auto seq = ParseInteger<i64>(message.mCorrelationId); seq) {
      body["seq"] = *seq;
    } else {
      body["seq"] = message.mCorrelationId;
    }
  }
  return fmt::format("{}\n{}\n", numericId, DumpCompact(body));
}

size_t
EmmyCodec::ExtractRecords(std::string_view buffer, std::vector<std::string_view> &records) const noexcept
{
  size_t consumed = 0;
  while (consumed < buffer.size()) {
    const auto rest = buffer.substr(consumed);
    const auto headerEnd = rest.find('\n');
    if (headerEnd == rest.npos) {
      break;
    }
    // Tolerate blank lines between records.
    if (StripLineEnding(rest.substr(0, headerEnd + 1)).empty()) {
      consumed += headerEnd + 1;
      continue;
    }
    const auto bodyEnd = rest.find('\n', headerEnd + 1);
    if (bodyEnd == rest.npos) {
      break;
    }
    records.push_back(rest.substr(0, bodyEnd));
    consumed += bodyEnd + 1;
  }
  return consumed;
}

std::expected<WireMessage, ProtocolParseError>
EmmyCodec::Decode(std::string_view record) const noexcept
{
  const auto headerEnd = record.find('\n');
  if (headerEnd == record.npos) {
    return std::unexpected(ProtocolParseError{ std::string{ record }, "missing message id line" });
  }
  const auto header = TrimWhitespace(record.substr(0, headerEnd));
  const auto body = StripLineEnding(record.substr(headerEnd + 1));

  const auto numericId = ParseInteger<i32>(header);
  if (!numericId) {
    return std::unexpected(
      ProtocolParseError{ std::string{ record }, std::format("message id '{}' is not a number", header) });
  }

  Dict parsed;
  try {
    parsed = Dict::parse(body);
  } catch (const Dict::parse_error &e) {
    return std::unexpected(ProtocolParseError{ std::string{ record }, e.what() });
  }
  if (!parsed.is_object()) {
    return std::unexpected(ProtocolParseError{ std::string{ record }, "message body is not a JSON object" });
  }

  WireMessage message{};
  message.mProtocolCommand = std::to_string(*numericId);
  const auto id = *numericId >= 0 && *numericId <= std::to_underlying(MessageId::LogNotify)
                    ? static_cast<MessageId>(*numericId)
                    : MessageId::Unknown;
  message.mCommand = CommandFor(id);
  if (id == MessageId::ActionReq) {
    const auto action = parsed.contains("action") && parsed["action"].is_number_integer()
                          ? parsed["action"].get<i32>()
                          : std::to_underlying(DebugAction::Continue);
    switch (static_cast<DebugAction>(action)) {
    case DebugAction::Break:
      message.mCommand = WireCommand::Break;
      break;
    case DebugAction::Continue:
      message.mCommand = WireCommand::Continue;
      break;
    case DebugAction::StepOver:
      message.mCommand = WireCommand::StepOver;
      break;
    case DebugAction::StepIn:
      message.mCommand = WireCommand::StepIn;
      break;
    case DebugAction::StepOut:
      message.mCommand = WireCommand::StepOut;
      break;
    case DebugAction::Stop:
      message.mCommand = WireCommand::Stop;
      break;
    default:
      return std::unexpected(
        ProtocolParseError{ std::string{ record }, std::format("unknown debug action {}", action) });
    }
  }

  if (parsed.contains("cmd") && parsed["cmd"].is_number_integer() && parsed["cmd"].get<i32>() != *numericId) {
    DBGLOG(warning, "emmy record header id {} disagrees with body cmd {}", *numericId, parsed["cmd"].dump());
  }
  if (parsed.contains("seq")) {
    message.mCorrelationId = CorrelationIdFrom(parsed["seq"]);
  }
  parsed.erase("cmd");
  message.mPayload = std::move(parsed);
  return message;
}

// LuaPanda

std::string_view
LineJsonCodec::Name() const noexcept
{
  return "line-json";
}

/* static */ std::string_view
LineJsonCodec::CommandName(WireCommand command) noexcept
{
  using enum WireCommand;
  switch (command) {
  case Init:
  case InitResponse:
    return "initSuccess";
  case AddBreakpoint:
  case RemoveBreakpoint:
    return "setBreakPoint";
  case Break:
  case BreakNotify:
    return "stopOnBreakpoint";
  case Continue:
    return "continue";
  case StepOver:
    return "stopOnStep";
  case StepIn:
    return "stopOnStepIn";
  case StepOut:
    return "stopOnStepOut";
  case Stop:
    return "stopRun";
  case Log:
    return "output";
  case GetVariable:
    return "getVariable";
  case SetVariable:
    return "setVariable";
  case Eval:
  case EvalResult:
    return "getWatchedVariable";
  default:
    return {};
  }
}

/* static */ WireCommand
LineJsonCodec::CommandFromName(std::string_view name) noexcept
{
  using enum WireCommand;
  if (name == "initSuccess") {
    return Init;
  }
  if (name == "setBreakPoint") {
    return AddBreakpoint;
  }
  // The debuggee reports every kind of stop with the command that caused it.
  if (name == "stopOnBreakpoint" || name == "stopOnEntry" || name == "stopOnStep" || name == "stopOnStepIn" ||
      name == "stopOnStepOut") {
    return BreakNotify;
  }
  if (name == "continue") {
    return Continue;
  }
  if (name == "stopRun") {
    return Stop;
  }
  if (name == "output") {
    return Log;
  }
  if (name == "getVariable") {
    return GetVariable;
  }
  if (name == "setVariable") {
    return SetVariable;
  }
  if (name == "getWatchedVariable") {
    return Eval;
  }
  return Unknown;
}

std::string
LineJsonCodec::Encode(const WireMessage &message) const noexcept
{
  auto name = CommandName(message.mCommand);
  if (name.empty()) {
    name = message.mProtocolCommand;
  }
  Dict record = message.mEnvelope.is_object() ? message.mEnvelope : Dict::object();
  record["cmd"] = name;
  record["info"] = message.mPayload.is_null() ? Dict::object() : message.mPayload;
  record["callbackId"] = message.ExpectsReply() ? message.mCorrelationId : std::string{ kNoCallback };
  return fmt::format("{}{}\n", DumpCompact(record), kDelimiter);
}

size_t
LineJsonCodec::ExtractRecords(std::string_view buffer, std::vector<std::string_view> &records) const noexcept
{
  size_t consumed = 0;
  while (consumed < buffer.size()) {
    const auto rest = buffer.substr(consumed);
    const auto lineEnd = rest.find('\n');
    if (lineEnd == rest.npos) {
      break;
    }
    auto line = StripLineEnding(rest.substr(0, lineEnd));
    if (line.ends_with(kDelimiter)) {
      line.remove_suffix(kDelimiter.size());
    }
    if (!TrimWhitespace(line).empty()) {
      records.push_back(line);
    }
    consumed += lineEnd + 1;
  }
  return consumed;
}

std::expected<WireMessage, ProtocolParseError>
LineJsonCodec::Decode(std::string_view record) const noexcept
{
  auto body = StripLineEnding(record);
  if (body.ends_with(kDelimiter)) {
    body.remove_suffix(kDelimiter.size());
  }

  Dict parsed;
  try {
    parsed = Dict::parse(body);
  } catch (const Dict::parse_error &e) {
    return std::unexpected(ProtocolParseError{ std::string{ record }, e.what() });
  }
  if (!parsed.is_object()) {
    return std::unexpected(ProtocolParseError{ std::string{ record }, "record is not a JSON object" });
  }
  if (!parsed.contains("cmd") || !parsed["cmd"].is_string()) {
    return std::unexpected(ProtocolParseError{ std::string{ record }, "record has no string 'cmd' field" });
  }

  WireMessage message{};
  message.mProtocolCommand = parsed["cmd"].get<std::string>();
  message.mCommand = CommandFromName(message.mProtocolCommand);
  if (parsed.contains("info") && (parsed["info"].is_object() || parsed["info"].is_array())) {
    message.mPayload = std::move(parsed["info"]);
  }
  if (parsed.contains("callbackId")) {
    message.mCorrelationId = CorrelationIdFrom(parsed["callbackId"]);
  }
  parsed.erase("cmd");
  parsed.erase("info");
  parsed.erase("callbackId");
  message.mEnvelope = std::move(parsed);
  return message;
}

std::unique_ptr<WireCodec>
CreateEmmyCodec() noexcept
{
  return std::make_unique<EmmyCodec>();
}

std::unique_ptr<WireCodec>
CreateLineJsonCodec() noexcept
{
  return std::make_unique<LineJsonCodec>();
}
} // namespace ldb
