/** LICENSE TEMPLATE */
#pragma once
// ldb
#include <common.h>
#include <common/macros.h>
#include <common/typedefs.h>
// dependency
#include <nlohmann/json.hpp>
// std
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ldb {
using Dict = nlohmann::json;

#define FOR_EACH_WIRE_COMMAND(CMD)                                                                                \
  CMD(Unknown)                                                                                                    \
  CMD(Init)                                                                                                       \
  CMD(InitResponse)                                                                                               \
  CMD(Ready)                                                                                                      \
  CMD(ReadyResponse)                                                                                              \
  CMD(AddBreakpoint)                                                                                              \
  CMD(AddBreakpointResponse)                                                                                      \
  CMD(RemoveBreakpoint)                                                                                           \
  CMD(RemoveBreakpointResponse)                                                                                   \
  CMD(Break)                                                                                                      \
  CMD(Continue)                                                                                                   \
  CMD(StepOver)                                                                                                   \
  CMD(StepIn)                                                                                                     \
  CMD(StepOut)                                                                                                    \
  CMD(Stop)                                                                                                       \
  CMD(ActionResponse)                                                                                             \
  CMD(Eval)                                                                                                       \
  CMD(EvalResult)                                                                                                 \
  CMD(BreakNotify)                                                                                                \
  CMD(AttachedNotify)                                                                                             \
  CMD(StartHook)                                                                                                  \
  CMD(StartHookResponse)                                                                                          \
  CMD(Log)                                                                                                        \
  CMD(GetVariable)                                                                                                \
  CMD(SetVariable)

enum class WireCommand : u8
{
  FOR_EACH_WIRE_COMMAND(DEFAULT_ENUM)
};

struct WireMessage
{
  WireCommand mCommand{ WireCommand::Unknown };
  // Command specific fields. Always a JSON object or array; never null.
  Dict mPayload{ Dict::object() };
  // Empty or "0" when no reply is expected.
  std::string mCorrelationId{};
  // The command as it appeared on the wire. Distinguishes protocol commands that share a WireCommand
  // (stopOnEntry vs stopOnBreakpoint) and keeps unknown commands printable.
  std::string mProtocolCommand{};
  // Top-level fields of the record other than the command, payload and correlation id.
  Dict mEnvelope{ Dict::object() };

  bool
  ExpectsReply() const noexcept
  {
    return !mCorrelationId.empty() && mCorrelationId != "0";
  }

  static WireMessage Make(WireCommand command, Dict payload = Dict::object()) noexcept;
};

struct ProtocolParseError
{
  std::string mRecord;
  std::string mReason;
};

/// Framing and serialization of one wire protocol. Stateless; a transporter owns the byte buffer.
class WireCodec
{
public:
  virtual ~WireCodec() noexcept = default;
  virtual std::string_view Name() const noexcept = 0;
  virtual std::string Encode(const WireMessage &message) const noexcept = 0;
  virtual std::expected<WireMessage, ProtocolParseError> Decode(std::string_view record) const noexcept = 0;
  // Appends every complete record found in `buffer` to `records` and returns the number of bytes they
  // occupy. Bytes after that offset belong to a record that has not been fully received yet.
  virtual size_t ExtractRecords(std::string_view buffer, std::vector<std::string_view> &records) const noexcept = 0;
};

// Emmy: "<numeric message id>\n<json object>\n"
class EmmyCodec final : public WireCodec
{
public:
  // Numeric message ids on the wire.
  enum class MessageId : i32
  {
    Unknown = 0,
    InitReq = 1,
    InitRsp = 2,
    ReadyReq = 3,
    ReadyRsp = 4,
    AddBreakPointReq = 5,
    AddBreakPointRsp = 6,
    RemoveBreakPointReq = 7,
    RemoveBreakPointRsp = 8,
    ActionReq = 9,
    ActionRsp = 10,
    EvalReq = 11,
    EvalRsp = 12,
    BreakNotify = 13,
    AttachedNotify = 14,
    StartHookReq = 15,
    StartHookRsp = 16,
    LogNotify = 17,
  };

  // ActionReq.action
  enum class DebugAction : i32
  {
    Break = 0,
    Continue = 1,
    StepOver = 2,
    StepIn = 3,
    StepOut = 4,
    Stop = 5,
  };

  std::string_view Name() const noexcept final;
  std::string Encode(const WireMessage &message) const noexcept final;
  std::expected<WireMessage, ProtocolParseError> Decode(std::string_view record) const noexcept final;
  size_t ExtractRecords(std::string_view buffer, std::vector<std::string_view> &records) const noexcept final;

  static std::optional<MessageId> MessageIdFor(WireCommand command) noexcept;
  static std::optional<DebugAction> ActionFor(WireCommand command) noexcept;
  static WireCommand CommandFor(MessageId id) noexcept;
};

// LuaPanda: '{"cmd":..,"info":..,"callbackId":..}|*|\n'
class LineJsonCodec final : public WireCodec
{
public:
  static constexpr std::string_view kDelimiter = "|*|";
  static constexpr std::string_view kNoCallback = "0";

  std::string_view Name() const noexcept final;
  std::string Encode(const WireMessage &message) const noexcept final;
  std::expected<WireMessage, ProtocolParseError> Decode(std::string_view record) const noexcept final;
  size_t ExtractRecords(std::string_view buffer, std::vector<std::string_view> &records) const noexcept final;

  static std::string_view CommandName(WireCommand command) noexcept;
  static WireCommand CommandFromName(std::string_view name) noexcept;
};

std::unique_ptr<WireCodec> CreateEmmyCodec() noexcept;
std::unique_ptr<WireCodec> CreateLineJsonCodec() noexcept;
} // namespace ldb

PREDEFINED_ENUM_TYPE_METADATA(ldb::WireCommand, WireCommand, FOR_EACH_WIRE_COMMAND)
