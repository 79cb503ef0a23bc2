/** LICENSE TEMPLATE */
#pragma once
#include <expected>
#include <functional>
#include <interface/transport/transporter.h>
#include <session/breakpoint_synchronizer.h>
#include <session/script_provider.h>
#include <session/session_config.h>
#include <session/session_listener.h>
#include <session/stack_frame.h>
#include <variant>

namespace ldb {

enum class RunControl : u8
{
  Continue,
  StepOver,
  StepIn,
  StepOut,
  Pause,
};

struct BreakEvent
{
  std::vector<StackFrameSnapshot> mFrames;
  std::string mReason;
};

struct LogEvent
{
  LogSeverity mSeverity;
  std::string mText;
};

struct PeerStopEvent
{
};

struct IgnoredEvent
{
};

// What an inbound, uncorrelated message means to the session.
using ProtocolEvent = std::variant<IgnoredEvent, BreakEvent, LogEvent, PeerStopEvent>;

using EvaluationResult = std::expected<Variable, std::string>;
using EvaluationCallback = std::function<void(EvaluationResult)>;
using ChildrenResult = std::expected<std::vector<Variable>, std::string>;
using ChildrenCallback = std::function<void(ChildrenResult)>;

enum class AcknowledgeMode : u8
{
  // Done once sent.
  None,
  // The continuation passed along runs when the peer answers.
  AwaitReply,
};

/// Speaks one debugger protocol over a bound transporter. Used only from the session thread; the
/// continuations it registers run there too.
class ProtocolDriver : public BreakpointWire
{
public:
  explicit ProtocolDriver(const SessionConfig &config) noexcept;
  ~ProtocolDriver() noexcept override = default;

  void Bind(Transporter *transporter) noexcept;
  virtual std::string_view Name() const noexcept = 0;

  virtual AcknowledgeMode SendInit(ReplyContinuation onAcknowledged) noexcept = 0;
  virtual void SendReady() noexcept = 0;
  virtual bool SendRunControl(RunControl action) noexcept = 0;
  // `sameFile` is every registered breakpoint in the target's file, the target included.
  virtual bool RunToPosition(
    const BreakpointDescriptor &target, std::span<const BreakpointDescriptor> sameFile) noexcept = 0;
  virtual bool Evaluate(
    std::string expression, const StackFrameSnapshot &frame, EvaluationCallback callback) noexcept = 0;
  virtual bool FetchChildren(
    const Variable &variable, const StackFrameSnapshot &frame, ChildrenCallback callback) noexcept = 0;
  virtual AcknowledgeMode SendStop(ReplyContinuation onAcknowledged) noexcept = 0;
  virtual ProtocolEvent Interpret(const WireMessage &message) noexcept = 0;

protected:
  bool Post(WireMessage message) noexcept;
  bool Request(WireMessage message, ReplyContinuation continuation) noexcept;

  const SessionConfig &mConfig;
  Transporter *mTransporter{ nullptr };
};

class EmmyDriver final : public ProtocolDriver
{
  ScriptProvider &mScripts;

public:
  EmmyDriver(const SessionConfig &config, ScriptProvider &scripts) noexcept;

  std::string_view Name() const noexcept final;
  AcknowledgeMode SendInit(ReplyContinuation onAcknowledged) noexcept final;
  void SendReady() noexcept final;
  bool SendRunControl(RunControl action) noexcept final;
  bool RunToPosition(
    const BreakpointDescriptor &target, std::span<const BreakpointDescriptor> sameFile) noexcept final;
  bool Evaluate(std::string expression, const StackFrameSnapshot &frame, EvaluationCallback callback) noexcept final;
  bool FetchChildren(
    const Variable &variable, const StackFrameSnapshot &frame, ChildrenCallback callback) noexcept final;
  AcknowledgeMode SendStop(ReplyContinuation onAcknowledged) noexcept final;
  ProtocolEvent Interpret(const WireMessage &message) noexcept final;

  void SendAddBreakpoint(
    const BreakpointDescriptor &added, std::span<const BreakpointDescriptor> sameFile) noexcept final;
  void SendRemoveBreakpoint(
    const BreakpointDescriptor &removed, std::span<const BreakpointDescriptor> sameFile) noexcept final;

  static Dict BreakpointToWire(const BreakpointDescriptor &descriptor) noexcept;
};

class LuaPandaDriver final : public ProtocolDriver
{
public:
  explicit LuaPandaDriver(const SessionConfig &config) noexcept;

  std::string_view Name() const noexcept final;
  AcknowledgeMode SendInit(ReplyContinuation onAcknowledged) noexcept final;
  void SendReady() noexcept final;
  bool SendRunControl(RunControl action) noexcept final;
  bool RunToPosition(
    const BreakpointDescriptor &target, std::span<const BreakpointDescriptor> sameFile) noexcept final;
  bool Evaluate(std::string expression, const StackFrameSnapshot &frame, EvaluationCallback callback) noexcept final;
  bool FetchChildren(
    const Variable &variable, const StackFrameSnapshot &frame, ChildrenCallback callback) noexcept final;
  AcknowledgeMode SendStop(ReplyContinuation onAcknowledged) noexcept final;
  ProtocolEvent Interpret(const WireMessage &message) noexcept final;

  void SendAddBreakpoint(
    const BreakpointDescriptor &added, std::span<const BreakpointDescriptor> sameFile) noexcept final;
  void SendRemoveBreakpoint(
    const BreakpointDescriptor &removed, std::span<const BreakpointDescriptor> sameFile) noexcept final;

  Dict InitInfo() const noexcept;
  static Dict BreakpointsToWire(std::string_view path, std::span<const BreakpointDescriptor> breakpoints) noexcept;
};

std::unique_ptr<ProtocolDriver> CreateProtocolDriver(const SessionConfig &config, ScriptProvider &scripts) noexcept;
} // namespace ldb
