/** LICENSE TEMPLATE */
#pragma once
// ldb
#include <common.h>
#include <interface/transport/callback_registry.h>
#include <interface/wire/wire_message.h>
#include <notify_pipe.h>
#include <utils/debugger_thread.h>
#include <utils/scoped_fd.h>
// std
#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <string>

namespace ldb {

/// Receives everything a transporter produces. Called on the transporter's receive thread.
class TransportListener
{
public:
  virtual ~TransportListener() noexcept = default;
  // An inbound message that did not answer a pending request.
  virtual void OnMessage(WireMessage message) noexcept = 0;
  // The reply (or the failure) for a request sent with a continuation.
  virtual void OnReply(ReplyContinuation continuation, ReplyResult result) noexcept = 0;
  // End of stream or read error. Not raised for a locally initiated Close.
  virtual void OnDisconnect() noexcept = 0;
};

/// Owns one physical connection and its wire codec.
class Transporter
{
public:
  NO_COPY(Transporter);
  Transporter(std::unique_ptr<WireCodec> codec, CorrelationPolicy policy) noexcept;
  virtual ~Transporter() noexcept = default;

  virtual std::expected<void, ConnectError> Connect() noexcept = 0;
  virtual bool Send(const WireMessage &message) noexcept = 0;
  // Idempotent. Releases every OS handle and fails outstanding continuations with Disconnected.
  virtual void Close() noexcept = 0;
  virtual bool IsConnected() const noexcept = 0;
  virtual std::string Describe() const noexcept = 0;

  // Attaches a fresh correlation id to `message` and delivers the reply to `continuation`.
  bool Send(WireMessage message, ReplyContinuation continuation) noexcept;

  void SetListener(TransportListener *listener) noexcept;
  CallbackRegistry &Callbacks() noexcept;
  const WireCodec &Codec() const noexcept;

protected:
  // Routes a decoded inbound message: correlated replies to their continuation, everything else to the listener.
  void Dispatch(WireMessage message) noexcept;
  void AbandonPendingCallbacks(std::string_view reason) noexcept;
  void NotifyDisconnect() noexcept;

  std::unique_ptr<WireCodec> mCodec;
  CallbackRegistry mCallbacks;
  std::atomic<TransportListener *> mListener{ nullptr };
};

/// A transporter over a connected stream socket, with a dedicated receive thread.
class SocketTransporter : public Transporter
{
public:
  SocketTransporter(std::unique_ptr<WireCodec> codec, CorrelationPolicy policy) noexcept;
  ~SocketTransporter() noexcept override;

  using Transporter::Send;
  bool Send(const WireMessage &message) noexcept override;
  void Close() noexcept override;
  bool IsConnected() const noexcept override;

protected:
  // Takes ownership of a connected socket and starts the receive loop. Fails if Close won the race.
  std::expected<void, ConnectError> StartReceiving(ScopedFd socket) noexcept;
  bool IsClosed() const noexcept;
  // Extra teardown for variants owning more handles (the listening socket). Called once from Close.
  virtual void CloseExtraHandles() noexcept {}

  Notifier mWakeup;

private:
  void ReceiveLoop(std::stop_token &token) noexcept;
  void HandleReceivedBytes() noexcept;
  bool WriteAll(std::string_view bytes) noexcept;

  std::mutex mSocketMutex;
  ScopedFd mSocket;
  std::string mReceiveBuffer;
  std::unique_ptr<DebuggerThread> mReceiveThread;
  std::atomic<bool> mClosed{ false };
  std::atomic<bool> mConnected{ false };
};
} // namespace ldb
