/** LICENSE TEMPLATE */
#include "transporter.h"
// ldb
#include <utils/logger.h>
// system
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ldb {

static constexpr auto kReadChunkSize = 64 * 1024;

Transporter::Transporter(std::unique_ptr<WireCodec> codec, CorrelationPolicy policy) noexcept
    : mCodec(std::move(codec)), mCallbacks(policy)
{
}

bool
Transporter::Send(WireMessage message, ReplyContinuation continuation) noexcept
{
  message.mCorrelationId = mCallbacks.Register(continuation);
  if (Send(message)) {
    return true;
  }
  // The request never left; hand the failure to the continuation unless Close already did.
  if (auto pending = mCallbacks.Take(message.mCorrelationId); pending) {
    if (auto *listener = mListener.load(); listener) {
      listener->OnReply(std::move(*pending),
        std::unexpected(ReplyError{ ReplyError::Kind::SendFailed, "failed to write request" }));
    }
  }
  return false;
}

void
Transporter::SetListener(TransportListener *listener) noexcept
{
  mListener.store(listener);
}

CallbackRegistry &
Transporter::Callbacks() noexcept
{
  return mCallbacks;
}

const WireCodec &
Transporter::Codec() const noexcept
{
  return *mCodec;
}

void
Transporter::Dispatch(WireMessage message) noexcept
{
  auto *listener = mListener.load();
  if (message.ExpectsReply()) {
    if (auto continuation = mCallbacks.Take(message.mCorrelationId); continuation) {
      DBGLOG(transport, "reply for correlation id {}", message.mCorrelationId);
      if (listener) {
        listener->OnReply(std::move(*continuation), std::move(message));
      }
      return;
    }
  }
  if (listener) {
    listener->OnMessage(std::move(message));
  }
}

void
Transporter::AbandonPendingCallbacks(std::string_view reason) noexcept
{
  auto *listener = mListener.load();
  for (auto &continuation : mCallbacks.AbandonAll()) {
    if (listener) {
      listener->OnReply(
        std::move(continuation), std::unexpected(ReplyError{ ReplyError::Kind::Disconnected, std::string{ reason } }));
    }
  }
}

void
Transporter::NotifyDisconnect() noexcept
{
  if (auto *listener = mListener.load(); listener) {
    listener->OnDisconnect();
  }
}

SocketTransporter::SocketTransporter(std::unique_ptr<WireCodec> codec, CorrelationPolicy policy) noexcept
    : Transporter(std::move(codec), policy), mWakeup(Notifier::NotifyPipe())
{
}

SocketTransporter::~SocketTransporter() noexcept
{
  Close();
  mWakeup.Close();
}

std::expected<void, ConnectError>
SocketTransporter::StartReceiving(ScopedFd socket) noexcept
{
  std::lock_guard lock(mSocketMutex);
  if (mClosed) {
    DBGLOG(transport, "[{}] connection established after close, dropping it", Describe());
    return std::unexpected(ConnectError::Cancelled());
  }
  mSocket = std::move(socket);
  mConnected = true;
  mReceiveThread = DebuggerThread::SpawnDebuggerThread(
    std::format("ldb-recv-{}", mSocket.Get()), [this](std::stop_token &token) { ReceiveLoop(token); });
  return {};
}

bool
SocketTransporter::IsClosed() const noexcept
{
  return mClosed;
}

bool
SocketTransporter::IsConnected() const noexcept
{
  return mConnected && !mClosed;
}

bool
SocketTransporter::WriteAll(std::string_view bytes) noexcept
{
  while (!bytes.empty()) {
    const auto written = ::send(mSocket.Get(), bytes.data(), bytes.size(), MSG_NOSIGNAL);
    if (written == -1) {
      if (errno == EINTR) {
        continue;
      }
      DBGLOG(transport, "[{}] write failed: {}", Describe(), strerror(errno));
      return false;
    }
    bytes.remove_prefix(static_cast<size_t>(written));
  }
  return true;
}

bool
SocketTransporter::Send(const WireMessage &message) noexcept
{
  const auto bytes = mCodec->Encode(message);
  std::lock_guard lock(mSocketMutex);
  // mConnected drops before the receive loop abandons callbacks, so a request registered after that fails here.
  if (mClosed || !mConnected || !mSocket.IsOpen()) {
    DBGLOG(transport, "[{}] dropping {} on closed connection", Describe(), message.mCommand);
    return false;
  }
  DBGLOG(transport, "[{}] send: {}", Describe(), TrimWhitespace(bytes));
  return WriteAll(bytes);
}

void
SocketTransporter::HandleReceivedBytes() noexcept
{
  std::vector<std::string_view> records;
  const auto consumed = mCodec->ExtractRecords(mReceiveBuffer, records);
  for (const auto record : records) {
    DBGLOG(transport, "[{}] recv: {}", Describe(), record);
    auto decoded = mCodec->Decode(record);
    if (!decoded) {
      DBGLOG(warning,
        "[{}] dropping malformed record: {} (record: '{}')",
        Describe(),
        decoded.error().mReason,
        decoded.error().mRecord);
      continue;
    }
    Dispatch(std::move(decoded.value()));
    if (mClosed) {
      break;
    }
  }
  mReceiveBuffer.erase(0, consumed);
}

void
SocketTransporter::ReceiveLoop(std::stop_token &token) noexcept
{
  const int socketFd = mSocket.Get();
  char chunk[kReadChunkSize];
  bool peerClosed = false;
  while (!token.stop_requested() && !mClosed) {
    pollfd fds[2]{ { .fd = socketFd, .events = POLLIN, .revents = 0 },
      { .fd = mWakeup.read.fd, .events = POLLIN, .revents = 0 } };
    const auto ready = ::poll(fds, 2, -1);
    if (ready == -1) {
      if (errno == EINTR) {
        continue;
      }
      DBGLOG(transport, "[{}] poll failed: {}", Describe(), strerror(errno));
      peerClosed = true;
      break;
    }
    if ((fds[1].revents & POLLIN) == POLLIN) {
      mWakeup.read.Consume();
      continue;
    }
    if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
      continue;
    }
    const auto bytesRead = ::recv(socketFd, chunk, sizeof(chunk), 0);
    if (bytesRead == -1 && errno == EINTR) {
      continue;
    }
    if (bytesRead <= 0) {
      DBGLOG(transport,
        "[{}] connection ended: {}",
        Describe(),
        bytesRead == 0 ? std::string{ "end of stream" } : std::string{ strerror(errno) });
      peerClosed = true;
      break;
    }
    mReceiveBuffer.append(chunk, static_cast<size_t>(bytesRead));
    HandleReceivedBytes();
  }

  mConnected = false;
  if (peerClosed && !mClosed) {
    AbandonPendingCallbacks("peer disconnected");
    NotifyDisconnect();
  }
}

void
SocketTransporter::Close() noexcept
{
  if (mClosed.exchange(true)) {
    return;
  }
  DBGLOG(transport, "[{}] closing", Describe());
  mWakeup.write.Notify();
  {
    std::lock_guard lock(mSocketMutex);
    if (mSocket.IsOpen()) {
      ::shutdown(mSocket.Get(), SHUT_RDWR);
    }
  }
  CloseExtraHandles();

  if (mReceiveThread) {
    mReceiveThread->RequestStop();
    mReceiveThread->Join();
  }

  {
    std::lock_guard lock(mSocketMutex);
    // Closed on the receive thread itself: the loop observes mClosed before touching the fd again.
    mSocket.Close();
  }
  mConnected = false;
  AbandonPendingCallbacks("transporter closed");
}
} // namespace ldb
