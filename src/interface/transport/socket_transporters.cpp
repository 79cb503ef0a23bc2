/** LICENSE TEMPLATE */
#include "socket_transporters.h"
#include <sys/socket.h>
#include <utils/logger.h>

namespace ldb {

// AttachSocketTransporter

AttachSocketTransporter::AttachSocketTransporter(std::vector<std::string> hosts, int port) noexcept
    : SocketTransporter(CreateEmmyCodec(), CorrelationPolicy::Sequential), mHosts(std::move(hosts)), mPort(port)
{
}

AttachSocketTransporter::~AttachSocketTransporter() noexcept { Close(); }

std::expected<void, ConnectError>
AttachSocketTransporter::Connect() noexcept
{
  mLastAttemptErrors.clear();
  for (const auto &host : mHosts) {
    if (IsClosed()) {
      return std::unexpected(ConnectError::Cancelled());
    }
    auto socket = ScopedFd::OpenSocketConnectTo(host, mPort);
    if (!socket) {
      DBGLOG(transport, "[{}] {} failed: {}", Describe(), host, socket.error().Describe());
      mLastAttemptErrors.emplace_back(host, std::move(socket.error()));
      continue;
    }
    mConnectedHost = host;
    DBGLOG(transport, "[{}] connected via {}", Describe(), host);
    return StartReceiving(std::move(socket.value()));
  }
  if (mLastAttemptErrors.empty()) {
    return std::unexpected(ConnectError{ ConnectError::Kind::Connect, "no hosts to connect to", 0 });
  }
  return std::unexpected(mLastAttemptErrors.back().second);
}

std::string
AttachSocketTransporter::Describe() const noexcept
{
  return std::format("emmy:{}", mPort);
}

const std::vector<std::pair<std::string, ConnectError>> &
AttachSocketTransporter::LastAttemptErrors() const noexcept
{
  return mLastAttemptErrors;
}

const std::optional<std::string> &
AttachSocketTransporter::ConnectedHost() const noexcept
{
  return mConnectedHost;
}

// LineJsonClientTransporter

LineJsonClientTransporter::LineJsonClientTransporter(std::string host, int port) noexcept
    : SocketTransporter(CreateLineJsonCodec(), CorrelationPolicy::Random), mHost(std::move(host)), mPort(port)
{
}

LineJsonClientTransporter::~LineJsonClientTransporter() noexcept { Close(); }

std::expected<void, ConnectError>
LineJsonClientTransporter::Connect() noexcept
{
  auto socket = ScopedFd::OpenSocketConnectTo(mHost, mPort);
  if (!socket) {
    DBGLOG(transport, "[{}] connect failed: {}", Describe(), socket.error().Describe());
    return std::unexpected(std::move(socket.error()));
  }
  return StartReceiving(std::move(socket.value()));
}

std::string
LineJsonClientTransporter::Describe() const noexcept
{
  return std::format("luapanda-client:{}:{}", mHost, mPort);
}

// LineJsonServerTransporter

LineJsonServerTransporter::LineJsonServerTransporter(int port) noexcept
    : SocketTransporter(CreateLineJsonCodec(), CorrelationPolicy::Random), mPort(port)
{
}

LineJsonServerTransporter::~LineJsonServerTransporter() noexcept { Close(); }

std::expected<int, ConnectError>
LineJsonServerTransporter::Listen() noexcept
{
  std::lock_guard lock(mListenMutex);
  if (IsClosed()) {
    return std::unexpected(ConnectError::Cancelled());
  }
  if (!mListenSocket.IsOpen()) {
    auto socket = ScopedFd::OpenListeningSocket(mPort);
    if (!socket) {
      DBGLOG(transport, "[{}] listen failed: {}", Describe(), socket.error().Describe());
      return std::unexpected(std::move(socket.error()));
    }
    mListenSocket = std::move(socket.value());
    mPort = mListenSocket.LocalPort().value_or(mPort);
  }
  return mPort;
}

std::expected<void, ConnectError>
LineJsonServerTransporter::Connect() noexcept
{
  if (auto listening = Listen(); !listening) {
    return std::unexpected(std::move(listening.error()));
  }

  DBGLOG(transport, "[{}] waiting for the debuggee to connect", Describe());
  {
    std::lock_guard lock(mListenMutex);
    mAccepting = true;
  }
  auto client = mListenSocket.Accept(mAcceptStop.get_token(), mWakeup.read.fd);
  {
    std::lock_guard lock(mListenMutex);
    mAccepting = false;
    // One client per transporter; later dialers are refused instead of waiting in the backlog.
    mListenSocket.Close();
  }
  if (!client) {
    DBGLOG(transport, "[{}] accept failed: {}", Describe(), client.error().Describe());
    return std::unexpected(std::move(client.error()));
  }
  DBGLOG(transport, "[{}] debuggee connected", Describe());
  return StartReceiving(std::move(client.value()));
}

std::string
LineJsonServerTransporter::Describe() const noexcept
{
  return std::format("luapanda-server:{}", mPort);
}

void
LineJsonServerTransporter::CloseExtraHandles() noexcept
{
  mAcceptStop.request_stop();
  std::lock_guard lock(mListenMutex);
  // An in-flight Accept still polls the fd. It returns through the wakeup pipe and Connect closes it.
  if (!mAccepting) {
    mListenSocket.Close();
  }
}
} // namespace ldb
