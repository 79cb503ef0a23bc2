/** LICENSE TEMPLATE */
#pragma once
#include <interface/transport/transporter.h>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace ldb {

/// Emmy protocol. Dials the port the injected listener derived from the target pid, trying each host in order.
class AttachSocketTransporter final : public SocketTransporter
{
public:
  AttachSocketTransporter(std::vector<std::string> hosts, int port) noexcept;
  ~AttachSocketTransporter() noexcept override;

  std::expected<void, ConnectError> Connect() noexcept final;
  std::string Describe() const noexcept final;

  // The failure of every host tried by the last Connect, in order.
  const std::vector<std::pair<std::string, ConnectError>> &LastAttemptErrors() const noexcept;
  // Host that accepted the connection.
  const std::optional<std::string> &ConnectedHost() const noexcept;

private:
  std::vector<std::string> mHosts;
  int mPort;
  std::vector<std::pair<std::string, ConnectError>> mLastAttemptErrors;
  std::optional<std::string> mConnectedHost;
};

/// LuaPanda protocol, dialing the debuggee.
class LineJsonClientTransporter final : public SocketTransporter
{
public:
  LineJsonClientTransporter(std::string host, int port) noexcept;
  ~LineJsonClientTransporter() noexcept override;

  std::expected<void, ConnectError> Connect() noexcept final;
  std::string Describe() const noexcept final;

private:
  std::string mHost;
  int mPort;
};

/// LuaPanda protocol, waiting for the debuggee to dial in. Accepts exactly one client.
class LineJsonServerTransporter final : public SocketTransporter
{
public:
  explicit LineJsonServerTransporter(int port) noexcept;
  ~LineJsonServerTransporter() noexcept override;

  // Binds and listens. Called by Connect when not called before; tests call it to learn an ephemeral port.
  std::expected<int, ConnectError> Listen() noexcept;
  std::expected<void, ConnectError> Connect() noexcept final;
  std::string Describe() const noexcept final;

protected:
  void CloseExtraHandles() noexcept final;

private:
  int mPort;
  std::mutex mListenMutex;
  ScopedFd mListenSocket;
  bool mAccepting{ false };
  std::stop_source mAcceptStop;
};

// Folds a pid into [0x400, 0xFFFF].
constexpr int
DerivePort(i64 pid) noexcept
{
  i64 port = pid;
  while (port > 0xFFFF) {
    port -= 0xFFFF;
  }
  while (port < 0x400) {
    port += 0x400;
  }
  return static_cast<int>(port);
}
} // namespace ldb
