/** LICENSE TEMPLATE */
#pragma once
#include <common.h>
#include <common/typedefs.h>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>

namespace ldb {

struct ConnectError
{
  enum class Kind
  {
    GetAddressInfo,
    Socket,
    Connect,
    Bind,
    Listen,
    Accept,
    Cancelled
  };

  Kind kind;
  std::string msg;
  int sys_errno;

  static ConnectError
  AddrInfo(const std::string &host, int gaiError) noexcept
  {
    return ConnectError{ .kind = Kind::GetAddressInfo,
                         .msg = std::format("getaddrinfo failed for {}: {}", host, gai_strerror_safe(gaiError)),
                         .sys_errno = 0 };
  }

  static ConnectError
  Socket(int sys) noexcept
  {
    return ConnectError{ .kind = Kind::Socket, .msg = "Failed to open socket", .sys_errno = sys };
  }

  static ConnectError
  Connect(const std::string &host, int port, int sys) noexcept
  {
    return ConnectError{
      .kind = Kind::Connect, .msg = std::format("Failed to connect to {}:{}", host, port), .sys_errno = sys
    };
  }

  static ConnectError
  Bind(int port, int sys) noexcept
  {
    return ConnectError{ .kind = Kind::Bind, .msg = std::format("Failed to bind port {}", port), .sys_errno = sys };
  }

  static ConnectError
  Listen(int port, int sys) noexcept
  {
    return ConnectError{
      .kind = Kind::Listen, .msg = std::format("Failed to listen on port {}", port), .sys_errno = sys
    };
  }

  static ConnectError
  Accept(int sys) noexcept
  {
    return ConnectError{ .kind = Kind::Accept, .msg = "Failed to accept connection", .sys_errno = sys };
  }

  static ConnectError
  Cancelled() noexcept
  {
    return ConnectError{ .kind = Kind::Cancelled, .msg = "Cancelled", .sys_errno = 0 };
  }

  std::string Describe() const noexcept;

private:
  static std::string gai_strerror_safe(int gaiError) noexcept;
};

class ScopedFd
{
public:
  ScopedFd() noexcept;
  explicit ScopedFd(int fd) noexcept;
  ScopedFd &operator=(ScopedFd &&other) noexcept;
  ScopedFd(ScopedFd &&) noexcept;
  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;
  ~ScopedFd() noexcept;

  int Get() const noexcept;
  bool IsOpen() const noexcept;
  void Close() noexcept;
  operator int() const noexcept;
  int Release() noexcept;

  static std::expected<ScopedFd, ConnectError> OpenSocketConnectTo(const std::string &host, int port) noexcept;
  // Binds a listening socket on all interfaces. Port 0 lets the kernel pick one; see LocalPort.
  static std::expected<ScopedFd, ConnectError> OpenListeningSocket(int port, int backlog = 1) noexcept;
  // Blocks until a client connects, `token` is stopped, or `cancelFd` becomes readable.
  std::expected<ScopedFd, ConnectError> Accept(std::stop_token token, int cancelFd = -1) const noexcept;
  std::optional<int> LocalPort() const noexcept;
  static ScopedFd TakeFileDescriptorOwnership(int fd) noexcept;

private:
  int mFd;
};
} // namespace ldb
