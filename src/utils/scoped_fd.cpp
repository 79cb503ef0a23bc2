/** LICENSE TEMPLATE */
#include "scoped_fd.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utils/logger.h>
#include <utils/scope_defer.h>

namespace ldb {

std::string
ConnectError::Describe() const noexcept
{
  if (sys_errno != 0) {
    return std::format("{}: {}", msg, strerror(sys_errno));
  }
  return msg;
}

/* static */ std::string
ConnectError::gai_strerror_safe(int gaiError) noexcept
{
  return gai_strerror(gaiError);
}

ScopedFd::ScopedFd() noexcept : mFd(-1) {}

ScopedFd::ScopedFd(int fd) noexcept : mFd(fd)
{
  VERIFY(fd != -1, "Taking ownership of a closed file or error file: {}", strerror(errno));
}

ScopedFd::ScopedFd(ScopedFd &&other) noexcept : mFd(other.mFd) { other.mFd = -1; }

ScopedFd &
ScopedFd::operator=(ScopedFd &&other) noexcept
{
  if (this == &other) {
    return *this;
  }
  Close();
  mFd = other.mFd;
  other.mFd = -1;
  return *this;
}

ScopedFd::~ScopedFd() noexcept { Close(); }

int
ScopedFd::Get() const noexcept
{
  return mFd;
}

bool
ScopedFd::IsOpen() const noexcept
{
  return mFd != -1;
}

void
ScopedFd::Close() noexcept
{
  if (mFd >= 0) {
    if (::close(mFd) != 0 && errno != EINTR) {
      DBGLOG(warning, "close({}) failed: {}", mFd, strerror(errno));
    }
  }
  mFd = -1;
}

ScopedFd::operator int() const noexcept { return Get(); }

int
ScopedFd::Release() noexcept
{
  const auto fd = mFd;
  mFd = -1;
  return fd;
}

/* static */ std::expected<ScopedFd, ConnectError>
ScopedFd::OpenSocketConnectTo(const std::string &host, int port) noexcept
{
  addrinfo hints = {};
  addrinfo *result = nullptr;
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  const auto portNumber = std::to_string(port);
  if (const auto res = getaddrinfo(host.c_str(), portNumber.c_str(), &hints, &result); res != 0) {
    DBGLOG(transport, "getaddrinfo failed when attempting to connect to {}:{}: {}", host, port,
           gai_strerror(res));
    return std::unexpected(ConnectError::AddrInfo(host, res));
  }

  ScopedDefer defer{ [&]() { freeaddrinfo(result); } };

  bool socketErrorOnly = true;
  int lastErrno = 0;
  for (auto rp = result; rp != nullptr; rp = rp->ai_next) {
    const auto fd = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
    if (fd == -1) {
      lastErrno = errno;
      continue;
    }
    if (::connect(fd, rp->ai_addr, rp->ai_addrlen) != -1) {
      DBGLOG(transport, "Connected to {}:{}", host, port);
      return ScopedFd{ fd };
    }
    lastErrno = errno;
    socketErrorOnly = false;
    ::close(fd);
  }
  if (socketErrorOnly) {
    DBGLOG(transport, "Failed to connect to {}:{} due to socket error: {}", host, port, strerror(lastErrno));
    return std::unexpected(ConnectError::Socket(lastErrno));
  }
  DBGLOG(transport, "Failed to connect to {}:{}: {}", host, port, strerror(lastErrno));
  return std::unexpected(ConnectError::Connect(host, port, lastErrno));
}

/* static */ std::expected<ScopedFd, ConnectError>
ScopedFd::OpenListeningSocket(int port, int backlog) noexcept
{
  const auto fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd == -1) {
    return std::unexpected(ConnectError::Socket(errno));
  }
  ScopedFd socket{ fd };

  int reuse = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) == -1) {
    DBGLOG(warning, "setsockopt(SO_REUSEADDR) failed: {}", strerror(errno));
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(static_cast<u16>(port));
  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == -1) {
    return std::unexpected(ConnectError::Bind(port, errno));
  }
  if (::listen(fd, backlog) == -1) {
    return std::unexpected(ConnectError::Listen(port, errno));
  }
  DBGLOG(transport, "Listening on port {}", socket.LocalPort().value_or(port));
  return socket;
}

std::expected<ScopedFd, ConnectError>
ScopedFd::Accept(std::stop_token token, int cancelFd) const noexcept
{
  while (!token.stop_requested()) {
    pollfd fds[2]{ { .fd = mFd, .events = POLLIN, .revents = 0 }, { .fd = cancelFd, .events = POLLIN, .revents = 0 } };
    const auto ready = ::poll(fds, cancelFd == -1 ? 1 : 2, 100);
    if (ready == -1) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(ConnectError::Accept(errno));
    }
    if (cancelFd != -1 && (fds[1].revents & POLLIN) == POLLIN) {
      return std::unexpected(ConnectError::Cancelled());
    }
    if ((fds[0].revents & POLLIN) == POLLIN) {
      const auto client = ::accept4(mFd, nullptr, nullptr, SOCK_CLOEXEC);
      if (client == -1) {
        return std::unexpected(ConnectError::Accept(errno));
      }
      return ScopedFd{ client };
    }
  }
  return std::unexpected(ConnectError::Cancelled());
}

std::optional<int>
ScopedFd::LocalPort() const noexcept
{
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(mFd, reinterpret_cast<sockaddr *>(&addr), &len) == -1) {
    return {};
  }
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<sockaddr_in *>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<sockaddr_in6 *>(&addr)->sin6_port);
  }
  return {};
}

/* static */
ScopedFd
ScopedFd::TakeFileDescriptorOwnership(int fd) noexcept
{
  return ScopedFd{ fd };
}
} // namespace ldb
