/** LICENSE TEMPLATE */
#include "notify_pipe.h"
#include <cerrno>
#include <common.h>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace ldb {

/* static */ Notifier
Notifier::NotifyPipe() noexcept
{
  int notifyPipe[2];
  VERIFY(pipe2(notifyPipe, O_CLOEXEC) != -1, "Failed to set up notifier pipe {}", strerror(errno));
  auto flags = fcntl(notifyPipe[0], F_GETFL);
  VERIFY(flags != -1, "Failed to get flags for read-end of pipe");
  VERIFY(-1 != fcntl(notifyPipe[0], F_SETFL, flags | O_NONBLOCK), "Failed to set non-blocking for pipe");
  return Notifier{ .read = ReadEnd{ notifyPipe[0] }, .write = WriteEnd{ notifyPipe[1] } };
}

void
Notifier::Close() noexcept
{
  if (read.fd != -1) {
    ::close(read.fd);
    read.fd = -1;
  }
  if (write.fd != -1) {
    ::close(write.fd);
    write.fd = -1;
  }
}

[[maybe_unused]] bool
Notifier::ReadEnd::Consume() const noexcept
{
  char ch[16];
  while (::read(fd, &ch, sizeof(ch)) > 0) {
  }
  return errno == EAGAIN || errno == EWOULDBLOCK;
}

bool
Notifier::WriteEnd::Notify() const noexcept
{
  return ::write(fd, "+", 1) > 0;
}

} // namespace ldb
