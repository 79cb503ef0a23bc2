/** LICENSE TEMPLATE */
#pragma once

namespace ldb {
// Self-pipe used to wake threads blocked in poll(2). The read end is non-blocking.
struct Notifier
{
  struct ReadEnd
  {
    int fd;
    operator int() const noexcept { return fd; }

    // Drains all pending wake-up tokens.
    [[maybe_unused]] bool Consume() const noexcept;
  };

  struct WriteEnd
  {
    int fd;
    bool Notify() const noexcept;
  };

  static Notifier NotifyPipe() noexcept;
  void Close() noexcept;

  ReadEnd read;
  WriteEnd write;
};
} // namespace ldb
