/** LICENSE TEMPLATE */
#include "event_queue.h"
#include <algorithm>
#include <cstring>
#include <iterator>
#include <sys/poll.h>
#include <utils/logger.h>

namespace ldb {

SessionEventQueue::SessionEventQueue() noexcept : mNotifier(Notifier::NotifyPipe()) {}

SessionEventQueue::~SessionEventQueue() noexcept { mNotifier.Close(); }

void
SessionEventQueue::Push(SessionEvent event) noexcept
{
  std::lock_guard lock(mEventsGuard);
  mEvents.push_back(std::move(event));
  mNotifier.write.Notify();
}

void
SessionEventQueue::Wake() noexcept
{
  mNotifier.write.Notify();
}

bool
SessionEventQueue::PollBlocking(std::vector<SessionEvent> &out, std::optional<std::chrono::milliseconds> timeout) noexcept
{
  {
    std::lock_guard lock(mEventsGuard);
    if (!mEvents.empty()) {
      mNotifier.read.Consume();
      std::ranges::move(mEvents, std::back_inserter(out));
      mEvents.clear();
      return true;
    }
  }

  pollfd pfd{ mNotifier.read.fd, POLLIN, 0 };
  const int timeoutMs = timeout ? static_cast<int>(std::max<i64>(timeout->count(), 0)) : -1;
  const auto ret = poll(&pfd, 1, timeoutMs);
  if (ret == -1 && errno != EINTR) {
    DBGLOG(warning, "session event poll failed: {}", strerror(errno));
  }
  if (ret <= 0) {
    return false;
  }
  mNotifier.read.Consume();

  std::lock_guard lock(mEventsGuard);
  const auto sizeBefore = out.size();
  std::ranges::move(mEvents, std::back_inserter(out));
  mEvents.clear();
  return out.size() != sizeBefore;
}
} // namespace ldb
