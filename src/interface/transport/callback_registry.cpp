/** LICENSE TEMPLATE */
#include "callback_registry.h"
#include <utils/logger.h>

namespace ldb {

CallbackRegistry::CallbackRegistry(CorrelationPolicy policy) noexcept
    : CallbackRegistry(policy, std::random_device{}())
{
}

CallbackRegistry::CallbackRegistry(CorrelationPolicy policy, u32 seed) noexcept
    : mPending(), mPolicy(policy), mRandom(seed)
{
}

std::string
CallbackRegistry::NextIdLocked() noexcept
{
  if (mPolicy == CorrelationPolicy::Sequential) {
    std::string id;
    do {
      id = std::to_string(++mCounter);
    } while (mPending.contains(id));
    return id;
  }

  std::string id;
  do {
    id = std::to_string(mDistribution(mRandom));
  } while (mPending.contains(id));
  return id;
}

std::string
CallbackRegistry::Register(ReplyContinuation continuation) noexcept
{
  std::lock_guard lock(mMutex);
  auto id = NextIdLocked();
  mPending.emplace(id, std::move(continuation));
  return id;
}

std::optional<ReplyContinuation>
CallbackRegistry::Take(std::string_view correlationId) noexcept
{
  if (correlationId.empty()) {
    return std::nullopt;
  }
  std::lock_guard lock(mMutex);
  auto it = mPending.find(std::string{ correlationId });
  if (it == std::end(mPending)) {
    return std::nullopt;
  }
  auto continuation = std::move(it->second);
  mPending.erase(it);
  return continuation;
}

bool
CallbackRegistry::Contains(std::string_view correlationId) const noexcept
{
  std::lock_guard lock(mMutex);
  return mPending.contains(std::string{ correlationId });
}

size_t
CallbackRegistry::PendingCount() const noexcept
{
  std::lock_guard lock(mMutex);
  return mPending.size();
}

std::vector<ReplyContinuation>
CallbackRegistry::AbandonAll() noexcept
{
  std::lock_guard lock(mMutex);
  std::vector<ReplyContinuation> result;
  result.reserve(mPending.size());
  for (auto &[id, continuation] : mPending) {
    result.push_back(std::move(continuation));
  }
  if (!mPending.empty()) {
    DBGLOG(transport, "abandoning {} pending callbacks", mPending.size());
  }
  mPending.clear();
  return result;
}

CorrelationPolicy
CallbackRegistry::Policy() const noexcept
{
  return mPolicy;
}
} // namespace ldb
