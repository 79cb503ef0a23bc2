/** LICENSE TEMPLATE */
#pragma once
#include <common/typedefs.h>
#include <expected>
#include <functional>
#include <interface/wire/wire_message.h>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ldb {

struct ReplyError
{
  enum class Kind : u8
  {
    // The transporter closed before the reply arrived.
    Disconnected,
    SendFailed,
  };
  Kind mKind;
  std::string mMessage;
};

using ReplyResult = std::expected<WireMessage, ReplyError>;
using ReplyContinuation = std::function<void(ReplyResult)>;

enum class CorrelationPolicy : u8
{
  // 1, 2, 3, ...
  Sequential,
  // Uniform in [10, 999999999]; values below 10 are reserved by the peer.
  Random,
};

/// Correlation id -> continuation table. Safe for concurrent registration (senders) and removal (receive loop).
/// Every continuation is handed out exactly once: by Take when its reply arrives, or by AbandonAll on close.
class CallbackRegistry
{
public:
  static constexpr i32 kRandomIdMin = 10;
  static constexpr i32 kRandomIdMax = 999'999'999;

  explicit CallbackRegistry(CorrelationPolicy policy) noexcept;
  CallbackRegistry(CorrelationPolicy policy, u32 seed) noexcept;

  // Allocates an id that is not live and stores the continuation under it.
  std::string Register(ReplyContinuation continuation) noexcept;
  std::optional<ReplyContinuation> Take(std::string_view correlationId) noexcept;
  bool Contains(std::string_view correlationId) const noexcept;
  size_t PendingCount() const noexcept;
  std::vector<ReplyContinuation> AbandonAll() noexcept;
  CorrelationPolicy Policy() const noexcept;

private:
  std::string NextIdLocked() noexcept;

  mutable std::mutex mMutex;
  std::unordered_map<std::string, ReplyContinuation> mPending;
  CorrelationPolicy mPolicy;
  u64 mCounter{ 0 };
  std::mt19937 mRandom;
  std::uniform_int_distribution<i32> mDistribution{ kRandomIdMin, kRandomIdMax };
};
} // namespace ldb
