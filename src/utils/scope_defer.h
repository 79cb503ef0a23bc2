/** LICENSE TEMPLATE */
#pragma once
#include <common/macros.h>
#include <utility>

template <typename DeferFn> class ScopedDefer
{
public:
  MOVE_ONLY(ScopedDefer);
  explicit ScopedDefer(DeferFn &&fn) noexcept : mDeferFn(std::move(fn)) {}
  ~ScopedDefer() noexcept
  {
    if (mArmed) {
      mDeferFn();
    }
  }

  ScopedDefer(ScopedDefer &&other) noexcept : mDeferFn(std::move(other.mDeferFn)), mArmed(other.mArmed)
  {
    other.mArmed = false;
  }

  // Disarm the deferred action, for when ownership of the guarded resource was handed off.
  void
  Cancel() noexcept
  {
    mArmed = false;
  }

private:
  DeferFn mDeferFn;
  bool mArmed{ true };
};
