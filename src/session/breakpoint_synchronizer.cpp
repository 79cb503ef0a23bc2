/** LICENSE TEMPLATE */
#include "breakpoint_synchronizer.h"
#include <utils/logger.h>

namespace ldb {

BreakpointSynchronizer::BreakpointSynchronizer(BreakpointWire &wire) noexcept : mWire(wire) {}

std::vector<BreakpointDescriptor>
BreakpointSynchronizer::DescriptorsForFile(std::string_view filePath) const noexcept
{
  std::vector<BreakpointDescriptor> result{};
  for (const auto &[handle, descriptor] : mRegistered) {
    if (descriptor.mFilePath == filePath) {
      result.push_back(descriptor);
    }
  }
  return result;
}

void
BreakpointSynchronizer::Reset(BreakpointSource &source) noexcept
{
  DBGLOG(breakpoint, "reset: dropping {} handles", mRegistered.size());
  mRegistered.clear();
  mNextHandle = 0;
  for (const auto &breakpoint : source.Breakpoints()) {
    breakpoint->StripHandle();
  }
}

u32
BreakpointSynchronizer::Resync(BreakpointSource &source) noexcept
{
  Reset(source);
  u32 count = 0;
  for (const auto &breakpoint : source.Breakpoints()) {
    Register(*breakpoint);
    ++count;
  }
  DBGLOG(breakpoint, "resynchronized {} breakpoints", count);
  return count;
}

BreakpointHandle
BreakpointSynchronizer::Register(SourceBreakpoint &breakpoint) noexcept
{
  if (auto existing = breakpoint.Handle(); existing) {
    if (auto it = mRegistered.find(*existing);
        it != mRegistered.end() && it->second == breakpoint.Descriptor()) {
      return *existing;
    }
  }

  const auto handle = mNextHandle++;
  breakpoint.AttachHandle(handle);
  const auto &descriptor = breakpoint.Descriptor();
  mRegistered.emplace(handle, descriptor);
  DBGLOG(breakpoint, "register #{} {}:{}", handle, descriptor.mFilePath, descriptor.mLine);
  const auto sameFile = DescriptorsForFile(descriptor.mFilePath);
  mWire.SendAddBreakpoint(descriptor, sameFile);
  return handle;
}

bool
BreakpointSynchronizer::Unregister(SourceBreakpoint &breakpoint) noexcept
{
  const auto handle = breakpoint.Handle();
  if (!handle) {
    return false;
  }
  auto it = mRegistered.find(*handle);
  if (it == mRegistered.end()) {
    DBGLOG(breakpoint, "unregister: handle #{} is not registered with this session", *handle);
    return false;
  }
  auto descriptor = std::move(it->second);
  mRegistered.erase(it);
  breakpoint.StripHandle();
  DBGLOG(breakpoint, "unregister #{} {}:{}", *handle, descriptor.mFilePath, descriptor.mLine);
  const auto sameFile = DescriptorsForFile(descriptor.mFilePath);
  mWire.SendRemoveBreakpoint(descriptor, sameFile);
  return true;
}

std::optional<BreakpointDescriptor>
BreakpointSynchronizer::Lookup(BreakpointHandle handle) const noexcept
{
  if (auto it = mRegistered.find(handle); it != mRegistered.end()) {
    return it->second;
  }
  return std::nullopt;
}

BreakpointHandle
BreakpointSynchronizer::NextHandle() const noexcept
{
  return mNextHandle;
}

size_t
BreakpointSynchronizer::RegisteredCount() const noexcept
{
  return mRegistered.size();
}
} // namespace ldb
