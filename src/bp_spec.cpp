/** LICENSE TEMPLATE */
#include "bp_spec.h"
#include <algorithm>

namespace ldb {

SourceBreakpoint::SourceBreakpoint(BreakpointDescriptor descriptor) noexcept : mDescriptor(std::move(descriptor)) {}

const BreakpointDescriptor &
SourceBreakpoint::Descriptor() const noexcept
{
  return mDescriptor;
}

std::optional<BreakpointHandle>
SourceBreakpoint::Handle() const noexcept
{
  const auto handle = mHandle.load(std::memory_order_acquire);
  if (handle == kNoHandle) {
    return std::nullopt;
  }
  return static_cast<BreakpointHandle>(handle);
}

void
SourceBreakpoint::AttachHandle(BreakpointHandle handle) noexcept
{
  mHandle.store(handle, std::memory_order_release);
}

void
SourceBreakpoint::StripHandle() noexcept
{
  mHandle.store(kNoHandle, std::memory_order_release);
}

std::shared_ptr<SourceBreakpoint>
BreakpointStore::Add(BreakpointDescriptor descriptor) noexcept
{
  auto breakpoint = std::make_shared<SourceBreakpoint>(std::move(descriptor));
  std::lock_guard lock(mMutex);
  const auto &added = breakpoint->Descriptor();
  std::erase_if(mBreakpoints, [&added](const auto &bp) {
    return bp->Descriptor().mFilePath == added.mFilePath && bp->Descriptor().mLine == added.mLine;
  });
  mBreakpoints.push_back(breakpoint);
  return breakpoint;
}

std::shared_ptr<SourceBreakpoint>
BreakpointStore::Remove(std::string_view filePath, u32 line) noexcept
{
  std::lock_guard lock(mMutex);
  auto it = std::ranges::find_if(mBreakpoints, [&](const auto &bp) {
    return bp->Descriptor().mFilePath == filePath && bp->Descriptor().mLine == line;
  });
  if (it == mBreakpoints.end()) {
    return nullptr;
  }
  auto removed = std::move(*it);
  mBreakpoints.erase(it);
  return removed;
}

std::shared_ptr<SourceBreakpoint>
BreakpointStore::Find(std::string_view filePath, u32 line) const noexcept
{
  std::lock_guard lock(mMutex);
  for (const auto &bp : mBreakpoints) {
    if (bp->Descriptor().mFilePath == filePath && bp->Descriptor().mLine == line) {
      return bp;
    }
  }
  return nullptr;
}

std::vector<std::shared_ptr<SourceBreakpoint>>
BreakpointStore::Breakpoints() noexcept
{
  std::lock_guard lock(mMutex);
  return mBreakpoints;
}

size_t
BreakpointStore::Count() const noexcept
{
  std::lock_guard lock(mMutex);
  return mBreakpoints.size();
}
} // namespace ldb
