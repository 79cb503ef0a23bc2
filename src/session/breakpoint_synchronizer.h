/** LICENSE TEMPLATE */
#pragma once
#include <bp_spec.h>
#include <map>
#include <span>

namespace ldb {

/// Puts breakpoint changes on the wire. `sameFile` holds every breakpoint registered for the same file after
/// the change, for protocols that replace a file's breakpoints wholesale.
class BreakpointWire
{
public:
  virtual ~BreakpointWire() noexcept = default;
  virtual void SendAddBreakpoint(
    const BreakpointDescriptor &added, std::span<const BreakpointDescriptor> sameFile) noexcept = 0;
  virtual void SendRemoveBreakpoint(
    const BreakpointDescriptor &removed, std::span<const BreakpointDescriptor> sameFile) noexcept = 0;
};

/// Maps IDE breakpoints to the descriptors registered with one connected peer. Handles are only meaningful
/// between two Resets; every connection starts with a Reset so that handles left on breakpoint objects by a
/// previous session never resolve.
/// Not thread safe; owned and used by the session thread.
class BreakpointSynchronizer
{
  BreakpointWire &mWire;
  BreakpointHandle mNextHandle{ 0 };
  std::map<BreakpointHandle, BreakpointDescriptor> mRegistered{};

public:
  explicit BreakpointSynchronizer(BreakpointWire &wire) noexcept;

  // Forgets every handle, restarts numbering at 0 and strips handles from all of `source`'s breakpoints.
  void Reset(BreakpointSource &source) noexcept;
  // Reset, then Register everything `source` has. Returns the number registered.
  u32 Resync(BreakpointSource &source) noexcept;

  BreakpointHandle Register(SourceBreakpoint &breakpoint) noexcept;
  // A breakpoint without a live handle is not an error; there is nothing to remove.
  bool Unregister(SourceBreakpoint &breakpoint) noexcept;

  std::optional<BreakpointDescriptor> Lookup(BreakpointHandle handle) const noexcept;
  BreakpointHandle NextHandle() const noexcept;
  size_t RegisteredCount() const noexcept;
  std::vector<BreakpointDescriptor> DescriptorsForFile(std::string_view filePath) const noexcept;
};
} // namespace ldb
