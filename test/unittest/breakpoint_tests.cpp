#include <bp_spec.h>
#include <gtest/gtest.h>
#include <session/breakpoint_synchronizer.h>
#include <session/protocol_driver.h>
#include <vector>

using namespace ldb;

namespace {
struct WireCall
{
  bool mAdd;
  BreakpointDescriptor mDescriptor;
  std::vector<BreakpointDescriptor> mSameFile;
};

class FakeWire final : public BreakpointWire
{
public:
  void
  SendAddBreakpoint(const BreakpointDescriptor &added, std::span<const BreakpointDescriptor> sameFile) noexcept final
  {
    mCalls.push_back({ true, added, { sameFile.begin(), sameFile.end() } });
  }

  void
  SendRemoveBreakpoint(
    const BreakpointDescriptor &removed, std::span<const BreakpointDescriptor> sameFile) noexcept final
  {
    mCalls.push_back({ false, removed, { sameFile.begin(), sameFile.end() } });
  }

  std::vector<WireCall> mCalls{};
};

BreakpointDescriptor
At(std::string file, u32 line)
{
  return BreakpointDescriptor{ .mFilePath = std::move(file), .mLine = line };
}
} // namespace

TEST(BreakpointStore, SameLineReplaces)
{
  BreakpointStore store{};
  store.Add(At("a.lua", 3));
  auto conditional = At("a.lua", 3);
  conditional.mCondition = "x > 1";
  store.Add(conditional);
  store.Add(At("a.lua", 4));
  EXPECT_EQ(store.Count(), 2u);
  auto found = store.Find("a.lua", 3);
  ASSERT_TRUE(found);
  EXPECT_EQ(found->Descriptor().mCondition, "x > 1");
  EXPECT_TRUE(store.Remove("a.lua", 3));
  EXPECT_FALSE(store.Remove("a.lua", 3));
  EXPECT_EQ(store.Count(), 1u);
}

TEST(BreakpointSynchronizer, HandlesStartAtZeroAndAreUnique)
{
  FakeWire wire{};
  BreakpointSynchronizer sync{ wire };
  SourceBreakpoint first{ At("a.lua", 1) };
  SourceBreakpoint second{ At("a.lua", 2) };
  EXPECT_EQ(sync.Register(first), 0u);
  EXPECT_EQ(sync.Register(second), 1u);
  EXPECT_EQ(first.Handle(), 0u);
  EXPECT_EQ(second.Handle(), 1u);
  EXPECT_EQ(sync.NextHandle(), 2u);
  ASSERT_EQ(wire.mCalls.size(), 2u);
  // Each add carries the file's whole set.
  EXPECT_EQ(wire.mCalls[1].mSameFile.size(), 2u);
}

TEST(BreakpointSynchronizer, RegisteringTwiceIsANoOp)
{
  FakeWire wire{};
  BreakpointSynchronizer sync{ wire };
  SourceBreakpoint bp{ At("a.lua", 1) };
  const auto handle = sync.Register(bp);
  EXPECT_EQ(sync.Register(bp), handle);
  EXPECT_EQ(wire.mCalls.size(), 1u);
  EXPECT_EQ(sync.RegisteredCount(), 1u);
}

TEST(BreakpointSynchronizer, UnregisterSendsRemainingSet)
{
  FakeWire wire{};
  BreakpointSynchronizer sync{ wire };
  SourceBreakpoint one{ At("a.lua", 1) };
  SourceBreakpoint two{ At("a.lua", 2) };
  SourceBreakpoint other{ At("b.lua", 9) };
  sync.Register(one);
  sync.Register(two);
  sync.Register(other);

  EXPECT_TRUE(sync.Unregister(one));
  EXPECT_FALSE(one.Handle().has_value());
  ASSERT_FALSE(wire.mCalls.back().mAdd);
  EXPECT_EQ(wire.mCalls.back().mDescriptor, At("a.lua", 1));
  ASSERT_EQ(wire.mCalls.back().mSameFile.size(), 1u);
  EXPECT_EQ(wire.mCalls.back().mSameFile.front(), At("a.lua", 2));

  EXPECT_TRUE(sync.Unregister(two));
  EXPECT_TRUE(wire.mCalls.back().mSameFile.empty());
}

TEST(BreakpointSynchronizer, UnregisterWithoutHandleIsNotAnError)
{
  FakeWire wire{};
  BreakpointSynchronizer sync{ wire };
  SourceBreakpoint bp{ At("a.lua", 1) };
  EXPECT_FALSE(sync.Unregister(bp));
  EXPECT_TRUE(wire.mCalls.empty());
}

TEST(BreakpointSynchronizer, ResyncDiscardsHandlesFromEarlierSessions)
{
  BreakpointStore store{};
  auto a = store.Add(At("a.lua", 1));
  auto b = store.Add(At("b.lua", 2));

  FakeWire firstWire{};
  BreakpointSynchronizer first{ firstWire };
  EXPECT_EQ(first.Resync(store), 2u);
  ASSERT_TRUE(b->Handle().has_value());

  // A second session starts numbering over and never resolves the first one's handles.
  FakeWire secondWire{};
  BreakpointSynchronizer second{ secondWire };
  second.Reset(store);
  EXPECT_FALSE(a->Handle().has_value());
  EXPECT_FALSE(b->Handle().has_value());
  EXPECT_FALSE(second.Unregister(*a));
  EXPECT_EQ(second.Resync(store), 2u);
  EXPECT_EQ(secondWire.mCalls.size(), 2u);
  EXPECT_EQ(second.NextHandle(), 2u);
}

TEST(BreakpointSynchronizer, ConditionAndLogMessageBothSurvive)
{
  FakeWire wire{};
  BreakpointSynchronizer sync{ wire };
  auto descriptor = At("a.lua", 5);
  descriptor.mCondition = "i == 3";
  descriptor.mLogMessage = "i is {i}";
  SourceBreakpoint bp{ descriptor };
  const auto handle = sync.Register(bp);
  auto registered = sync.Lookup(handle);
  ASSERT_TRUE(registered);
  EXPECT_EQ(registered->mCondition, "i == 3");
  EXPECT_TRUE(registered->IsLogPoint());

  auto emmy = EmmyDriver::BreakpointToWire(*registered);
  EXPECT_EQ(emmy["file"], "a.lua");
  EXPECT_EQ(emmy["line"], 5);
  EXPECT_EQ(emmy["condition"], "i == 3");
  EXPECT_EQ(emmy["logMessage"], "i is {i}");

  std::vector<BreakpointDescriptor> set{ *registered };
  auto panda = LuaPandaDriver::BreakpointsToWire("a.lua", set);
  EXPECT_EQ(panda["path"], "a.lua");
  ASSERT_EQ(panda["bks"].size(), 1u);
  EXPECT_EQ(panda["bks"][0]["line"], 5);
  EXPECT_EQ(panda["bks"][0]["condition"], "i == 3");
  EXPECT_EQ(panda["bks"][0]["logMessage"], "i is {i}");
}

TEST(BreakpointSynchronizer, EmptySetClearsFileForLineJsonPeers)
{
  auto cleared = LuaPandaDriver::BreakpointsToWire("a.lua", {});
  EXPECT_TRUE(cleared["bks"].is_array());
  EXPECT_TRUE(cleared["bks"].empty());
}
