/** LICENSE TEMPLATE */
#pragma once
#include <common.h>
#include <interface/wire/wire_message.h>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ldb {

struct Variable
{
  std::string mName;
  // Rendered value, as the peer printed it.
  std::string mValue;
  std::string mTypeName;
  // Key for a lazy child fetch. Emmy calls it cacheId, LuaPanda variablesReference. Zero means "no children".
  i64 mChildRef{ 0 };
  std::vector<Variable> mChildren{};

  bool
  HasChildren() const noexcept
  {
    return mChildRef != 0 || !mChildren.empty();
  }

  static Variable FromEmmy(const Dict &value) noexcept;
  static Variable FromLuaPanda(const Dict &value) noexcept;
};

/// One frame of a break notification. Never modified after construction.
struct StackFrameSnapshot
{
  std::string mFile;
  // 1-based, 0 or negative when the peer could not tell.
  i32 mLine{ 0 };
  std::string mFunctionName;
  // Emmy "level", LuaPanda "index".
  i32 mIndex{ 0 };
  // LuaPanda sends the original path next to the resolved one.
  std::string mOriginalPath{};
  std::vector<Variable> mLocals{};
  std::vector<Variable> mUpvalues{};

  // C functions report "[C]" and chunks loaded from strings start with '='. Neither maps to a file.
  bool
  HasSourceLocation() const noexcept
  {
    return !mFile.empty() && mFile != "[C]" && !mFile.starts_with('=') && mLine > 0;
  }

  static StackFrameSnapshot FromEmmy(const Dict &frame) noexcept;
  static StackFrameSnapshot FromLuaPanda(const Dict &frame) noexcept;
};

// Emmy BreakNotify {stacks: [...]}.
std::vector<StackFrameSnapshot> ParseEmmyStacks(const Dict &payload) noexcept;
// LuaPanda carries the frames in a top level "stack" array or as the info array itself.
std::vector<StackFrameSnapshot> ParseLuaPandaStacks(const WireMessage &message) noexcept;

// Index of the frame the UI should show: the first with a resolvable source, else the first with a positive
// line, else 0. `frames` must not be empty.
size_t SelectTopFrame(std::span<const StackFrameSnapshot> frames) noexcept;
} // namespace ldb
