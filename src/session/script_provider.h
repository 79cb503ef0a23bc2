/** LICENSE TEMPLATE */
#pragma once
#include <common.h>
#include <optional>
#include <string>

namespace ldb {

/// Returns script source by logical path, e.g. "debugger/emmy/emmyHelper.lua".
class ScriptProvider
{
public:
  virtual ~ScriptProvider() noexcept = default;
  virtual std::optional<std::string> ReadScript(std::string_view logicalPath) noexcept = 0;
};

/// Resolves logical paths under a root directory.
class FileScriptProvider final : public ScriptProvider
{
  Path mRoot;

public:
  explicit FileScriptProvider(Path root) noexcept;
  std::optional<std::string> ReadScript(std::string_view logicalPath) noexcept final;
};

static constexpr std::string_view kEmmyHelperScript = "debugger/emmy/emmyHelper.lua";
static constexpr std::string_view kDefaultTypeRegistryScript = "debugger/emmy/emmyHelper_ue.lua";
static constexpr std::string_view kTypeRegistryPlaceholder = "-- [EMMY_HELPER_INIT_CONTENT]";

// The Emmy bootstrap script with the type registry spliced in. Nothing when the main script is missing.
std::optional<std::string> BuildEmmyHelperScript(
  ScriptProvider &provider, const std::optional<Path> &typeRegistryScript) noexcept;
} // namespace ldb
