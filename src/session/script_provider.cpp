/** LICENSE TEMPLATE */
#include "script_provider.h"
#include <fstream>
#include <sstream>
#include <utils/logger.h>

namespace ldb {

namespace {
std::optional<std::string>
ReadWholeFile(const Path &path) noexcept
{
  std::ifstream file{ path, std::ios::binary };
  if (!file) {
    return std::nullopt;
  }
  std::stringstream contents;
  contents << file.rdbuf();
  return std::move(contents).str();
}
} // namespace

FileScriptProvider::FileScriptProvider(Path root) noexcept : mRoot(std::move(root)) {}

std::optional<std::string>
FileScriptProvider::ReadScript(std::string_view logicalPath) noexcept
{
  auto script = ReadWholeFile(mRoot / logicalPath);
  if (!script) {
    DBGLOG(session, "script {} not found under {}", logicalPath, mRoot.string());
  }
  return script;
}

std::optional<std::string>
BuildEmmyHelperScript(ScriptProvider &provider, const std::optional<Path> &typeRegistryScript) noexcept
{
  auto helper = provider.ReadScript(kEmmyHelperScript);
  if (!helper) {
    return std::nullopt;
  }

  std::optional<std::string> custom{};
  if (typeRegistryScript) {
    custom = ReadWholeFile(*typeRegistryScript);
    if (!custom) {
      DBGLOG(warning, "type registry script {} could not be read", typeRegistryScript->string());
    }
  }

  std::string registry{};
  if (custom) {
    registry = std::format("-- Type registry: {}\n{}", typeRegistryScript->string(), *custom);
  } else if (auto fallback = provider.ReadScript(kDefaultTypeRegistryScript); fallback) {
    registry = std::format("-- Type registry: {}\n{}", kDefaultTypeRegistryScript, *fallback);
  } else {
    registry = "-- No type registry script loaded";
  }

  if (auto at = helper->find(kTypeRegistryPlaceholder); at != std::string::npos) {
    helper->replace(at, kTypeRegistryPlaceholder.size(), registry);
  } else {
    DBGLOG(session, "{} has no type registry placeholder", kEmmyHelperScript);
  }
  return helper;
}
} // namespace ldb
