/** LICENSE TEMPLATE */
#include "stack_frame.h"
#include <utils/util.h>

namespace ldb {

namespace {
std::string
StringField(const Dict &object, const char *key) noexcept
{
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return {};
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}

// LuaPanda sends numbers both as JSON numbers and as strings.
i64
IntegerField(const Dict &object, const char *key, i64 fallback = 0) noexcept
{
  const auto it = object.find(key);
  if (it == object.end()) {
    return fallback;
  }
  if (it->is_number_integer()) {
    return it->get<i64>();
  }
  if (it->is_number()) {
    return static_cast<i64>(it->get<double>());
  }
  if (it->is_string()) {
    return ParseInteger<i64>(TrimWhitespace(it->get_ref<const std::string &>())).value_or(fallback);
  }
  return fallback;
}

template <typename Parse>
std::vector<Variable>
VariableList(const Dict &object, const char *key, Parse &&parse) noexcept
{
  std::vector<Variable> variables{};
  const auto it = object.find(key);
  if (it == object.end() || !it->is_array()) {
    return variables;
  }
  variables.reserve(it->size());
  for (const auto &value : *it) {
    if (value.is_object()) {
      variables.push_back(parse(value));
    }
  }
  return variables;
}
} // namespace

/* static */
Variable
Variable::FromEmmy(const Dict &value) noexcept
{
  return Variable{ .mName = StringField(value, "name"),
                   .mValue = StringField(value, "value"),
                   .mTypeName = StringField(value, "valueTypeName"),
                   .mChildRef = IntegerField(value, "cacheId"),
                   .mChildren = VariableList(value, "children", &Variable::FromEmmy) };
}

/* static */
Variable
Variable::FromLuaPanda(const Dict &value) noexcept
{
  return Variable{ .mName = StringField(value, "name"),
                   .mValue = StringField(value, "value"),
                   .mTypeName = StringField(value, "type"),
                   .mChildRef = IntegerField(value, "variablesReference"),
                   .mChildren = VariableList(value, "children", &Variable::FromLuaPanda) };
}

/* static */
StackFrameSnapshot
StackFrameSnapshot::FromEmmy(const Dict &frame) noexcept
{
  return StackFrameSnapshot{ .mFile = StringField(frame, "file"),
                             .mLine = static_cast<i32>(IntegerField(frame, "line")),
                             .mFunctionName = StringField(frame, "functionName"),
                             .mIndex = static_cast<i32>(IntegerField(frame, "level")),
                             .mLocals = VariableList(frame, "localVariables", &Variable::FromEmmy),
                             .mUpvalues = VariableList(frame, "upvalueVariables", &Variable::FromEmmy) };
}

/* static */
StackFrameSnapshot
StackFrameSnapshot::FromLuaPanda(const Dict &frame) noexcept
{
  auto name = StringField(frame, "name");
  if (name.empty()) {
    name = StringField(frame, "functionName");
  }
  return StackFrameSnapshot{ .mFile = StringField(frame, "file"),
                             .mLine = static_cast<i32>(IntegerField(frame, "line")),
                             .mFunctionName = std::move(name),
                             .mIndex = static_cast<i32>(IntegerField(frame, "index")),
                             .mOriginalPath = StringField(frame, "oPath"),
                             .mLocals = VariableList(frame, "locals", &Variable::FromLuaPanda),
                             .mUpvalues = VariableList(frame, "upvalues", &Variable::FromLuaPanda) };
}

std::vector<StackFrameSnapshot>
ParseEmmyStacks(const Dict &payload) noexcept
{
  std::vector<StackFrameSnapshot> frames{};
  const auto stacks = payload.find("stacks");
  if (stacks == payload.end() || !stacks->is_array()) {
    return frames;
  }
  for (const auto &frame : *stacks) {
    if (frame.is_object()) {
      frames.push_back(StackFrameSnapshot::FromEmmy(frame));
    }
  }
  return frames;
}

std::vector<StackFrameSnapshot>
ParseLuaPandaStacks(const WireMessage &message) noexcept
{
  const Dict *stack = nullptr;
  if (auto it = message.mEnvelope.find("stack"); message.mEnvelope.is_object() && it != message.mEnvelope.end()) {
    stack = &*it;
  } else if (message.mPayload.is_array()) {
    stack = &message.mPayload;
  } else if (auto it = message.mPayload.find("stack");
             message.mPayload.is_object() && it != message.mPayload.end()) {
    stack = &*it;
  }

  std::vector<StackFrameSnapshot> frames{};
  if (stack == nullptr || !stack->is_array()) {
    return frames;
  }
  for (const auto &frame : *stack) {
    if (frame.is_object()) {
      frames.push_back(StackFrameSnapshot::FromLuaPanda(frame));
    }
  }
  return frames;
}

size_t
SelectTopFrame(std::span<const StackFrameSnapshot> frames) noexcept
{
  for (size_t i = 0; i < frames.size(); ++i) {
    if (frames[i].HasSourceLocation()) {
      return i;
    }
  }
  for (size_t i = 0; i < frames.size(); ++i) {
    if (frames[i].mLine > 0) {
      return i;
    }
  }
  return 0;
}
} // namespace ldb
