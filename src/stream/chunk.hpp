#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace model_response {

struct FunctionFragment {
  std::string name;
  std::string arguments;
};

struct ToolCallFragment {
  int index = 0;
  std::string id;
  std::string type;
  std::optional<FunctionFragment> function;
};

struct StructuredChunk {
  std::string text;
  std::vector<ToolCallFragment> tool_call_fragments;
};

// Bare text delta, or a delta carrying tool-call fragments.
using StreamChunk = std::variant<std::string, StructuredChunk>;

inline const std::string& ChunkText(const StreamChunk& chunk) {
  if (const auto* s = std::get_if<StructuredChunk>(&chunk)) return s->text;
  return std::get<std::string>(chunk);
}

inline const std::vector<ToolCallFragment>* ChunkFragments(const StreamChunk& chunk) {
  const auto* s = std::get_if<StructuredChunk>(&chunk);
  if (!s || s->tool_call_fragments.empty()) return nullptr;
  return &s->tool_call_fragments;
}

}  // namespace model_response
