#include "stream/tool_call_accumulator.hpp"

#include <optional>
#include <utility>

namespace model_response {

void ToolCallAccumulator::Merge(const ToolCallFragment& fragment) {
  auto it = pending_.find(fragment.index);
  if (it == pending_.end()) {
    PendingToolCall p;
    p.index = fragment.index;
    p.id = fragment.id;
    p.type = fragment.type;
    if (fragment.function) {
      p.name = fragment.function->name;
      p.arguments = fragment.function->arguments;
    }
    pending_.emplace(fragment.index, std::move(p));
    return;
  }

  auto& p = it->second;
  if (p.id.empty()) p.id = fragment.id;
  if (p.type.empty()) p.type = fragment.type;
  if (fragment.function) {
    if (p.name.empty()) p.name = fragment.function->name;
    p.arguments += fragment.function->arguments;
  }
}

void ToolCallAccumulator::Merge(const std::vector<ToolCallFragment>& fragments) {
  for (const auto& f : fragments) Merge(f);
}

const PendingToolCall* ToolCallAccumulator::Find(int index) const {
  auto it = pending_.find(index);
  if (it == pending_.end()) return nullptr;
  return &it->second;
}

bool ToolCallAccumulator::Finalize(std::vector<ToolUse>* out, bool empty_arguments_as_object, ResponseError* err) {
  std::optional<int> bad_index;
  std::string bad_name;
  for (auto& [index, p] : pending_) {
    const bool empty = p.arguments.find_first_not_of(" \t\r\n") == std::string::npos;
    Json input;
    if (empty && empty_arguments_as_object) {
      input = Json::object();
    } else {
      input = Json::parse(p.arguments, nullptr, false);
      if (input.is_discarded()) {
        if (!bad_index) {
          bad_index = index;
          bad_name = p.name;
        }
        continue;
      }
    }
    ToolUse use;
    use.id = std::move(p.id);
    use.name = std::move(p.name);
    use.input = std::move(input);
    if (out) out->push_back(std::move(use));
  }
  pending_.clear();

  if (bad_index) {
    if (err) {
      err->code = ResponseErrorCode::kMalformedToolArguments;
      err->tool_call_index = bad_index;
      err->message = "stream: tool call index " + std::to_string(*bad_index) + " (" +
                     (bad_name.empty() ? std::string("<unnamed>") : bad_name) + "): arguments are not valid json";
    }
    return false;
  }
  return true;
}

}  // namespace model_response
