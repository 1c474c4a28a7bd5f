#pragma once

#include "response_error.hpp"
#include "stream/chunk.hpp"
#include "tool_use.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace model_response {

struct PendingToolCall {
  int index = 0;
  std::string id;
  std::string type;
  std::string name;
  std::string arguments;
};

// Merges tool-call fragments by index until the stream ends. Arguments of one
// index are concatenated strictly in arrival order.
class ToolCallAccumulator {
 public:
  void Merge(const ToolCallFragment& fragment);
  void Merge(const std::vector<ToolCallFragment>& fragments);

  bool Empty() const {
    return pending_.empty();
  }
  size_t Size() const {
    return pending_.size();
  }
  const PendingToolCall* Find(int index) const;

  // Parses every pending entry in index order and appends the valid ones to
  // *out. Returns false if any entry's arguments is not valid JSON; *err then
  // names the first such index. Pending entries are cleared either way.
  // With empty_arguments_as_object set (the ResponseConfig default), an entry
  // whose arguments is empty or whitespace finalizes with input {} rather than
  // failing; pass false to treat it as malformed.
  bool Finalize(std::vector<ToolUse>* out, bool empty_arguments_as_object, ResponseError* err);

  void Clear() {
    pending_.clear();
  }

 private:
  std::map<int, PendingToolCall> pending_;
};

}  // namespace model_response
