#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace model_response {

using Json = nlohmann::ordered_json;

struct ToolUse {
  std::string id;
  std::string name;
  Json input;

  Json ToJson() const {
    return Json{{"type", "tool_use"}, {"id", id}, {"name", name}, {"input", input}};
  }
};

}  // namespace model_response
