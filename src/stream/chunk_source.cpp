#include "stream/chunk_source.hpp"

#include "tool_use.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace model_response {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string Trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n')) b++;
  size_t e = s.size();
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r' || s[e - 1] == '\n')) e--;
  return s.substr(b, e - b);
}

static std::string ArgumentsText(const Json& a) {
  if (a.is_string()) return a.get<std::string>();
  if (a.is_null()) return "";
  return a.dump();
}

static bool IndexInRange(const Json& v, int* out) {
  if (v.is_number_unsigned()) {
    const auto u = v.get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<int>::max())) return false;
    *out = static_cast<int>(u);
    return true;
  }
  const auto n = v.get<int64_t>();
  if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) return false;
  *out = static_cast<int>(n);
  return true;
}

static bool ParseToolCallFragments(const Json& arr, std::vector<ToolCallFragment>* out, std::string* err) {
  if (arr.is_null()) return true;
  if (!arr.is_array()) {
    if (err) *err = "tool_calls is not an array";
    return false;
  }
  for (size_t i = 0; i < arr.size(); i++) {
    const auto& tc = arr[i];
    if (!tc.is_object()) {
      if (err) *err = "tool_calls[" + std::to_string(i) + "] is not an object";
      return false;
    }
    ToolCallFragment f;
    f.index = static_cast<int>(i);
    if (tc.contains("index") && tc["index"].is_number_integer()) {
      if (!IndexInRange(tc["index"], &f.index)) {
        if (err) *err = "tool_calls[" + std::to_string(i) + "].index out of range";
        return false;
      }
    }
    if (tc.contains("id") && tc["id"].is_string()) f.id = tc["id"].get<std::string>();
    if (tc.contains("type") && tc["type"].is_string()) f.type = tc["type"].get<std::string>();
    if (tc.contains("function") && tc["function"].is_object()) {
      const auto& fn = tc["function"];
      FunctionFragment ff;
      if (fn.contains("name") && fn["name"].is_string()) ff.name = fn["name"].get<std::string>();
      if (fn.contains("arguments")) ff.arguments = ArgumentsText(fn["arguments"]);
      f.function = std::move(ff);
    }
    out->push_back(std::move(f));
  }
  return true;
}

}  // namespace

VectorChunkSource::VectorChunkSource(std::vector<StreamChunk> chunks) : chunks_(std::move(chunks)) {}

std::optional<StreamChunk> VectorChunkSource::Next(std::string* /*err*/) {
  pulls_++;
  if (pos_ >= chunks_.size()) return std::nullopt;
  return chunks_[pos_++];
}

CallbackChunkSource::CallbackChunkSource(ChunkPullFn pull) : pull_(std::move(pull)) {}

std::optional<StreamChunk> CallbackChunkSource::Next(std::string* err) {
  if (done_ || !pull_) return std::nullopt;
  auto chunk = pull_(err);
  if (!chunk) done_ = true;
  return chunk;
}

JsonLinesChunkSource::JsonLinesChunkSource(std::istream* in) : in_(in) {}

std::optional<StreamChunk> JsonLinesChunkSource::Next(std::string* err) {
  if (done_ || !in_) return std::nullopt;
  std::string line;
  while (std::getline(*in_, line)) {
    line_no_++;
    auto s = Trim(line);
    if (s.empty() || s.front() == ':') continue;
    if (StartsWith(s, "data:")) s = Trim(s.substr(5));
    if (s == "[DONE]") break;
    std::string perr;
    auto chunk = ParseChunkLine(s, &perr);
    if (!chunk) {
      done_ = true;
      if (err) *err = "jsonl: line " + std::to_string(line_no_) + ": " + perr;
      return std::nullopt;
    }
    return chunk;
  }
  done_ = true;
  if (in_->bad() && err) *err = "jsonl: read failed after line " + std::to_string(line_no_);
  return std::nullopt;
}

std::optional<StreamChunk> ParseChunkLine(const std::string& line, std::string* err) {
  auto j = Json::parse(line, nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "invalid json";
    return std::nullopt;
  }
  if (j.is_string()) return StreamChunk(j.get<std::string>());
  if (!j.is_object()) {
    if (err) *err = "chunk must be a string or an object";
    return std::nullopt;
  }

  StructuredChunk out;
  if (j.contains("choices")) {
    if (!j["choices"].is_array()) {
      if (err) *err = "choices is not an array";
      return std::nullopt;
    }
    // Usage-only chunks carry an empty choices array.
    if (j["choices"].empty()) return StreamChunk(std::move(out));
    const auto& choice = j["choices"][0];
    if (!choice.is_object() || !choice.contains("delta") || !choice["delta"].is_object()) {
      if (err) *err = "choices[0].delta missing";
      return std::nullopt;
    }
    const auto& delta = choice["delta"];
    if (delta.contains("content") && delta["content"].is_string()) out.text = delta["content"].get<std::string>();
    if (delta.contains("tool_calls") && !ParseToolCallFragments(delta["tool_calls"], &out.tool_call_fragments, err)) {
      return std::nullopt;
    }
    return StreamChunk(std::move(out));
  }

  if (!j.contains("text") && !j.contains("tool_calls")) {
    if (err) *err = "chunk has neither text nor tool_calls";
    return std::nullopt;
  }
  if (j.contains("text")) {
    if (j["text"].is_string()) {
      out.text = j["text"].get<std::string>();
    } else if (!j["text"].is_null()) {
      if (err) *err = "text is not a string";
      return std::nullopt;
    }
  }
  if (j.contains("tool_calls") && !ParseToolCallFragments(j["tool_calls"], &out.tool_call_fragments, err)) {
    return std::nullopt;
  }
  return StreamChunk(std::move(out));
}

}  // namespace model_response
