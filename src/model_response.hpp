#pragma once

#include "config.hpp"
#include "response_error.hpp"
#include "stream/chunk_source.hpp"
#include "stream/stream_decoder.hpp"
#include "tool_use.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace model_response {

// Uniform result of a model call. Either settled at construction (text and
// friends supplied by the backend) or carrying a chunk source that is decoded
// on demand, at most once.
class ModelResponse {
 public:
  ModelResponse() = default;
  explicit ModelResponse(std::string text, ResponseConfig cfg = {});
  explicit ModelResponse(std::unique_ptr<IChunkSource> stream, ResponseConfig cfg = {});
  ~ModelResponse();

  ModelResponse(const ModelResponse&) = delete;
  ModelResponse& operator=(const ModelResponse&) = delete;
  ModelResponse(ModelResponse&& other) noexcept;
  ModelResponse& operator=(ModelResponse&& other) noexcept;

  // Pass-through fields, not touched by the decoder.
  std::optional<std::vector<double>> embedding;
  std::optional<std::vector<std::string>> image_urls;
  Json raw;
  Json parsed;

  // Finalized tool invocations. Stream finalization only appends.
  std::vector<ToolUse> tool_uses;

  // Settled text. Drains the stream first when it has not been touched yet;
  // std::nullopt with *err set if that drain fails. A stream that is partly
  // pulled reports kReuseViolation; SettledText() shows its text so far.
  std::optional<std::string> Text(ResponseError* err);

  // Current settled text without touching the stream.
  const std::optional<std::string>& SettledText() const {
    return text_;
  }

  void SetText(std::string text);

  bool HasStream() const {
    return decoder_ != nullptr;
  }
  StreamState State() const;
  bool IsStreamExhausted() const;

  // Pull form of the incremental view. See StreamDecoder::Next().
  bool NextStreamItem(StreamItem* out, ResponseError* err);

  // Push form. on_item returning false stops early and abandons the stream.
  // Fails with kReuseViolation unless the stream is untouched.
  bool Stream(const std::function<bool(const StreamItem&)>& on_item, ResponseError* err);

  // Closes an open stream so no other path can drain it.
  void AbandonStream();

  Json ToJson() const;
  std::string ToString() const;

 private:
  std::optional<std::string> text_;
  std::unique_ptr<StreamDecoder> decoder_;
  ResponseConfig cfg_;
  bool stream_text_started_ = false;
};

}  // namespace model_response
