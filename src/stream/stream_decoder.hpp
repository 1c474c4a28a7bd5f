#pragma once

#include "config.hpp"
#include "response_error.hpp"
#include "stream/chunk_source.hpp"
#include "stream/tool_call_accumulator.hpp"
#include "tool_use.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace model_response {

enum class StreamState {
  kUnopened,
  kOpen,
  kExhausted,
};

const char* StreamStateName(StreamState state);

struct StreamItem {
  bool is_final = false;
  std::string text;
};

// One-shot decoder over an IChunkSource. Emission runs one chunk behind the
// source: a delta is handed out only after the following pull, so the item
// emitted when the source reports its end is the one marked final.
class StreamDecoder {
 public:
  StreamDecoder(std::unique_ptr<IChunkSource> source, ResponseConfig cfg);

  StreamDecoder(const StreamDecoder&) = delete;
  StreamDecoder& operator=(const StreamDecoder&) = delete;

  StreamState State() const {
    return state_;
  }
  bool Abandoned() const {
    return abandoned_;
  }
  size_t ChunksPulled() const {
    return chunks_;
  }

  // Returns true with the next item in *out. Returns false when nothing more
  // can be emitted: *err is kOk for an empty source, kReuseViolation once the
  // decoder is exhausted. On kMalformedToolArguments and on a kUpstream
  // failure after the first chunk, *out still carries the last delta with
  // is_final set. Finalized tool calls are appended to *finished.
  bool Next(StreamItem* out, std::vector<ToolUse>* finished, ResponseError* err);

  // Gives up on an open stream. Later Next() calls report kReuseViolation.
  void Abandon();

 private:
  bool Pull(std::optional<StreamChunk>* chunk, ResponseError* err);
  void Absorb(const StreamChunk& chunk);

  std::unique_ptr<IChunkSource> source_;
  ResponseConfig cfg_;
  ToolCallAccumulator tool_calls_;
  std::string pending_text_;
  StreamState state_ = StreamState::kUnopened;
  bool abandoned_ = false;
  size_t chunks_ = 0;
  size_t emitted_ = 0;
};

}  // namespace model_response
