#pragma once

#include "stream/chunk.hpp"

#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace model_response {

// Pull side of a backend stream. Next() returns the following chunk, or
// std::nullopt once the stream ended. A failed pull also returns std::nullopt
// and fills *err.
class IChunkSource {
 public:
  virtual ~IChunkSource() = default;

  virtual std::optional<StreamChunk> Next(std::string* err) = 0;
};

class VectorChunkSource : public IChunkSource {
 public:
  explicit VectorChunkSource(std::vector<StreamChunk> chunks);

  std::optional<StreamChunk> Next(std::string* err) override;

  // Number of Next() calls made so far, including the one that hit the end.
  size_t Pulls() const {
    return pulls_;
  }

 private:
  std::vector<StreamChunk> chunks_;
  size_t pos_ = 0;
  size_t pulls_ = 0;
};

using ChunkPullFn = std::function<std::optional<StreamChunk>(std::string* err)>;

class CallbackChunkSource : public IChunkSource {
 public:
  explicit CallbackChunkSource(ChunkPullFn pull);

  std::optional<StreamChunk> Next(std::string* err) override;

 private:
  ChunkPullFn pull_;
  bool done_ = false;
};

// Reads one chunk per line. Accepted lines:
//   "text"                                  plain text delta
//   {"text": "...", "tool_calls": [...]}    structured delta
//   {"choices": [{"delta": {...}}], ...}    chat.completion.chunk
// An optional "data: " prefix is stripped and "data: [DONE]" ends the stream.
// Blank lines and lines starting with ':' are skipped.
class JsonLinesChunkSource : public IChunkSource {
 public:
  explicit JsonLinesChunkSource(std::istream* in);

  std::optional<StreamChunk> Next(std::string* err) override;

  size_t LineNumber() const {
    return line_no_;
  }

 private:
  std::istream* in_;
  size_t line_no_ = 0;
  bool done_ = false;
};

// Parses a single JSON-lines record. Returns std::nullopt with *err set when
// the line is not a chunk.
std::optional<StreamChunk> ParseChunkLine(const std::string& line, std::string* err);

}  // namespace model_response
