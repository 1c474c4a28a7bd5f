#include "stream/stream_decoder.hpp"

#include <iostream>
#include <optional>
#include <utility>

namespace model_response {

const char* StreamStateName(StreamState state) {
  switch (state) {
    case StreamState::kUnopened:
      return "unopened";
    case StreamState::kOpen:
      return "open";
    case StreamState::kExhausted:
      return "exhausted";
  }
  return "unknown";
}

StreamDecoder::StreamDecoder(std::unique_ptr<IChunkSource> source, ResponseConfig cfg)
    : source_(std::move(source)), cfg_(cfg) {}

bool StreamDecoder::Next(StreamItem* out, std::vector<ToolUse>* finished, ResponseError* err) {
  ResponseError local_err;
  if (!err) err = &local_err;
  *err = ResponseError{};
  StreamItem local_item;
  if (!out) out = &local_item;
  *out = StreamItem{};

  if (state_ == StreamState::kExhausted) {
    err->code = ResponseErrorCode::kReuseViolation;
    err->message = abandoned_ ? "stream: abandoned before completion and cannot be resumed"
                              : "stream: already processed; read the settled text instead";
    return false;
  }

  if (state_ == StreamState::kUnopened) {
    state_ = StreamState::kOpen;
    if (!source_) {
      state_ = StreamState::kExhausted;
      return false;
    }
    if (cfg_.log_stream_events) std::cout << "[stream] open\n";
    std::optional<StreamChunk> first;
    if (!Pull(&first, err)) return false;
    if (!first) {
      state_ = StreamState::kExhausted;
      if (cfg_.log_stream_events) std::cout << "[stream] done chunks=0 emitted=0\n";
      return false;
    }
    Absorb(*first);
  }

  std::optional<StreamChunk> chunk;
  if (!Pull(&chunk, err)) {
    out->is_final = true;
    out->text = std::move(pending_text_);
    pending_text_.clear();
    return false;
  }
  if (chunk) {
    out->is_final = false;
    out->text = std::move(pending_text_);
    emitted_++;
    Absorb(*chunk);
    return true;
  }

  state_ = StreamState::kExhausted;
  out->is_final = true;
  out->text = std::move(pending_text_);
  pending_text_.clear();
  emitted_++;

  const size_t pending_calls = tool_calls_.Size();
  if (!tool_calls_.Finalize(finished, cfg_.empty_arguments_as_object, err)) {
    if (cfg_.log_stream_events) std::cout << "[stream] finalize failed: " << err->message << "\n";
    return false;
  }
  if (cfg_.log_stream_events) {
    std::cout << "[stream] done chunks=" << chunks_ << " emitted=" << emitted_ << " tool_calls=" << pending_calls
              << "\n";
  }
  return true;
}

void StreamDecoder::Abandon() {
  if (state_ == StreamState::kExhausted) return;
  if (cfg_.log_stream_events) {
    std::cout << "[stream] abandon state=" << StreamStateName(state_) << " chunks=" << chunks_ << "\n";
  }
  state_ = StreamState::kExhausted;
  abandoned_ = true;
  pending_text_.clear();
  tool_calls_.Clear();
}

bool StreamDecoder::Pull(std::optional<StreamChunk>* chunk, ResponseError* err) {
  std::string perr;
  *chunk = source_->Next(&perr);
  if (!*chunk && !perr.empty()) {
    state_ = StreamState::kExhausted;
    tool_calls_.Clear();
    err->code = ResponseErrorCode::kUpstream;
    err->message = "stream: upstream failed after " + std::to_string(chunks_) + " chunks: " + perr;
    if (cfg_.log_stream_events) std::cout << "[stream] " << err->message << "\n";
    return false;
  }
  if (*chunk) chunks_++;
  return true;
}

void StreamDecoder::Absorb(const StreamChunk& chunk) {
  pending_text_ = ChunkText(chunk);
  if (const auto* fragments = ChunkFragments(chunk)) tool_calls_.Merge(*fragments);
}

}  // namespace model_response
