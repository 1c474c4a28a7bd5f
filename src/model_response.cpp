#include "model_response.hpp"

#include <iostream>
#include <utility>

namespace model_response {
namespace {

// raw is embedded as-is when it serializes; otherwise its lossy display form
// is used instead.
static Json RawForDisplay(const Json& raw) {
  try {
    (void)raw.dump();
    return raw;
  } catch (const Json::type_error&) {
    return Json(raw.dump(-1, ' ', false, Json::error_handler_t::replace));
  }
}

}  // namespace

ModelResponse::ModelResponse(std::string text, ResponseConfig cfg) : text_(std::move(text)), cfg_(cfg) {}

ModelResponse::ModelResponse(std::unique_ptr<IChunkSource> stream, ResponseConfig cfg) : cfg_(cfg) {
  if (stream) decoder_ = std::make_unique<StreamDecoder>(std::move(stream), cfg_);
}

ModelResponse::~ModelResponse() = default;

ModelResponse::ModelResponse(ModelResponse&& other) noexcept = default;

ModelResponse& ModelResponse::operator=(ModelResponse&& other) noexcept = default;

std::optional<std::string> ModelResponse::Text(ResponseError* err) {
  ResponseError local_err;
  if (!err) err = &local_err;
  *err = ResponseError{};

  // An open stream has emitted part of its text; handing that back would look
  // like a settled answer.
  if (decoder_ && decoder_->State() == StreamState::kOpen) {
    err->code = ResponseErrorCode::kReuseViolation;
    err->message = "response: stream is partially consumed; finish or abandon it before reading text";
    return std::nullopt;
  }
  if (text_ || !decoder_) return text_;
  if (decoder_->State() == StreamState::kExhausted) return text_;

  StreamItem item;
  while (NextStreamItem(&item, err)) {
    if (item.is_final) break;
  }
  if (!err->ok()) {
    if (cfg_.log_stream_events) std::cout << "[response] drain failed: " << err->message << "\n";
    return std::nullopt;
  }
  return text_;
}

void ModelResponse::SetText(std::string text) {
  text_ = std::move(text);
}

StreamState ModelResponse::State() const {
  return decoder_ ? decoder_->State() : StreamState::kUnopened;
}

bool ModelResponse::IsStreamExhausted() const {
  return decoder_ && decoder_->State() == StreamState::kExhausted;
}

bool ModelResponse::NextStreamItem(StreamItem* out, ResponseError* err) {
  ResponseError local_err;
  if (!err) err = &local_err;
  StreamItem local_item;
  if (!out) out = &local_item;
  if (!decoder_) {
    *err = ResponseError{};
    *out = StreamItem{};
    return false;
  }

  const bool ok = decoder_->Next(out, &tool_uses, err);
  if (ok || out->is_final) {
    if (!stream_text_started_) {
      text_ = std::string();
      stream_text_started_ = true;
    }
    text_->append(out->text);
  }
  return ok;
}

bool ModelResponse::Stream(const std::function<bool(const StreamItem&)>& on_item, ResponseError* err) {
  ResponseError local_err;
  if (!err) err = &local_err;
  *err = ResponseError{};
  if (!decoder_) return true;

  if (decoder_->State() != StreamState::kUnopened) {
    err->code = ResponseErrorCode::kReuseViolation;
    err->message = decoder_->State() == StreamState::kOpen
                       ? "response: stream is being consumed by another reader"
                       : "response: stream has been processed already; read the settled text instead";
    return false;
  }

  StreamItem item;
  while (NextStreamItem(&item, err)) {
    const bool keep = on_item ? on_item(item) : true;
    if (item.is_final) return true;
    if (!keep) {
      AbandonStream();
      return true;
    }
  }
  if (item.is_final && on_item) on_item(item);
  return err->ok();
}

void ModelResponse::AbandonStream() {
  if (decoder_) decoder_->Abandon();
}

Json ModelResponse::ToJson() const {
  Json j = Json::object();
  j["text"] = text_ ? Json(*text_) : Json(nullptr);
  j["embedding"] = embedding ? Json(*embedding) : Json(nullptr);
  j["image_urls"] = image_urls ? Json(*image_urls) : Json(nullptr);
  j["parsed"] = parsed;
  j["raw"] = RawForDisplay(raw);
  return j;
}

std::string ModelResponse::ToString() const {
  return ToJson().dump(cfg_.dump_indent, ' ', false, Json::error_handler_t::replace);
}

}  // namespace model_response
