#pragma once

#include <optional>
#include <string>

namespace model_response {

enum class ResponseErrorCode {
  kOk,
  kReuseViolation,
  kMalformedToolArguments,
  kUpstream,
};

struct ResponseError {
  ResponseErrorCode code = ResponseErrorCode::kOk;
  // Set for kMalformedToolArguments.
  std::optional<int> tool_call_index;
  std::string message;

  bool ok() const {
    return code == ResponseErrorCode::kOk;
  }
};

const char* ResponseErrorCodeName(ResponseErrorCode code);

}  // namespace model_response
