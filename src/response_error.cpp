#include "response_error.hpp"

namespace model_response {

const char* ResponseErrorCodeName(ResponseErrorCode code) {
  switch (code) {
    case ResponseErrorCode::kOk:
      return "ok";
    case ResponseErrorCode::kReuseViolation:
      return "reuse_violation";
    case ResponseErrorCode::kMalformedToolArguments:
      return "malformed_tool_arguments";
    case ResponseErrorCode::kUpstream:
      return "upstream";
  }
  return "unknown";
}

}  // namespace model_response
