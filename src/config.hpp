#pragma once

namespace model_response {

struct ResponseConfig {
  bool log_stream_events = false;
  bool empty_arguments_as_object = true;
  // Negative prints compact JSON.
  int dump_indent = 4;
};

ResponseConfig LoadConfigFromEnv();

}  // namespace model_response
