#pragma once

#include "config.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace model_response {

constexpr int kReplayOk = 0;
constexpr int kReplayOpenFailed = 1;
constexpr int kReplayDecodeFailed = 2;

// Streams JSON-lines chunks from *in through a ModelResponse, writing the
// deltas, finalized tool uses and the diagnostic form to *out.
int ReplayStream(std::istream* in, const ResponseConfig& cfg, std::ostream* out);

// "-" reads stdin.
int ReplayPath(const std::string& path, const ResponseConfig& cfg, std::ostream* out);

}  // namespace model_response
