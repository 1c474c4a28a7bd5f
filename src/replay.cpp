#include "replay.hpp"

#include "model_response.hpp"
#include "stream/chunk_source.hpp"

#include <fstream>
#include <iostream>
#include <memory>

namespace model_response {

int ReplayStream(std::istream* in, const ResponseConfig& cfg, std::ostream* out) {
  ModelResponse response(std::make_unique<JsonLinesChunkSource>(in), cfg);

  ResponseError err;
  bool ok = response.Stream(
      [out](const StreamItem& item) {
        *out << item.text;
        if (item.is_final) *out << "\n";
        return true;
      },
      &err);

  *out << "[replay] exhausted=" << (response.IsStreamExhausted() ? "true" : "false")
       << " tool_uses=" << response.tool_uses.size() << "\n";
  for (const auto& use : response.tool_uses) {
    *out << "[tool-use] " << use.ToJson().dump() << "\n";
  }
  *out << response.ToString() << "\n";

  if (!ok) {
    *out << "[replay] error code=" << ResponseErrorCodeName(err.code) << " " << err.message << "\n";
    return kReplayDecodeFailed;
  }
  return kReplayOk;
}

int ReplayPath(const std::string& path, const ResponseConfig& cfg, std::ostream* out) {
  *out << "[replay] input=" << (path == "-" ? "<stdin>" : path) << "\n";
  if (path == "-") return ReplayStream(&std::cin, cfg, out);

  std::ifstream file(path);
  if (!file) {
    *out << "[replay] failed to open " << path << "\n";
    return kReplayOpenFailed;
  }
  return ReplayStream(&file, cfg, out);
}

}  // namespace model_response
