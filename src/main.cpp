#include "config.hpp"
#include "replay.hpp"

#include <iostream>
#include <string>

namespace {

static void PrintUsage(const char* argv0) {
  std::cout << "usage: " << argv0 << " [chunks.jsonl|-]\n"
            << "Replays a JSON-lines chunk stream through a model response and prints the result.\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::cout.setf(std::ios::unitbuf);
  auto cfg = model_response::LoadConfigFromEnv();

  std::string path = "-";
  if (argc > 1) {
    const std::string arg = argv[1];
    if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    }
    path = arg;
  }

  std::cout << "[replay] log_stream=" << (cfg.log_stream_events ? "true" : "false")
            << " empty_args_as_object=" << (cfg.empty_arguments_as_object ? "true" : "false")
            << " dump_indent=" << cfg.dump_indent << "\n";

  return model_response::ReplayPath(path, cfg, &std::cout);
}
