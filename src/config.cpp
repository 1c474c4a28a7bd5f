#include "config.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>

namespace model_response {
namespace {

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static bool TryParseInt(const std::string& s, int* out) {
  if (!out || s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (!end || *end != '\0' || errno == ERANGE) return false;
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
  *out = static_cast<int>(v);
  return true;
}

}  // namespace

ResponseConfig LoadConfigFromEnv() {
  ResponseConfig cfg;

  if (auto v = GetEnvStr("RESPONSE_LOG_STREAM"); !v.empty()) {
    bool b = false;
    if (TryParseBool(v, &b)) cfg.log_stream_events = b;
  }
  if (auto v = GetEnvStr("RESPONSE_EMPTY_ARGS_AS_OBJECT"); !v.empty()) {
    bool b = false;
    if (TryParseBool(v, &b)) cfg.empty_arguments_as_object = b;
  }
  if (auto v = GetEnvStr("RESPONSE_DUMP_INDENT"); !v.empty()) {
    int n = 0;
    if (TryParseInt(v, &n)) cfg.dump_indent = n;
  }

  return cfg;
}

}  // namespace model_response
