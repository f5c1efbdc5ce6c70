#include "reclaim/util/Config.hpp"
#include "reclaim/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

namespace reclaim {
namespace util {

namespace {

// Durations beyond a century are pinned there; they still fit a
// nanosecond clock when added to the current time.
constexpr int64_t kMaxDurationMs = int64_t(100) * 365 * 24 * 3600 * 1000;

bool parseInt64(const std::string& s, int64_t& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || !end || *end != '\0') return false;
  out = static_cast<int64_t>(v);
  return true;
}

} // namespace

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

bool Config::loadFromFile(const std::string& path) {
  // Simple INI-ish parser: key=value per line, '#' or ';' start comments.
  // Unknown keys are ignored so new knobs don't break older builds.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(1024);

  while (true) {
    char tmp[1024];
    if (!std::fgets(tmp, sizeof(tmp), f)) break;
    line.assign(tmp);

    // Strip CR/LF
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue; // comment

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;

    int64_t n = 0;
    if (key == "forceTimeoutMs") {
      if (parseInt64(val, n) && n >= 0) forceTimeoutMs = std::min(n, kMaxDurationMs);
    } else if (key == "cleanupIntervalMs") {
      if (parseInt64(val, n)) cleanupIntervalMs = std::clamp<int64_t>(n, 1, kMaxDurationMs);
    } else if (key == "maxContainerDepth") {
      if (parseInt64(val, n)) {
        maxContainerDepth = static_cast<int>(std::clamp<int64_t>(n, 1, std::numeric_limits<int>::max()));
      }
    } else if (key == "logLevel") {
      logLevel = val;
    } else if (key == "logFormat") {
      if (val == "text" || val == "json") logFormat = val;
    } else if (key == "logFile") {
      logFile = val;
    } else if (key == "taskStorePath") {
      taskStorePath = val;
    } else if (key == "modelUUID") {
      modelUUID = val;
    }
  }

  std::fclose(f);
  return true;
}

void configureLogger(const Config& cfg) {
  logger().setLevel(parseLevel(cfg.logLevel));
  logger().setFormatJson(cfg.logFormat == "json");
  logger().setFile(cfg.logFile);
}

} // namespace util
} // namespace reclaim
