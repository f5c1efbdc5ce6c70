#pragma once

#include <cstdint>
#include <string>

namespace reclaim {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Delay before a force backstop cleanup becomes eligible.
  int64_t forceTimeoutMs    = 60000;
  // Period of the cleanup worker between drain passes.
  int64_t cleanupIntervalMs = 10000;
  // Maximum machine -> container nesting walked by forced machine teardown.
  int     maxContainerDepth = 32;

  std::string logLevel  = "info";
  std::string logFormat = "text";  // text | json
  std::string logFile;             // empty -> stdout

  std::string taskStorePath;       // empty -> in-memory only
  std::string modelUUID;

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
};

// Applies logLevel / logFormat / logFile to the process logger.
void configureLogger(const Config& cfg);

} // namespace util
} // namespace reclaim
