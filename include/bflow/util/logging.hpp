#pragma once

#include <filesystem>
#include <string>

#include "bflow/common.hpp"

namespace bflow::util {

struct LoggingOptions {
  std::string level = "warn";     // spdlog level name for the console sink
  bool file = false;              // also write a rotating log file
  std::filesystem::path file_path;  // empty: Xdg::logDir() / "bflow.log"
};

/**
 * @brief Install the default spdlog logger and route ContextualErrors to it
 *
 * Console output goes to stderr so command output on stdout stays parseable.
 * Safe to call more than once; the last call wins.
 */
Result<void> setupLogging(const LoggingOptions& options);

// Validate a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
bool isValidLogLevel(const std::string& level);

}  // namespace bflow::util
