#include "bflow/util/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <vector>

#include "bflow/util/error_handler.hpp"
#include "bflow/util/filesystem.hpp"
#include "bflow/util/xdg.hpp"

namespace bflow::util {

namespace {

constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;  // 5MB files
constexpr std::size_t kMaxLogFiles = 3;

void logContextualError(const ContextualError& error) {
  std::string message = fmt::format("[{}:{}] {}", static_cast<int>(error.code()),
                                    severityToString(error.severity()), error.message());

  switch (error.severity()) {
    case ErrorSeverity::kInfo:
      spdlog::info(message);
      break;
    case ErrorSeverity::kWarning:
      spdlog::warn(message);
      break;
    case ErrorSeverity::kError:
      spdlog::error(message);
      break;
    case ErrorSeverity::kCritical:
      spdlog::critical(message);
      break;
  }

  if (error.context()) {
    const auto& ctx = *error.context();
    if (!ctx.file_path.empty()) {
      spdlog::debug("  File: {}", ctx.file_path);
    }
    if (!ctx.operation.empty()) {
      spdlog::debug("  Operation: {}", ctx.operation);
    }
  }
}

}  // namespace

bool isValidLogLevel(const std::string& level) {
  static constexpr std::array<std::string_view, 7> kLevels = {
      "trace", "debug", "info", "warn", "error", "critical", "off"};
  for (auto name : kLevels) {
    if (level == name) return true;
  }
  return false;
}

Result<void> setupLogging(const LoggingOptions& options) {
  if (!isValidLogLevel(options.level)) {
    return makeErrorResult<void>(ErrorCode::kConfigError,
                                 "Unknown log level: " + options.level);
  }
  auto console_level = spdlog::level::from_str(options.level);

  std::vector<spdlog::sink_ptr> sinks;
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(console_level);
  sinks.push_back(console_sink);

  std::string file_warning;
  if (options.file) {
    auto log_file = options.file_path.empty() ? Xdg::logDir() / "bflow.log" : options.file_path;
    auto dir_result = FileSystem::createDirectories(log_file.parent_path());
    if (!dir_result.has_value()) {
      file_warning = dir_result.error().message();
    } else {
      try {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file.string(), kMaxLogFileSize, kMaxLogFiles);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
      } catch (const spdlog::spdlog_ex& e) {
        // Fall back to console-only logging
        file_warning = e.what();
      }
    }
  }

  auto logger = std::make_shared<spdlog::logger>("bflow", sinks.begin(), sinks.end());
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
  logger->set_level(options.file ? spdlog::level::debug : console_level);
  spdlog::set_default_logger(logger);

  if (!file_warning.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_warning);
  }

  ErrorHandler::instance().setErrorLogger(logContextualError);
  return {};
}

}  // namespace bflow::util
