#include "bflow/util/error_handler.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

namespace bflow::util {

std::string_view severityToString(ErrorSeverity severity) {
  switch (severity) {
    case ErrorSeverity::kInfo:
      return "info";
    case ErrorSeverity::kWarning:
      return "warning";
    case ErrorSeverity::kError:
      return "error";
    case ErrorSeverity::kCritical:
      return "critical";
  }
  return "error";
}

ContextualError ContextualError::fromError(const Error& error, const ErrorContext& context,
                                           ErrorSeverity severity) {
  return ContextualError(error.code(), error.message(), context, severity);
}

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler instance_;
  return instance_;
}

void ErrorHandler::report(const ContextualError& error) const {
  if (error_logger_) {
    error_logger_(error);
  }
}

void ErrorHandler::setErrorLogger(std::function<void(const ContextualError&)> logger) {
  error_logger_ = std::move(logger);
}

std::string ErrorHandler::formatUserError(const ContextualError& error, bool json_format,
                                          bool use_color) const {
  if (json_format) {
    nlohmann::json error_json;
    error_json["error"] = true;
    error_json["code"] = static_cast<int>(error.code());
    error_json["message"] = error.message();
    error_json["severity"] = std::string(severityToString(error.severity()));

    if (error.context()) {
      const auto& ctx = *error.context();
      if (!ctx.file_path.empty()) {
        error_json["file"] = ctx.file_path;
      }
      if (!ctx.operation.empty()) {
        error_json["operation"] = ctx.operation;
      }
    }

    return error_json.dump();
  }

  std::ostringstream oss;

  const char* color_code = "";
  const char* severity_text = "";
  const char* reset_code = use_color ? "\033[0m" : "";

  switch (error.severity()) {
    case ErrorSeverity::kInfo:
      color_code = "\033[36m";  // Cyan
      severity_text = "Info";
      break;
    case ErrorSeverity::kWarning:
      color_code = "\033[33m";  // Yellow
      severity_text = "Warning";
      break;
    case ErrorSeverity::kError:
      color_code = "\033[31m";  // Red
      severity_text = "Error";
      break;
    case ErrorSeverity::kCritical:
      color_code = "\033[35m";  // Magenta
      severity_text = "Critical";
      break;
  }
  if (!use_color) {
    color_code = "";
  }

  oss << color_code << severity_text << reset_code << ": " << error.message();

  if (error.context()) {
    const auto& ctx = *error.context();
    if (!ctx.file_path.empty()) {
      oss << "\n  File: " << ctx.file_path;
    }
  }

  // Suggestions for the errors a user can fix
  switch (error.code()) {
    case ErrorCode::kFileNotFound:
      oss << "\n  Suggestion: Check if the file path is correct and the file exists";
      break;
    case ErrorCode::kConfigError:
      oss << "\n  Suggestion: Run 'bflow config path' and check the configuration file";
      break;
    case ErrorCode::kNotFound:
      oss << "\n  Suggestion: Check the heading text, including its leading '#' markers";
      break;
    default:
      break;
  }

  return oss.str();
}

}  // namespace bflow::util
