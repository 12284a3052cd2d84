#pragma once

#include <functional>
#include <optional>
#include <string>

#include "bflow/common.hpp"

namespace bflow::util {

// Error severity levels
enum class ErrorSeverity {
  kInfo,     // Informational messages
  kWarning,  // Recoverable issues
  kError,    // Errors that stop the current command
  kCritical  // Errors that may leave a document half written
};

std::string_view severityToString(ErrorSeverity severity);

// Error context for providing additional debugging information
struct ErrorContext {
  std::string file_path;          // File being operated on
  std::string operation;          // Operation being performed

  ErrorContext& withFile(const std::string& path) {
    file_path = path;
    return *this;
  }

  ErrorContext& withOperation(const std::string& op) {
    operation = op;
    return *this;
  }
};

// Error with context and severity
class ContextualError {
 public:
  ContextualError(ErrorCode code, std::string message, ErrorSeverity severity = ErrorSeverity::kError)
      : code_(code), message_(std::move(message)), severity_(severity) {}

  ContextualError(ErrorCode code, std::string message, ErrorContext context,
                  ErrorSeverity severity = ErrorSeverity::kError)
      : code_(code), message_(std::move(message)), context_(std::move(context)), severity_(severity) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::optional<ErrorContext>& context() const { return context_; }
  ErrorSeverity severity() const { return severity_; }

  static ContextualError fromError(const Error& error, const ErrorContext& context = {},
                                   ErrorSeverity severity = ErrorSeverity::kError);

 private:
  ErrorCode code_;
  std::string message_;
  std::optional<ErrorContext> context_;
  ErrorSeverity severity_;
};

template <typename T>
using ContextualResult = std::expected<T, ContextualError>;

/**
 * @brief Process-wide sink for contextual errors
 *
 * Commands report through report(); the installed logger (spdlog once
 * setupLogging() ran) decides where the record goes.
 */
class ErrorHandler {
 public:
  static ErrorHandler& instance();

  // Log the error through the installed logger, if any
  void report(const ContextualError& error) const;

  void setErrorLogger(std::function<void(const ContextualError&)> logger);

  // Format error for user display
  std::string formatUserError(const ContextualError& error, bool json_format = false,
                              bool use_color = true) const;

 private:
  ErrorHandler() = default;
  std::function<void(const ContextualError&)> error_logger_;
};

// Context for a failed file operation at the call site
#define BFLOW_FILE_ERROR_CONTEXT(path) \
  ::bflow::util::ErrorContext{}.withFile(path).withOperation(__FUNCTION__)

}  // namespace bflow::util
