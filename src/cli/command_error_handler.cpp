#include "bflow/cli/command_error_handler.hpp"

#include <nlohmann/json.hpp>

namespace bflow::cli {

int CommandErrorHandler::handleCommandError(const util::ContextualError& error) {
  auto& handler = util::ErrorHandler::instance();
  handler.report(error);

  std::string formatted_error = handler.formatUserError(error, options_.json, !options_.no_color);

  if (options_.json) {
    std::cout << formatted_error << std::endl;
  } else {
    std::cerr << formatted_error << std::endl;
  }

  switch (error.severity()) {
    case util::ErrorSeverity::kInfo:
    case util::ErrorSeverity::kWarning:
      return 0;  // Don't fail for warnings/info
    case util::ErrorSeverity::kError:
      return 1;
    case util::ErrorSeverity::kCritical:
      return 2;
  }

  return 1;
}

int CommandErrorHandler::handleLegacyError(const Error& error, const std::string& operation) {
  util::ErrorContext context;
  if (!operation.empty()) {
    context.withOperation(operation);
  }
  return handleCommandError(convertLegacyError(error, std::move(context)));
}

int CommandErrorHandler::handleFileError(const Error& error, const std::string& path,
                                         const std::string& operation) {
  auto context = BFLOW_FILE_ERROR_CONTEXT(path).withOperation(operation);
  return handleCommandError(convertLegacyError(error, std::move(context)));
}

util::ContextualError CommandErrorHandler::convertLegacyError(const Error& error,
                                                              util::ErrorContext context) {
  // A failed write may leave the user without the document they expect
  util::ErrorSeverity severity = util::ErrorSeverity::kError;
  if (error.code() == ErrorCode::kFileWriteError) {
    severity = util::ErrorSeverity::kCritical;
  }

  return util::ContextualError::fromError(error, context, severity);
}

void CommandErrorHandler::displaySuccess(const std::string& message) {
  if (options_.quiet) return;
  if (options_.json) {
    nlohmann::json success_json;
    success_json["success"] = true;
    success_json["message"] = message;
    std::cout << success_json.dump() << std::endl;
  } else if (options_.no_color) {
    std::cout << message << std::endl;
  } else {
    std::cout << "\033[32m✓\033[0m " << message << std::endl;
  }
}

}  // namespace bflow::cli
