#pragma once

#include <iostream>
#include <string>

#include "bflow/cli/application.hpp"
#include "bflow/util/error_handler.hpp"

namespace bflow::cli {

// Formats command errors and status messages for CLI output
class CommandErrorHandler {
 public:
  explicit CommandErrorHandler(const GlobalOptions& options) : options_(options) {}

  // Handle and display command errors, returning the exit code
  int handleCommandError(const util::ContextualError& error);

  // Handle and display plain errors
  int handleLegacyError(const Error& error, const std::string& operation = "");

  // Handle a failed read or write of path; the reported error names the file
  int handleFileError(const Error& error, const std::string& path, const std::string& operation);

  // Confirmation line on stdout; silent with --quiet
  void displaySuccess(const std::string& message);

 private:
  const GlobalOptions& options_;

  util::ContextualError convertLegacyError(const Error& error, util::ErrorContext context);
};

}  // namespace bflow::cli
