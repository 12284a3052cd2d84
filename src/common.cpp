#include "bflow/common.hpp"

#include <sstream>

namespace bflow {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kInvalidState:
      return "Invalid state";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef BFLOW_VERSION_MAJOR
  return Version{BFLOW_VERSION_MAJOR, BFLOW_VERSION_MINOR, BFLOW_VERSION_PATCH, ""};
#else
  return Version{0, 1, 0, "dev"};
#endif
}

}  // namespace bflow
