#include "bflow/util/filesystem.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <random>

namespace bflow::util {

namespace {

void syncPath(const std::filesystem::path& path) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd >= 0) {
    fsync(fd);
    close(fd);
  }
}

}  // namespace

AtomicFileWriter::AtomicFileWriter(const std::filesystem::path& target_path)
    : target_path_(target_path), committed_(false), cancelled_(false) {
  // Generate unique temporary filename
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);

  temp_path_ = target_path_;
  temp_path_ += ".tmp." + std::to_string(dis(gen));
}

AtomicFileWriter::~AtomicFileWriter() {
  if (!committed_ && !cancelled_) {
    cleanup();
  }
}

Result<void> AtomicFileWriter::write(const std::string& content) {
  if (committed_ || cancelled_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Writer already used"));
  }

  // Temp file lives beside the target, so the parent must exist first
  auto parent = target_path_.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Cannot create parent directory: " + ec.message()));
    }
  }

  std::ofstream file(temp_path_, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot create temporary file: " + temp_path_.string()));
  }

  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!file) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to write to temporary file"));
  }

  file.close();
  if (!file) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to close temporary file"));
  }

  return {};
}

Result<void> AtomicFileWriter::commit() {
  if (committed_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Already committed"));
  }
  if (cancelled_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Operation cancelled"));
  }

  syncPath(temp_path_);

  // Atomic rename
  std::error_code ec;
  std::filesystem::rename(temp_path_, target_path_, ec);
  if (ec) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Atomic rename failed: " + ec.message()));
  }

  // Sync parent directory so the rename is persistent
  auto parent = target_path_.parent_path();
  if (!parent.empty()) {
    syncPath(parent);
  }

  committed_ = true;
  return {};
}

void AtomicFileWriter::cancel() {
  if (!committed_) {
    cancelled_ = true;
    cleanup();
  }
}

void AtomicFileWriter::cleanup() {
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
}

Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  AtomicFileWriter writer(path);

  auto write_result = writer.write(content);
  if (!write_result.has_value()) {
    return write_result;
  }

  return writer.commit();
}

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Cannot open file: " + path.string()));
  }

  file.seekg(0, std::ios::end);
  auto size = file.tellg();
  if (size < 0) {
    return std::unexpected(makeError(ErrorCode::kFileReadError, "Cannot get file size"));
  }

  file.seekg(0, std::ios::beg);

  std::string content(static_cast<std::size_t>(size), '\0');
  file.read(content.data(), size);

  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError, "Read failed"));
  }

  return content;
}

Result<void> FileSystem::createDirectories(const std::filesystem::path& path,
                                           std::filesystem::perms perms) {
  std::error_code ec;

  if (!std::filesystem::create_directories(path, ec) && ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                     "Cannot create directories: " + ec.message()));
  }

  std::filesystem::permissions(path, perms, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                     "Cannot set directory permissions: " + ec.message()));
  }

  return {};
}

}  // namespace bflow::util
