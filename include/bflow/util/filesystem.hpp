#pragma once

#include <filesystem>
#include <string>

#include "bflow/common.hpp"

namespace bflow::util {

// Writes a file through a temporary sibling so readers never see a partial document
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(const std::filesystem::path& target_path);
  ~AtomicFileWriter();

  // Non-copyable, movable
  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
  AtomicFileWriter(AtomicFileWriter&&) = default;
  AtomicFileWriter& operator=(AtomicFileWriter&&) = default;

  // Write content to temporary file
  Result<void> write(const std::string& content);

  // Commit the changes (rename temp to target)
  Result<void> commit();

  // Cancel the operation (removes temp file)
  void cancel();

  const std::filesystem::path& tempPath() const { return temp_path_; }

 private:
  std::filesystem::path target_path_;
  std::filesystem::path temp_path_;
  bool committed_;
  bool cancelled_;

  void cleanup();
};

// Filesystem utilities
class FileSystem {
 public:
  // Atomic write with fsync and rename
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  // Read file with error handling
  static Result<std::string> readFile(const std::filesystem::path& path);

  // Create directory with proper permissions
  static Result<void> createDirectories(const std::filesystem::path& path,
                                        std::filesystem::perms perms = std::filesystem::perms::owner_all);
};

}  // namespace bflow::util
