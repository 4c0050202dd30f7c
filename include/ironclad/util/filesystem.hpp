#pragma once

#include <filesystem>
#include <string>

#include "ironclad/common.hpp"

namespace ironclad::util {

// Atomic file replacement: write to a sibling temp file, fsync, rename.
// The temp file is removed on every path that does not commit.
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(const std::filesystem::path& target_path);
  ~AtomicFileWriter();

  // Non-copyable, non-movable (owns a temp file on disk)
  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

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
  // Atomic write with fsync and rename; keeps the permissions of an existing target
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  // Read a whole file. kFileNotFound, kFilePermissionDenied or kFileReadError on failure
  static Result<std::string> readFile(const std::filesystem::path& path);

  // Create directory with proper permissions
  static Result<void> createDirectories(const std::filesystem::path& path,
                                        std::filesystem::perms perms = std::filesystem::perms::owner_all);
};

}  // namespace ironclad::util
