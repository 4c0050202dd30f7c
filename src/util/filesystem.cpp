#include "ironclad/util/filesystem.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace ironclad::util {

// AtomicFileWriter implementation
AtomicFileWriter::AtomicFileWriter(const std::filesystem::path& target_path)
    : target_path_(target_path), committed_(false), cancelled_(false) {
  // Generate unique temporary filename next to the target so rename stays on one filesystem
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

  auto parent = target_path_.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    auto created = FileSystem::createDirectories(parent);
    if (!created.has_value()) {
      return std::unexpected(created.error());
    }
  }

  std::ofstream file(temp_path_, std::ios::binary | std::ios::trunc);
  if (!file) {
    auto code = errno == EACCES ? ErrorCode::kFilePermissionDenied : ErrorCode::kFileWriteError;
    return std::unexpected(makeError(code, "Cannot create temporary file: " + temp_path_.string()));
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

  std::error_code ec;

  // Keep the mode of the file being replaced
  auto status = std::filesystem::status(target_path_, ec);
  if (!ec && std::filesystem::exists(status)) {
    std::filesystem::permissions(temp_path_, status.permissions(),
                                 std::filesystem::perm_options::replace, ec);
  }

  int fd = open(temp_path_.c_str(), O_RDONLY);
  if (fd >= 0) {
    fsync(fd);
    close(fd);
  }

  ec.clear();
  std::filesystem::rename(temp_path_, target_path_, ec);
  if (ec) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Atomic rename failed: " + ec.message()));
  }

  // Sync parent directory to ensure rename is persistent
  auto parent = target_path_.parent_path();
  if (!parent.empty()) {
    int dir_fd = open(parent.c_str(), O_RDONLY);
    if (dir_fd >= 0) {
      fsync(dir_fd);
      close(dir_fd);
    }
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

// FileSystem implementation
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
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "File not found: " + path.string()));
  }
  if (std::filesystem::is_directory(path, ec)) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Path is a directory: " + path.string()));
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    if (errno == EACCES) {
      return std::unexpected(makeError(ErrorCode::kFilePermissionDenied,
                                       "Permission denied: " + path.string()));
    }
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot open file: " + path.string() + " (" +
                                         std::strerror(errno) + ")"));
  }

  file.seekg(0, std::ios::end);
  auto size = file.tellg();
  if (size < 0) {
    return std::unexpected(makeError(ErrorCode::kFileReadError, "Cannot get file size"));
  }

  file.seekg(0, std::ios::beg);

  std::string content(static_cast<size_t>(size), '\0');
  file.read(content.data(), size);

  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError, "Read failed: " + path.string()));
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
    return std::unexpected(makeError(ErrorCode::kFilePermissionDenied,
                                     "Cannot set directory permissions: " + ec.message()));
  }

  return {};
}

}  // namespace ironclad::util
