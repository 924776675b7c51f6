#ifndef BSYNC_FILE_SYSTEM_HPP
#define BSYNC_FILE_SYSTEM_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace bsync {
namespace fs {

enum class FileType {
  REGULAR,
  DIRECTORY,
  SYMLINK,
  OTHER,
  NOT_FOUND
};

struct FileStat {
  FileType type{FileType::NOT_FOUND};
  std::uint64_t size{0};
  std::chrono::system_clock::time_point mtime{};
};

struct DirEntry {
  std::string name;
  // Type of the entry itself; symbolic links are not followed
  FileType type{FileType::OTHER};
};

class FileSystemError : public std::runtime_error {
public:
  FileSystemError(const std::string& message, std::error_code code)
    : std::runtime_error(message + ": " + code.message())
    , code_(code) {}

  const std::error_code& code() const { return code_; }

private:
  std::error_code code_;
};

/**
 * Local filesystem primitives used by the scanner and the transfer workers.
 * All failures are reported as FileSystemError.
 */
class FileSystem {
public:
  virtual ~FileSystem() = default;

  virtual std::vector<DirEntry> list_dir(const std::filesystem::path& path) const = 0;
  // Does not follow a trailing symbolic link; NOT_FOUND is returned, not thrown
  virtual FileStat stat(const std::filesystem::path& path) const = 0;
  virtual std::unique_ptr<std::istream> open_read(const std::filesystem::path& path) const = 0;
  virtual void read_file(const std::filesystem::path& path, std::ostream& output) const = 0;
  // Replaces the file atomically, creating parent directories as needed
  virtual void write_file(const std::filesystem::path& path, std::istream& data) = 0;
  virtual void ensure_dir(const std::filesystem::path& path) = 0;
  virtual void remove_file(const std::filesystem::path& path) = 0;
  virtual void set_mtime(const std::filesystem::path& path, std::chrono::system_clock::time_point mtime) = 0;
};

// std::filesystem and POSIX backed implementation
class LocalFileSystem : public FileSystem {
public:
  std::vector<DirEntry> list_dir(const std::filesystem::path& path) const override;
  FileStat stat(const std::filesystem::path& path) const override;
  std::unique_ptr<std::istream> open_read(const std::filesystem::path& path) const override;
  void read_file(const std::filesystem::path& path, std::ostream& output) const override;
  void write_file(const std::filesystem::path& path, std::istream& data) override;
  void ensure_dir(const std::filesystem::path& path) override;
  void remove_file(const std::filesystem::path& path) override;
  void set_mtime(const std::filesystem::path& path, std::chrono::system_clock::time_point mtime) override;
};

// Throws FileSystemError when a directory between root and root/relative is a
// symbolic link. The final component and root itself are not checked.
void reject_symlinked_parents(const FileSystem& files, const std::filesystem::path& root,
                              const std::filesystem::path& relative);

// Shared conversion between POSIX timespec values and system_clock
std::chrono::system_clock::time_point from_timespec(long seconds, long nanoseconds);

} // namespace fs
} // namespace bsync

#endif // BSYNC_FILE_SYSTEM_HPP
