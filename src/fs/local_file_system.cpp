#include "fs/file_system.hpp"
#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <thread>
#include <boost/log/trivial.hpp>

namespace bsync {
namespace fs {

namespace {

constexpr std::size_t CHUNK_SIZE = 64 * 1024;

std::error_code last_errno() {
  return std::error_code(errno, std::generic_category());
}

FileType type_from_mode(mode_t mode) {
  if (S_ISREG(mode)) return FileType::REGULAR;
  if (S_ISDIR(mode)) return FileType::DIRECTORY;
  if (S_ISLNK(mode)) return FileType::SYMLINK;
  return FileType::OTHER;
}

FileType type_from_status(const std::filesystem::file_status& status) {
  switch (status.type()) {
    case std::filesystem::file_type::regular:   return FileType::REGULAR;
    case std::filesystem::file_type::directory: return FileType::DIRECTORY;
    case std::filesystem::file_type::symlink:   return FileType::SYMLINK;
    case std::filesystem::file_type::not_found: return FileType::NOT_FOUND;
    default:                                    return FileType::OTHER;
  }
}

// Unique sibling name so concurrent writers never share a temporary file
std::filesystem::path temp_path_for(const std::filesystem::path& path) {
  std::stringstream ss;
  ss << "." << path.filename().string() << ".bsync-tmp-" << std::this_thread::get_id();
  return path.parent_path() / ss.str();
}

} // namespace

std::chrono::system_clock::time_point from_timespec(long seconds, long nanoseconds) {
  return std::chrono::system_clock::time_point(
    std::chrono::duration_cast<std::chrono::system_clock::duration>(
      std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanoseconds)));
}

void reject_symlinked_parents(const FileSystem& files, const std::filesystem::path& root,
                              const std::filesystem::path& relative) {
  std::filesystem::path current = root;
  for (const auto& segment : relative.parent_path()) {
    current /= segment;
    const FileType type = files.stat(current).type;
    if (type == FileType::SYMLINK) {
      BOOST_LOG_TRIVIAL(warning) << "Local fs: Refusing to write below symbolic link " << current.string();
      throw FileSystemError("Parent directory is a symbolic link " + current.string(),
                            std::make_error_code(std::errc::too_many_symbolic_link_levels));
    }
    if (type == FileType::NOT_FOUND) {
      return;
    }
  }
}


//==============================================

std::vector<DirEntry> LocalFileSystem::list_dir(const std::filesystem::path& path) const {
  std::vector<DirEntry> entries;
  std::error_code ec;

  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Local fs: Failed to open directory " << path.string() << ": " << ec.message();
    throw FileSystemError("Failed to list directory " + path.string(), ec);
  }

  for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
    DirEntry entry;
    entry.name = it->path().filename().string();
    std::error_code status_ec;
    entry.type = type_from_status(it->symlink_status(status_ec));
    if (status_ec) {
      entry.type = FileType::OTHER;
    }
    entries.push_back(std::move(entry));
  }
  if (ec) {
    throw FileSystemError("Failed to list directory " + path.string(), ec);
  }
  return entries;
}

FileStat LocalFileSystem::stat(const std::filesystem::path& path) const {
  struct ::stat st {};
  FileStat result;

  if (::lstat(path.c_str(), &st) != 0) {
    if (errno == ENOENT || errno == ENOTDIR) {
      result.type = FileType::NOT_FOUND;
      return result;
    }
    throw FileSystemError("Failed to stat " + path.string(), last_errno());
  }

  result.type = type_from_mode(st.st_mode);
  result.size = static_cast<std::uint64_t>(st.st_size);
  result.mtime = from_timespec(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
  return result;
}


//==============================================
// CORE FILE OPERATIONS
//==============================================

std::unique_ptr<std::istream> LocalFileSystem::open_read(const std::filesystem::path& path) const {
  auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!*file) {
    auto ec = last_errno();
    BOOST_LOG_TRIVIAL(error) << "Local fs: Failed to open file: " << path.string();
    throw FileSystemError("Failed to open file " + path.string(), ec);
  }
  return file;
}

void LocalFileSystem::read_file(const std::filesystem::path& path, std::ostream& output) const {
  auto input = open_read(path);
  output << input->rdbuf();
  if (input->bad() || !output.good()) {
    throw FileSystemError("Failed to read file " + path.string(), std::make_error_code(std::errc::io_error));
  }
}

void LocalFileSystem::write_file(const std::filesystem::path& path, std::istream& data) {
  if (path.has_parent_path()) {
    ensure_dir(path.parent_path());
  }

  const auto temp_path = temp_path_for(path);
  std::size_t bytes_written = 0;
  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      auto ec = last_errno();
      BOOST_LOG_TRIVIAL(error) << "Local fs: Failed to create file: " << temp_path.string();
      throw FileSystemError("Failed to create file " + path.string(), ec);
    }

    char buffer[CHUNK_SIZE];
    // Read input stream in chunks and write to file
    while (data.read(buffer, sizeof(buffer)) || data.gcount() > 0) {
      file.write(buffer, data.gcount());
      if (!file) {
        break;
      }
      bytes_written += static_cast<std::size_t>(data.gcount());
    }

    file.flush();
    if (!file || data.bad()) {
      auto ec = last_errno();
      if (!ec) {
        ec = std::make_error_code(std::errc::io_error);
      }
      file.close();
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      BOOST_LOG_TRIVIAL(error) << "Local fs: Failed writing " << path.string() << ": " << ec.message();
      throw FileSystemError("Failed to write file " + path.string(), ec);
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw FileSystemError("Failed to move file into place " + path.string(), ec);
  }

  BOOST_LOG_TRIVIAL(debug) << "Local fs: Wrote " << bytes_written << " bytes to " << path.string();
}

void LocalFileSystem::ensure_dir(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  std::error_code status_ec;
  const bool exists_as_dir = std::filesystem::is_directory(path, status_ec);
  // Another worker may have created it concurrently
  if (ec && !exists_as_dir) {
    BOOST_LOG_TRIVIAL(error) << "Local fs: Failed to create directory " << path.string() << ": " << ec.message();
    throw FileSystemError("Failed to create directory " + path.string(), ec);
  }
  if (!exists_as_dir) {
    throw FileSystemError("Not a directory " + path.string(),
                          status_ec ? status_ec : std::make_error_code(std::errc::not_a_directory));
  }
}

void LocalFileSystem::remove_file(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::remove(path, ec) && ec) {
    throw FileSystemError("Failed to remove file " + path.string(), ec);
  }
  BOOST_LOG_TRIVIAL(debug) << "Local fs: Removed " << path.string();
}

void LocalFileSystem::set_mtime(const std::filesystem::path& path, std::chrono::system_clock::time_point mtime) {
  const auto since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch());
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);

  struct timespec times[2];
  times[0].tv_sec = 0;
  times[0].tv_nsec = UTIME_OMIT;  // leave access time untouched
  times[1].tv_sec = static_cast<time_t>(seconds.count());
  times[1].tv_nsec = static_cast<long>((since_epoch - seconds).count());

  if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
    throw FileSystemError("Failed to set modification time on " + path.string(), last_errno());
  }
}

} // namespace fs
} // namespace bsync
