#ifndef BSYNC_PATH_KEY_MAPPER_HPP
#define BSYNC_PATH_KEY_MAPPER_HPP

#include <filesystem>
#include <string>
#include "sync/types.hpp"
#include "sync/sync_error.hpp"

namespace bsync {
namespace sync {

/**
 * Maps relative paths to object keys and back. Keys always use '/' as the
 * separator and carry an optional prefix. to_path(to_key(p)) == p for every
 * valid relative path.
 */
class PathKeyMapper {
public:
  // Longest key the S3 API accepts, in bytes
  static constexpr std::size_t MAX_KEY_LENGTH = 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // The prefix is normalized to end with '/' unless empty
  explicit PathKeyMapper(const std::string& key_prefix = "");


  // ---- KEY MAPPING ----
  // Throws InvalidPathError if the resulting key exceeds MAX_KEY_LENGTH
  std::string to_key(const RelativePath& path) const;
  // Throws InvalidPathError if the key lacks the prefix or is not a valid path
  RelativePath to_path(const std::string& key) const;
  // True for keys ending in '/' that some tools create to represent folders
  bool is_directory_marker(const std::string& key) const;
  // Directory marker key for a path: to_key(path) + "/"
  std::string to_directory_key(const RelativePath& path) const;


  // ---- NATIVE PATH CONVERSION ----
  // Converts a native path relative to the sync root
  static RelativePath from_native(const std::filesystem::path& relative);
  // Resolves a relative path under a native root directory
  static std::filesystem::path to_native(const std::filesystem::path& root, const RelativePath& path);


  // ---- GETTERS ----
  const std::string& prefix() const { return prefix_; }

private:
  std::string prefix_;
};

} // namespace sync
} // namespace bsync

#endif // BSYNC_PATH_KEY_MAPPER_HPP
