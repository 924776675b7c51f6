#include "sync/path_key_mapper.hpp"
#include <vector>
#include <boost/log/trivial.hpp>

namespace bsync {
namespace sync {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PathKeyMapper::PathKeyMapper(const std::string& key_prefix)
  : prefix_(key_prefix) {
  // Strip leading separators, keys never start with '/'
  while (!prefix_.empty() && prefix_.front() == '/') {
    prefix_.erase(prefix_.begin());
  }
  if (!prefix_.empty() && prefix_.back() != '/') {
    prefix_ += '/';
  }
  if (!prefix_.empty()) {
    // Validates the prefix segments the same way as any relative path
    RelativePath::parse(prefix_.substr(0, prefix_.size() - 1));
  }
  BOOST_LOG_TRIVIAL(debug) << "Key mapper: Using key prefix '" << prefix_ << "'";
}


//==============================================
// KEY MAPPING
//==============================================

std::string PathKeyMapper::to_key(const RelativePath& path) const {
  if (path.empty()) {
    throw InvalidPathError("empty relative path has no key");
  }

  std::string key = prefix_ + path.str();
  if (key.size() > MAX_KEY_LENGTH) {
    throw InvalidPathError("object key longer than " + std::to_string(MAX_KEY_LENGTH) + " bytes: " + path.str());
  }
  return key;
}

RelativePath PathKeyMapper::to_path(const std::string& key) const {
  if (key.size() > MAX_KEY_LENGTH) {
    throw InvalidPathError("object key longer than " + std::to_string(MAX_KEY_LENGTH) + " bytes");
  }
  if (key.compare(0, prefix_.size(), prefix_) != 0) {
    throw InvalidPathError("key '" + key + "' is outside prefix '" + prefix_ + "'");
  }
  return RelativePath::parse(key.substr(prefix_.size()));
}

bool PathKeyMapper::is_directory_marker(const std::string& key) const {
  return !key.empty() && key.back() == '/';
}

std::string PathKeyMapper::to_directory_key(const RelativePath& path) const {
  return to_key(path) + "/";
}


//==============================================
// NATIVE PATH CONVERSION
//==============================================

RelativePath PathKeyMapper::from_native(const std::filesystem::path& relative) {
  if (relative.empty()) {
    throw InvalidPathError("empty relative path");
  }
  if (relative.is_absolute() || relative.has_root_path()) {
    throw InvalidPathError("absolute path '" + relative.string() + "'");
  }

  std::vector<std::string> segments;
  for (const auto& part : relative) {
    segments.push_back(part.string());
  }
  return RelativePath(std::move(segments));
}

std::filesystem::path PathKeyMapper::to_native(const std::filesystem::path& root, const RelativePath& path) {
  std::filesystem::path native = root;
  for (const auto& segment : path.segments()) {
    native /= segment;
  }
  return native;
}

} // namespace sync
} // namespace bsync
