#include "storage/fs_object_store.hpp"
#include "fs/file_system.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <fstream>
#include <boost/log/trivial.hpp>

namespace bsync {
namespace storage {

namespace {

constexpr const char* TEMP_MARKER = ".bsync-tmp-";

StorageErrorKind classify(const std::error_code& ec) {
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    return StorageErrorKind::PERMISSION_DENIED;
  }
  if (ec == std::errc::no_such_file_or_directory) {
    return StorageErrorKind::NOT_FOUND;
  }
  if (ec == std::errc::filename_too_long || ec == std::errc::is_a_directory) {
    return StorageErrorKind::INVALID_KEY;
  }
  return StorageErrorKind::OTHER;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FsObjectStore::FsObjectStore(const std::string& root, const std::string& bucket, std::size_t max_keys)
  : bucket_(bucket)
  , bucket_path_(std::filesystem::path(root) / bucket)
  , max_keys_(max_keys == 0 ? 1 : max_keys) {
  if (bucket_.empty() || bucket_.find('/') != std::string::npos || bucket_ == "." || bucket_ == "..") {
    throw StorageError(StorageErrorKind::INVALID_KEY, "Invalid bucket name: " + bucket_);
  }
  BOOST_LOG_TRIVIAL(info) << "Fs store: Using bucket directory: " << bucket_path_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void FsObjectStore::check_bucket() {
  std::error_code ec;
  if (!std::filesystem::is_directory(bucket_path_, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Fs store: Bucket directory not found: " << bucket_path_.string();
    throw StorageError(ec ? classify(ec) : StorageErrorKind::NOT_FOUND, "No such bucket: " + bucket_);
  }

  std::filesystem::directory_iterator listing(bucket_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Fs store: Bucket directory not readable: " << ec.message();
    throw StorageError(classify(ec), "Cannot access bucket " + bucket_ + ": " + ec.message());
  }
}

void FsObjectStore::put_object(const std::string& key, std::istream& data) {
  BOOST_LOG_TRIVIAL(debug) << "Fs store: Storing object with key: " << key;

  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "Fs store: Invalid input stream provided for key: " << key;
    throw StorageError(StorageErrorKind::OTHER, "Invalid input stream for key " + key);
  }

  std::filesystem::path file_path = resolve_key_path(key);
  fs::LocalFileSystem files;

  try {
    // Keys ending in '/' are folder markers
    if (key.back() == '/') {
      files.ensure_dir(file_path);
      return;
    }
    files.write_file(file_path, data);
  }
  catch (const fs::FileSystemError& e) {
    BOOST_LOG_TRIVIAL(error) << "Fs store: Failed to store key " << key << ": " << e.what();
    throw StorageError(classify(e.code()), e.what());
  }
}

void FsObjectStore::get_object(const std::string& key, std::ostream& output) {
  BOOST_LOG_TRIVIAL(debug) << "Fs store: Retrieving object with key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Fs store: Object not found: " << key;
    throw StorageError(StorageErrorKind::NOT_FOUND, "No such key: " + key);
  }

  try {
    fs::LocalFileSystem files;
    files.read_file(file_path, output);
  }
  catch (const fs::FileSystemError& e) {
    throw StorageError(classify(e.code()), e.what());
  }
}

ListPage FsObjectStore::list_objects(const std::string& prefix, const std::string& continuation_token) {
  check_bucket();

  std::vector<std::string> keys = collect_keys();
  ListPage page;

  // Keys are sorted; resume strictly after the token
  auto it = continuation_token.empty()
    ? keys.begin()
    : std::upper_bound(keys.begin(), keys.end(), continuation_token);

  for (; it != keys.end(); ++it) {
    if (it->compare(0, prefix.size(), prefix) != 0) {
      continue;
    }
    if (page.objects.size() == max_keys_) {
      page.continuation_token = page.objects.back().key;
      break;
    }
    page.objects.push_back(describe(*it));
  }

  BOOST_LOG_TRIVIAL(debug) << "Fs store: Listed " << page.objects.size() << " objects with prefix '"
                           << prefix << "'" << (page.continuation_token.empty() ? "" : " (truncated)");
  return page;
}

bool FsObjectStore::object_exists(const std::string& key) {
  std::filesystem::path file_path = resolve_key_path(key);
  std::error_code ec;
  bool exists = key.back() == '/'
    ? std::filesystem::is_directory(file_path, ec)
    : std::filesystem::is_regular_file(file_path, ec);

  BOOST_LOG_TRIVIAL(debug) << "Fs store: Key " << key << (exists ? " exists" : " not found");
  return exists;
}

void FsObjectStore::delete_object(const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "Fs store: Removing object with key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);
  std::error_code ec;

  // Deleting a missing key succeeds, as on S3
  if (!std::filesystem::remove(file_path, ec) && ec) {
    BOOST_LOG_TRIVIAL(error) << "Fs store: Failed to remove object " << key << ": " << ec.message();
    throw StorageError(classify(ec), "Failed to delete " + key + ": " + ec.message());
  }
  prune_empty_parents(file_path.parent_path());
}


//==============================================
// KEY RESOLUTION
//==============================================

std::filesystem::path FsObjectStore::resolve_key_path(const std::string& key) const {
  if (key.empty() || key.front() == '/') {
    throw StorageError(StorageErrorKind::INVALID_KEY, "Invalid key: '" + key + "'");
  }

  std::filesystem::path path = bucket_path_;
  std::string::size_type start = 0;
  while (start < key.size()) {
    auto pos = key.find('/', start);
    std::string segment = key.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
    if (segment.empty() || segment == "." || segment == ".." ||
        segment.find(TEMP_MARKER) != std::string::npos) {
      throw StorageError(StorageErrorKind::INVALID_KEY, "Invalid key: '" + key + "'");
    }
    path /= segment;
    if (pos == std::string::npos) {
      break;
    }
    start = pos + 1;
  }
  return path;
}

std::vector<std::string> FsObjectStore::collect_keys() const {
  std::vector<std::string> keys;
  std::vector<std::filesystem::path> pending{bucket_path_};

  while (!pending.empty()) {
    std::filesystem::path dir = pending.back();
    pending.pop_back();

    std::error_code ec;
    bool has_children = false;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
      has_children = true;
      const auto& entry_path = it->path();
      if (entry_path.filename().string().find(TEMP_MARKER) != std::string::npos) {
        continue;
      }
      std::error_code status_ec;
      auto status = it->symlink_status(status_ec);
      if (status_ec) {
        continue;
      }
      if (std::filesystem::is_directory(status)) {
        pending.push_back(entry_path);
      } else if (std::filesystem::is_regular_file(status)) {
        keys.push_back(entry_path.lexically_relative(bucket_path_).generic_string());
      }
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Fs store: Failed to list " << dir.string() << ": " << ec.message();
      throw StorageError(classify(ec), "Failed to list bucket " + bucket_ + ": " + ec.message());
    }

    if (!has_children && dir != bucket_path_) {
      keys.push_back(dir.lexically_relative(bucket_path_).generic_string() + "/");
    }
  }

  std::sort(keys.begin(), keys.end());
  return keys;
}

ObjectInfo FsObjectStore::describe(const std::string& key) const {
  ObjectInfo info;
  info.key = key;

  fs::LocalFileSystem files;
  std::filesystem::path path = resolve_key_path(key);
  try {
    fs::FileStat st = files.stat(path);
    info.last_modified = st.mtime;
    if (st.type == fs::FileType::REGULAR) {
      info.size = st.size;
      info.etag = crypto::md5_file_hex(path);
    }
  }
  catch (const fs::FileSystemError& e) {
    throw StorageError(classify(e.code()), e.what());
  }
  catch (const crypto::DigestError& e) {
    throw StorageError(StorageErrorKind::OTHER, e.what());
  }
  return info;
}

void FsObjectStore::prune_empty_parents(std::filesystem::path dir) const {
  std::error_code ec;
  while (dir != bucket_path_ && dir.native().size() > bucket_path_.native().size()) {
    if (!std::filesystem::is_empty(dir, ec) || ec) {
      break;
    }
    std::filesystem::remove(dir, ec);
    if (ec) {
      break;
    }
    dir = dir.parent_path();
  }
}

} // namespace storage
} // namespace bsync
