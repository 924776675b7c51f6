#include "sync/tree_scanner.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>

namespace bsync {
namespace sync {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TreeScanner::TreeScanner(const config::SyncConfig& config, const PathKeyMapper& mapper, const fs::FileSystem& files)
  : config_(config)
  , mapper_(mapper)
  , files_(files) {
}


//==============================================
// LOCAL SCAN
//==============================================

Manifest TreeScanner::scan_local(const std::filesystem::path& root) const {
  BOOST_LOG_TRIVIAL(info) << "Scanner: Scanning local directory " << root.string();

  fs::FileStat root_stat;
  try {
    root_stat = files_.stat(root);
  }
  catch (const fs::FileSystemError& e) {
    throw ScanError(e.what());
  }
  if (root_stat.type == fs::FileType::NOT_FOUND) {
    BOOST_LOG_TRIVIAL(error) << "Scanner: Directory does not exist: " << root.string();
    throw ScanError("directory does not exist: " + root.string());
  }
  if (root_stat.type != fs::FileType::DIRECTORY) {
    BOOST_LOG_TRIVIAL(error) << "Scanner: Not a directory: " << root.string();
    throw ScanError("not a directory: " + root.string());
  }

  Manifest manifest;
  // Each pending item is a directory and its segments relative to root
  std::vector<std::pair<std::filesystem::path, std::vector<std::string>>> pending;
  pending.emplace_back(root, std::vector<std::string>{});

  while (!pending.empty()) {
    auto [dir, segments] = std::move(pending.back());
    pending.pop_back();

    std::vector<fs::DirEntry> entries;
    try {
      entries = files_.list_dir(dir);
    }
    catch (const fs::FileSystemError& e) {
      BOOST_LOG_TRIVIAL(error) << "Scanner: Cannot list " << dir.string() << ": " << e.what();
      throw ScanError(e.what());
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::DirEntry& a, const fs::DirEntry& b) { return a.name < b.name; });

    for (const auto& entry : entries) {
      std::filesystem::path native = dir / entry.name;
      std::vector<std::string> child_segments = segments;
      child_segments.push_back(entry.name);

      switch (entry.type) {
        case fs::FileType::SYMLINK:
          BOOST_LOG_TRIVIAL(info) << "Scanner: Skipping symbolic link " << native.string();
          continue;
        case fs::FileType::OTHER:
        case fs::FileType::NOT_FOUND:
          BOOST_LOG_TRIVIAL(info) << "Scanner: Skipping special file " << native.string();
          continue;
        default:
          break;
      }

      RelativePath path;
      try {
        path = RelativePath(child_segments);
        mapper_.to_key(path);
      }
      catch (const InvalidPathError& e) {
        BOOST_LOG_TRIVIAL(warning) << "Scanner: Skipping " << native.string() << ": " << e.what();
        manifest.add_rejected(native.string(), e.what());
        continue;
      }

      if (entry.type == fs::FileType::DIRECTORY) {
        pending.emplace_back(native, std::move(child_segments));
        continue;
      }

      manifest.add(describe_file(native, std::move(path)));
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Scanner: Found " << manifest.size() << " files (" << manifest.total_bytes()
                          << " bytes) under " << root.string();
  return manifest;
}

ManifestEntry TreeScanner::describe_file(const std::filesystem::path& native, RelativePath path) const {
  ManifestEntry entry;
  entry.relative_path = std::move(path);

  try {
    fs::FileStat st = files_.stat(native);
    entry.size = st.size;
    entry.last_modified = st.mtime;
  }
  catch (const fs::FileSystemError& e) {
    BOOST_LOG_TRIVIAL(error) << "Scanner: Cannot stat " << native.string() << ": " << e.what();
    throw ScanError(e.what());
  }

  if (config_.sync.compute_hashes) {
    try {
      auto input = files_.open_read(native);
      entry.content_hash = crypto::md5_hex(*input);
    }
    catch (const fs::FileSystemError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Scanner: Cannot hash " << native.string() << ": " << e.what();
    }
    catch (const crypto::DigestError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Scanner: Cannot hash " << native.string() << ": " << e.what();
    }
  }

  BOOST_LOG_TRIVIAL(trace) << "Scanner: " << entry.relative_path << " size=" << entry.size
                           << " mtime=" << format_timestamp(entry.last_modified);
  return entry;
}


//==============================================
// REMOTE SCAN
//==============================================

Manifest TreeScanner::scan_remote(storage::ObjectStore& store) const {
  BOOST_LOG_TRIVIAL(info) << "Scanner: Scanning bucket " << store.bucket()
                          << (mapper_.prefix().empty() ? "" : " under prefix " + mapper_.prefix());

  try {
    store.check_bucket();
  }
  catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "Scanner: Bucket " << store.bucket() << " is not accessible: " << e.what();
    throw ScanError("bucket " + store.bucket() + " is not accessible: " + e.what());
  }

  Manifest manifest;
  std::string token;
  std::size_t pages = 0;

  do {
    storage::ListPage page;
    try {
      page = store.list_objects(mapper_.prefix(), token);
    }
    catch (const storage::StorageError& e) {
      BOOST_LOG_TRIVIAL(error) << "Scanner: Listing bucket " << store.bucket() << " failed: " << e.what();
      throw ScanError("listing bucket " + store.bucket() + " failed: " + e.what());
    }
    ++pages;

    for (auto& object : page.objects) {
      try {
        if (mapper_.is_directory_marker(object.key)) {
          // The prefix's own marker carries no path
          if (object.key == mapper_.prefix()) {
            continue;
          }
          manifest.add_directory(mapper_.to_path(object.key.substr(0, object.key.size() - 1)));
          continue;
        }

        ManifestEntry entry;
        entry.relative_path = mapper_.to_path(object.key);
        entry.size = object.size;
        entry.last_modified = object.last_modified;
        // Multipart ETags are not content digests
        if (object.etag && is_plain_md5(*object.etag)) {
          std::string hash = *object.etag;
          std::transform(hash.begin(), hash.end(), hash.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
          entry.content_hash = std::move(hash);
        }
        manifest.add(std::move(entry));
      }
      catch (const InvalidPathError& e) {
        BOOST_LOG_TRIVIAL(warning) << "Scanner: Skipping object " << object.key << ": " << e.what();
        manifest.add_rejected(object.key, e.what());
      }
    }

    if (!page.continuation_token.empty() && page.continuation_token == token) {
      throw ScanError("listing of bucket " + store.bucket() + " did not advance");
    }
    token = page.continuation_token;
  } while (!token.empty());

  BOOST_LOG_TRIVIAL(info) << "Scanner: Found " << manifest.size() << " objects (" << manifest.total_bytes()
                          << " bytes) in " << pages << " page(s) of bucket " << store.bucket();
  return manifest;
}

bool TreeScanner::is_plain_md5(const std::string& etag) {
  return etag.size() == 32 &&
         std::all_of(etag.begin(), etag.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

} // namespace sync
} // namespace bsync
