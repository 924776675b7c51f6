#ifndef BSYNC_TREE_SCANNER_HPP
#define BSYNC_TREE_SCANNER_HPP

#include <filesystem>
#include "config/config.hpp"
#include "fs/file_system.hpp"
#include "storage/object_store.hpp"
#include "sync/path_key_mapper.hpp"
#include "sync/types.hpp"

namespace bsync {
namespace sync {

/**
 * Builds the manifest of one side of a sync.
 *
 * Local scans walk the tree with an explicit stack. Regular files become
 * entries; symbolic links, special files and empty directories are skipped.
 * Remote scans page through the bucket listing until it is exhausted.
 * Any failure that would leave the manifest incomplete raises ScanError, so a
 * returned manifest is always complete.
 */
class TreeScanner {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TreeScanner(const config::SyncConfig& config, const PathKeyMapper& mapper, const fs::FileSystem& files);


  // ---- SCANNING ----
  Manifest scan_local(const std::filesystem::path& root) const;
  Manifest scan_remote(storage::ObjectStore& store) const;

  // True for a 32 character lowercase or uppercase hex string
  static bool is_plain_md5(const std::string& etag);

private:
  // ---- PARAMETERS ----
  const config::SyncConfig& config_;
  const PathKeyMapper& mapper_;
  const fs::FileSystem& files_;


  // ---- HELPERS ----
  // Entry for a regular file; hashing failures leave content_hash unset
  ManifestEntry describe_file(const std::filesystem::path& native, RelativePath path) const;
};

} // namespace sync
} // namespace bsync

#endif // BSYNC_TREE_SCANNER_HPP
