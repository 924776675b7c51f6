#pragma once

#include <string>
#include <filesystem>
#include <sstream>
#include <vector>
#include "storage/object_store.hpp"

namespace bsync {
namespace storage {

/**
 * Object store kept in a local directory: bucket "b" lives in <root>/b and
 * key "x/y" in <root>/b/x/y. Empty directories are listed as "dir/" markers.
 * ETags are the MD5 of the content, as S3 reports for single-part uploads.
 */
class FsObjectStore : public ObjectStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  FsObjectStore(const std::string& root, const std::string& bucket, std::size_t max_keys = 1000);


  // ---- CORE STORAGE OPERATIONS ----
  void check_bucket() override;
  void put_object(const std::string& key, std::istream& data) override;
  void get_object(const std::string& key, std::ostream& output) override;
  ListPage list_objects(const std::string& prefix, const std::string& continuation_token) override;
  bool object_exists(const std::string& key) override;
  void delete_object(const std::string& key) override;


  // ---- QUERY OPERATIONS ----
  const std::string& bucket() const override { return bucket_; }
  // Directory holding the bucket's objects
  const std::filesystem::path& bucket_path() const { return bucket_path_; }

private:
  // ---- PARAMETERS ----
  std::string bucket_;
  std::filesystem::path bucket_path_;
  std::size_t max_keys_;


  // ---- KEY RESOLUTION ----
  // Resolves a key to its path under the bucket, throws INVALID_KEY for escaping keys
  std::filesystem::path resolve_key_path(const std::string& key) const;
  // Every object key in the bucket, sorted
  std::vector<std::string> collect_keys() const;
  ObjectInfo describe(const std::string& key) const;
  // Removes parent directories left empty by a delete, up to the bucket root
  void prune_empty_parents(std::filesystem::path dir) const;
};

} // namespace storage
} // namespace bsync
