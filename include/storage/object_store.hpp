#ifndef BSYNC_OBJECT_STORE_HPP
#define BSYNC_OBJECT_STORE_HPP

#include <chrono>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "storage/storage_error.hpp"

namespace bsync {
namespace storage {

struct ObjectInfo {
  std::string key;
  std::uint64_t size{0};
  std::chrono::system_clock::time_point last_modified{};
  // Unquoted ETag as reported by the store, if any
  std::optional<std::string> etag;
};

struct ListPage {
  std::vector<ObjectInfo> objects;
  // Empty when the listing is exhausted
  std::string continuation_token;
};

/**
 * Capability set of a remote object store bound to one bucket.
 * Every operation reports failure by throwing StorageError. Implementations
 * must be safe to call from several worker threads at once.
 */
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  // Verifies the bucket exists and is accessible
  virtual void check_bucket() = 0;

  virtual void put_object(const std::string& key, std::istream& data) = 0;
  virtual void get_object(const std::string& key, std::ostream& output) = 0;
  // Lists one page of keys starting with prefix; pass the previous page's token to continue
  virtual ListPage list_objects(const std::string& prefix, const std::string& continuation_token) = 0;
  virtual bool object_exists(const std::string& key) = 0;
  virtual void delete_object(const std::string& key) = 0;

  virtual const std::string& bucket() const = 0;
};

} // namespace storage
} // namespace bsync

#endif // BSYNC_OBJECT_STORE_HPP
