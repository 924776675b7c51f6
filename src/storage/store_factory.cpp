#include "storage/store_factory.hpp"
#include "storage/fs_object_store.hpp"
#include "storage/s3_object_store.hpp"
#include <boost/log/trivial.hpp>

namespace bsync {
namespace storage {

std::unique_ptr<ObjectStore> make_object_store(const config::StorageSettings& settings, const std::string& bucket) {
  switch (settings.backend) {
    case config::Backend::FILESYSTEM:
      BOOST_LOG_TRIVIAL(debug) << "Store factory: Filesystem backend rooted at " << settings.filesystem_root;
      return std::make_unique<FsObjectStore>(settings.filesystem_root, bucket);
    case config::Backend::S3:
      BOOST_LOG_TRIVIAL(debug) << "Store factory: S3 backend";
      return std::make_unique<S3ObjectStore>(settings.s3, bucket);
  }
  throw config::ConfigError("Unsupported storage backend");
}

} // namespace storage
} // namespace bsync
