#pragma once

#include <memory>
#include <string>
#include "config/config.hpp"
#include "storage/object_store.hpp"

namespace bsync {
namespace storage {

// Builds the adapter selected by storage.backend, bound to one bucket
std::unique_ptr<ObjectStore> make_object_store(const config::StorageSettings& settings, const std::string& bucket);

} // namespace storage
} // namespace bsync
