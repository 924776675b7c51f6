#ifndef BSYNC_CONFIG_HPP
#define BSYNC_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include "storage/s3_object_store.hpp"

namespace bsync {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

enum class Backend {
  S3,
  FILESYSTEM
};

struct SyncSettings {
  std::size_t workers{0};  // 0 selects default_workers()
  unsigned int max_attempts{4};
  std::chrono::milliseconds backoff_initial{200};
  std::chrono::milliseconds backoff_max{5000};
  std::chrono::milliseconds timestamp_tolerance{2000};
  bool delete_stale{false};
  bool compute_hashes{true};
  std::string key_prefix;
};

struct StorageSettings {
  Backend backend{Backend::S3};
  storage::S3Options s3;
  // Directory holding one sub-directory per bucket
  std::string filesystem_root;
};

struct LoggingSettings {
  std::string file{"bucketsync.log"};
  std::string level{"info"};
  bool console{false};
};

/**
 * Explicit run configuration handed by reference to the controller, the
 * scanner and the orchestrator. Nothing reads configuration from globals.
 */
struct SyncConfig {
  SyncSettings sync;
  StorageSettings storage;
  LoggingSettings logging;

  // Worker count actually used
  std::size_t effective_workers() const;
};

// max(4, hardware threads)
std::size_t default_workers();

Backend parse_backend(const std::string& name);

// Loads a YAML file on top of the defaults. Throws ConfigError on unreadable or invalid files.
SyncConfig load_config(const std::string& path);

// Overrides credentials and region from AWS_* environment variables
void apply_environment(SyncConfig& config);

// $BUCKETSYNC_CONFIG, else ~/.config/bucketsync/config.yaml
std::string default_config_path();

// Rejects out-of-range values
void validate(const SyncConfig& config);

} // namespace config
} // namespace bsync

#endif // BSYNC_CONFIG_HPP
