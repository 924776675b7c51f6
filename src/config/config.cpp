#include "config/config.hpp"
#include <algorithm>
#include <cstdlib>
#include <thread>
#include <yaml-cpp/yaml.h>
#include <boost/log/trivial.hpp>

namespace bsync {
namespace config {

namespace {

template<typename T>
T get_or_default(const YAML::Node& node, const std::string& key, const T& def) {
  return node[key] ? node[key].as<T>() : def;
}

std::chrono::milliseconds get_millis(const YAML::Node& node, const std::string& key, std::chrono::milliseconds def) {
  return std::chrono::milliseconds(get_or_default<long long>(node, key, def.count()));
}

const char* env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

} // namespace

std::size_t default_workers() {
  return std::max<std::size_t>(4, std::thread::hardware_concurrency());
}

std::size_t SyncConfig::effective_workers() const {
  return sync.workers == 0 ? default_workers() : sync.workers;
}

Backend parse_backend(const std::string& name) {
  if (name == "s3") return Backend::S3;
  if (name == "filesystem" || name == "fs") return Backend::FILESYSTEM;
  throw ConfigError("Unknown storage backend: " + name);
}

SyncConfig load_config(const std::string& path) {
  SyncConfig cfg;
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  }
  catch (const YAML::Exception& e) {
    throw ConfigError("Failed to load config " + path + ": " + e.what());
  }

  try {
    if (auto node = root["sync"]) {
      cfg.sync.workers = get_or_default<std::size_t>(node, "workers", cfg.sync.workers);
      cfg.sync.max_attempts = get_or_default<unsigned int>(node, "max_attempts", cfg.sync.max_attempts);
      cfg.sync.backoff_initial = get_millis(node, "backoff_initial_ms", cfg.sync.backoff_initial);
      cfg.sync.backoff_max = get_millis(node, "backoff_max_ms", cfg.sync.backoff_max);
      cfg.sync.timestamp_tolerance = get_millis(node, "timestamp_tolerance_ms", cfg.sync.timestamp_tolerance);
      cfg.sync.delete_stale = get_or_default(node, "delete_stale", cfg.sync.delete_stale);
      cfg.sync.compute_hashes = get_or_default(node, "compute_hashes", cfg.sync.compute_hashes);
      cfg.sync.key_prefix = get_or_default(node, "key_prefix", cfg.sync.key_prefix);
    }

    if (auto node = root["storage"]) {
      if (node["backend"]) {
        cfg.storage.backend = parse_backend(node["backend"].as<std::string>());
      }
      if (auto s3 = node["s3"]) {
        cfg.storage.s3.endpoint = get_or_default(s3, "endpoint", cfg.storage.s3.endpoint);
        cfg.storage.s3.credentials.region = get_or_default(s3, "region", cfg.storage.s3.credentials.region);
        cfg.storage.s3.credentials.access_key = get_or_default(s3, "access_key", cfg.storage.s3.credentials.access_key);
        cfg.storage.s3.credentials.secret_key = get_or_default(s3, "secret_key", cfg.storage.s3.credentials.secret_key);
        cfg.storage.s3.timeout = std::chrono::seconds(get_or_default<long long>(s3, "timeout_seconds", cfg.storage.s3.timeout.count()));
      }
      if (auto local = node["filesystem"]) {
        cfg.storage.filesystem_root = get_or_default(local, "root", cfg.storage.filesystem_root);
      }
    }

    if (auto node = root["logging"]) {
      cfg.logging.file = get_or_default(node, "file", cfg.logging.file);
      cfg.logging.level = get_or_default(node, "level", cfg.logging.level);
      cfg.logging.console = get_or_default(node, "console", cfg.logging.console);
    }
  }
  catch (const YAML::Exception& e) {
    throw ConfigError("Invalid value in config " + path + ": " + e.what());
  }

  return cfg;
}

void apply_environment(SyncConfig& config) {
  if (const char* value = env("AWS_ACCESS_KEY_ID")) {
    config.storage.s3.credentials.access_key = value;
  }
  if (const char* value = env("AWS_SECRET_ACCESS_KEY")) {
    config.storage.s3.credentials.secret_key = value;
  }
  if (const char* value = env("AWS_SESSION_TOKEN")) {
    config.storage.s3.credentials.session_token = value;
  }
  if (const char* value = env("AWS_REGION")) {
    config.storage.s3.credentials.region = value;
  } else if (const char* fallback = env("AWS_DEFAULT_REGION")) {
    config.storage.s3.credentials.region = fallback;
  }
  if (const char* value = env("AWS_ENDPOINT_URL")) {
    config.storage.s3.endpoint = value;
  }
}

std::string default_config_path() {
  if (const char* value = env("BUCKETSYNC_CONFIG")) {
    return value;
  }
  if (const char* home = env("HOME")) {
    return std::string(home) + "/.config/bucketsync/config.yaml";
  }
  return {};
}

void validate(const SyncConfig& config) {
  if (config.sync.max_attempts == 0) {
    throw ConfigError("sync.max_attempts must be at least 1");
  }
  if (config.sync.backoff_initial.count() < 0 || config.sync.backoff_max < config.sync.backoff_initial) {
    throw ConfigError("sync.backoff_max_ms must be >= sync.backoff_initial_ms >= 0");
  }
  if (config.sync.timestamp_tolerance.count() < 0) {
    throw ConfigError("sync.timestamp_tolerance_ms must not be negative");
  }
  if (config.storage.backend == Backend::FILESYSTEM && config.storage.filesystem_root.empty()) {
    throw ConfigError("storage.filesystem.root is required for the filesystem backend");
  }
  BOOST_LOG_TRIVIAL(debug) << "Config: Validated, workers=" << config.effective_workers()
                           << " max_attempts=" << config.sync.max_attempts;
}

} // namespace config
} // namespace bsync
