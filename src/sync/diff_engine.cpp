#include "sync/diff_engine.hpp"
#include <boost/log/trivial.hpp>

namespace bsync {
namespace sync {

DiffEngine::DiffEngine(const config::SyncConfig& config)
  : config_(config) {
}

bool DiffEngine::is_equivalent(const ManifestEntry& source, const ManifestEntry& destination) const {
  if (source.content_hash && destination.content_hash) {
    return *source.content_hash == *destination.content_hash;
  }
  if (source.size != destination.size) {
    return false;
  }
  return source.last_modified <= destination.last_modified + config_.sync.timestamp_tolerance;
}

DiffResult DiffEngine::compute(const Manifest& source, const Manifest& destination,
                               TransferDirection direction) const {
  DiffResult result;

  // Both maps iterate in canonical order, so tasks come out sorted
  for (const auto& [path, entry] : source) {
    const ManifestEntry* existing = destination.find(path);
    if (existing == nullptr) {
      result.tasks.push_back(TransferTask{path, direction, TransferReason::NEW});
      continue;
    }
    if (is_equivalent(entry, *existing)) {
      result.unchanged.push_back(path);
      continue;
    }
    BOOST_LOG_TRIVIAL(debug) << "Diff: " << path << " differs (size " << entry.size << " vs "
                             << existing->size << ", mtime " << format_timestamp(entry.last_modified)
                             << " vs " << format_timestamp(existing->last_modified) << ")";
    result.tasks.push_back(TransferTask{path, direction, TransferReason::MODIFIED});
  }

  std::vector<TransferTask> removals;
  for (const auto& [path, entry] : destination) {
    if (source.contains(path)) {
      continue;
    }
    result.stale.push_back(path);
    if (config_.sync.delete_stale) {
      removals.push_back(TransferTask{path, direction, TransferReason::STALE_LOCAL_ONLY});
    }
  }

  // Merge removals into path order
  if (!removals.empty()) {
    std::vector<TransferTask> merged;
    merged.reserve(result.tasks.size() + removals.size());
    auto a = result.tasks.begin();
    auto b = removals.begin();
    while (a != result.tasks.end() || b != removals.end()) {
      if (b == removals.end() || (a != result.tasks.end() && a->relative_path < b->relative_path)) {
        merged.push_back(std::move(*a++));
      } else {
        merged.push_back(std::move(*b++));
      }
    }
    result.tasks = std::move(merged);
  }

  BOOST_LOG_TRIVIAL(info) << "Diff: " << result.tasks.size() << " task(s), " << result.unchanged.size()
                          << " unchanged, " << result.stale.size() << " only on destination"
                          << (config_.sync.delete_stale ? " (removal enabled)" : "");
  return result;
}

} // namespace sync
} // namespace bsync
