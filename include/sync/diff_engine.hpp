#ifndef BSYNC_DIFF_ENGINE_HPP
#define BSYNC_DIFF_ENGINE_HPP

#include <vector>
#include "config/config.hpp"
#include "sync/types.hpp"

namespace bsync {
namespace sync {

struct DiffResult {
  // Canonical path order
  std::vector<TransferTask> tasks;
  // Source entries already present and equivalent on the destination
  std::vector<RelativePath> unchanged;
  // Destination-only entries, whether or not removal tasks were queued for them
  std::vector<RelativePath> stale;
};

/**
 * Compares a source manifest with a destination manifest.
 *
 * Every source entry ends up in exactly one of tasks (NEW or MODIFIED) or
 * unchanged. Destination-only entries are always listed in stale and only
 * become STALE_LOCAL_ONLY tasks when delete_stale is enabled.
 */
class DiffEngine {
public:
  explicit DiffEngine(const config::SyncConfig& config);

  DiffResult compute(const Manifest& source, const Manifest& destination, TransferDirection direction) const;

  // Equal hashes when both are known; otherwise equal sizes and a source
  // that is not newer than the destination beyond the timestamp tolerance
  bool is_equivalent(const ManifestEntry& source, const ManifestEntry& destination) const;

private:
  const config::SyncConfig& config_;
};

} // namespace sync
} // namespace bsync

#endif // BSYNC_DIFF_ENGINE_HPP
