#ifndef BSYNC_SYNC_CONTROLLER_HPP
#define BSYNC_SYNC_CONTROLLER_HPP

#include <filesystem>
#include "config/config.hpp"
#include "fs/file_system.hpp"
#include "storage/object_store.hpp"
#include "sync/cancellation.hpp"
#include "sync/path_key_mapper.hpp"
#include "sync/sync_state.hpp"
#include "sync/types.hpp"

namespace bsync {
namespace sync {

/**
 * Drives one backup or restore run through its phases:
 * scan source, scan destination, diff, transfer, summarize.
 *
 * A ScanError in either scan moves the run to ABORTED and no transfer is
 * attempted. Every other failure is recorded per task in the summary.
 */
class SyncController {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws InvalidPathError if the configured key prefix is invalid
  SyncController(const config::SyncConfig& config,
                 storage::ObjectStore& store,
                 fs::FileSystem& files,
                 CancellationToken& token);


  // ---- SYNC OPERATIONS ----
  // Local directory to bucket
  SyncSummary backup(const std::filesystem::path& local_root);
  // Bucket to local directory; the directory is created if missing
  SyncSummary restore(const std::filesystem::path& local_root);


  // ---- GETTERS ----
  SyncState::State state() const { return state_.get_state(); }

private:
  // ---- PARAMETERS ----
  const config::SyncConfig& config_;
  storage::ObjectStore& store_;
  fs::FileSystem& files_;
  CancellationToken& token_;
  PathKeyMapper mapper_;
  SyncState state_;


  // ---- HELPERS ----
  SyncSummary run(TransferDirection direction, const std::filesystem::path& local_root);
  void advance(SyncState::State next);
  SyncSummary abort_run(const std::string& reason, SyncSummary summary);
  void prepare_local_root(const std::filesystem::path& local_root);
  void recreate_directories(const Manifest& remote, const std::filesystem::path& local_root, SyncSummary& summary);
};

} // namespace sync
} // namespace bsync

#endif // BSYNC_SYNC_CONTROLLER_HPP
