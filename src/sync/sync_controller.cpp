#include "sync/sync_controller.hpp"
#include "sync/diff_engine.hpp"
#include "sync/sync_error.hpp"
#include "sync/transfer_orchestrator.hpp"
#include "sync/tree_scanner.hpp"
#include <future>
#include <boost/log/trivial.hpp>

namespace bsync {
namespace sync {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SyncController::SyncController(const config::SyncConfig& config,
                               storage::ObjectStore& store,
                               fs::FileSystem& files,
                               CancellationToken& token)
  : config_(config)
  , store_(store)
  , files_(files)
  , token_(token)
  , mapper_(config.sync.key_prefix) {
}


//==============================================
// SYNC OPERATIONS
//==============================================

SyncSummary SyncController::backup(const std::filesystem::path& local_root) {
  BOOST_LOG_TRIVIAL(info) << "Controller: Backing up " << local_root.string() << " to bucket " << store_.bucket();
  return run(TransferDirection::UPLOAD, local_root);
}

SyncSummary SyncController::restore(const std::filesystem::path& local_root) {
  BOOST_LOG_TRIVIAL(info) << "Controller: Restoring bucket " << store_.bucket() << " to " << local_root.string();
  return run(TransferDirection::DOWNLOAD, local_root);
}

SyncSummary SyncController::run(TransferDirection direction, const std::filesystem::path& local_root) {
  state_ = SyncState();
  SyncSummary summary;
  const bool uploading = direction == TransferDirection::UPLOAD;

  TreeScanner scanner(config_, mapper_, files_);
  Manifest source;
  Manifest destination;

  advance(SyncState::State::SCANNING_SOURCE);
  if (!uploading) {
    try {
      prepare_local_root(local_root);
    }
    catch (const ScanError& e) {
      return abort_run(e.what(), std::move(summary));
    }
  }

  // The two scans are independent reads and run side by side
  auto scan_local = [&scanner, &local_root]() { return scanner.scan_local(local_root); };
  auto scan_remote = [this, &scanner]() { return scanner.scan_remote(store_); };
  std::future<Manifest> source_scan = uploading
    ? std::async(std::launch::async, scan_local)
    : std::async(std::launch::async, scan_remote);
  std::future<Manifest> dest_scan = uploading
    ? std::async(std::launch::async, scan_remote)
    : std::async(std::launch::async, scan_local);

  try {
    source = source_scan.get();
  }
  catch (const ScanError& e) {
    dest_scan.wait();
    return abort_run(e.what(), std::move(summary));
  }

  advance(SyncState::State::SCANNING_DEST);
  try {
    destination = dest_scan.get();
  }
  catch (const ScanError& e) {
    return abort_run(e.what(), std::move(summary));
  }

  summary.rejected = source.rejected();
  summary.rejected.insert(summary.rejected.end(), destination.rejected().begin(), destination.rejected().end());

  advance(SyncState::State::DIFFING);
  DiffEngine diff(config_);
  DiffResult plan = diff.compute(source, destination, direction);

  for (const auto& path : plan.unchanged) {
    if (uploading) {
      BOOST_LOG_TRIVIAL(info) << "File " << path << " was not uploaded (has not been modified locally since it was backed up)";
    } else {
      BOOST_LOG_TRIVIAL(info) << "File " << path << " was not downloaded (local copy is up to date)";
    }
  }
  summary.unchanged = plan.unchanged.size();
  summary.skipped = plan.unchanged.size();
  if (!config_.sync.delete_stale) {
    summary.stale_ignored = plan.stale.size();
  }

  advance(SyncState::State::TRANSFERRING);
  if (!uploading) {
    recreate_directories(source, local_root, summary);
  }
  TransferOrchestrator orchestrator(config_, store_, files_, mapper_, local_root);
  std::vector<TransferResult> results = orchestrator.run(plan.tasks, source, token_);

  advance(SyncState::State::SUMMARIZING);
  for (const auto& result : results) {
    switch (result.outcome) {
      case TransferOutcome::SUCCEEDED:
        ++summary.succeeded;
        break;
      case TransferOutcome::FAILED:
        ++summary.failed;
        summary.failures.emplace_back(result.relative_path.str(), result.error_detail.value_or("unknown error"));
        break;
      case TransferOutcome::SKIPPED:
        ++summary.skipped;
        break;
    }
  }
  summary.cancelled = token_.is_cancelled();

  advance(SyncState::State::DONE);
  summary.final_state = state_.get_state_string();

  BOOST_LOG_TRIVIAL(info) << "Controller: Finished with " << summary.succeeded << " succeeded, " << summary.failed
                          << " failed, " << summary.skipped << " skipped"
                          << (summary.cancelled ? " (cancelled)" : "");
  return summary;
}


//==============================================
// HELPERS
//==============================================

void SyncController::advance(SyncState::State next) {
  const auto previous = state_.get_state();
  if (!state_.transition_to(next)) {
    BOOST_LOG_TRIVIAL(error) << "Controller: Invalid state transition " << previous << " -> " << next;
    throw SyncError("invalid state transition from " + SyncState::state_to_string(previous) +
                    " to " + SyncState::state_to_string(next));
  }
  BOOST_LOG_TRIVIAL(debug) << "Controller: " << previous << " -> " << next;
}

SyncSummary SyncController::abort_run(const std::string& reason, SyncSummary summary) {
  advance(SyncState::State::ABORTED);
  BOOST_LOG_TRIVIAL(error) << "Controller: Run aborted: " << reason;
  summary.aborted = true;
  summary.abort_reason = reason;
  summary.cancelled = token_.is_cancelled();
  summary.final_state = state_.get_state_string();
  return summary;
}

void SyncController::prepare_local_root(const std::filesystem::path& local_root) {
  try {
    if (files_.stat(local_root).type == fs::FileType::NOT_FOUND) {
      BOOST_LOG_TRIVIAL(info) << "Controller: Creating directory " << local_root.string();
      files_.ensure_dir(local_root);
    }
  }
  catch (const fs::FileSystemError& e) {
    throw ScanError(e.what());
  }
}

void SyncController::recreate_directories(const Manifest& remote, const std::filesystem::path& local_root,
                                          SyncSummary& summary) {
  for (const auto& dir : remote.directories()) {
    try {
      fs::reject_symlinked_parents(files_, local_root, PathKeyMapper::to_native({}, dir));
      files_.ensure_dir(PathKeyMapper::to_native(local_root, dir));
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Controller: Cannot create directory " << dir << ": " << e.what();
      ++summary.failed;
      summary.failures.emplace_back(dir.str() + "/", e.what());
    }
  }
}

} // namespace sync
} // namespace bsync
