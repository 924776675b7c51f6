#ifndef BSYNC_TRANSFER_ORCHESTRATOR_HPP
#define BSYNC_TRANSFER_ORCHESTRATOR_HPP

#include <chrono>
#include <filesystem>
#include <vector>
#include "config/config.hpp"
#include "fs/file_system.hpp"
#include "storage/object_store.hpp"
#include "sync/cancellation.hpp"
#include "sync/path_key_mapper.hpp"
#include "sync/types.hpp"

namespace bsync {
namespace sync {

/**
 * Executes a transfer plan on a bounded worker pool.
 *
 * Each task is attempted until it succeeds, fails permanently, or runs out of
 * attempts. Transient storage failures are retried with exponential backoff.
 * A failing task never stops the others: run() returns one result per task,
 * sorted by path.
 */
class TransferOrchestrator {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransferOrchestrator(const config::SyncConfig& config,
                       storage::ObjectStore& store,
                       fs::FileSystem& files,
                       const PathKeyMapper& mapper,
                       std::filesystem::path local_root);


  // ---- EXECUTION ----
  // source supplies the last-modified time applied to downloaded files
  std::vector<TransferResult> run(const std::vector<TransferTask>& tasks,
                                  const Manifest& source,
                                  CancellationToken& token);

  // Delay before the given retry (1 for the first retry)
  std::chrono::milliseconds backoff_delay(unsigned int retry) const;

private:
  // ---- PARAMETERS ----
  const config::SyncConfig& config_;
  storage::ObjectStore& store_;
  fs::FileSystem& files_;
  const PathKeyMapper& mapper_;
  std::filesystem::path local_root_;


  // ---- TASK EXECUTION ----
  TransferResult execute(const TransferTask& task, const ManifestEntry* source_entry, CancellationToken& token);
  // One attempt; throws TransientTransferError or PermanentTransferError
  void attempt(const TransferTask& task, const ManifestEntry* source_entry);

  void upload(const std::string& key, const std::filesystem::path& native);
  void download(const std::string& key, const std::filesystem::path& native, const ManifestEntry* source_entry);
  void remove_stale(const TransferTask& task, const std::string& key, const std::filesystem::path& native);
};

} // namespace sync
} // namespace bsync

#endif // BSYNC_TRANSFER_ORCHESTRATOR_HPP
