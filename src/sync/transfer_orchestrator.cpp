#include "sync/transfer_orchestrator.hpp"
#include "sync/result_collector.hpp"
#include "sync/sync_error.hpp"
#include <algorithm>
#include <new>
#include <sstream>
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>

namespace bsync {
namespace sync {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferOrchestrator::TransferOrchestrator(const config::SyncConfig& config,
                                           storage::ObjectStore& store,
                                           fs::FileSystem& files,
                                           const PathKeyMapper& mapper,
                                           std::filesystem::path local_root)
  : config_(config)
  , store_(store)
  , files_(files)
  , mapper_(mapper)
  , local_root_(std::move(local_root)) {
}


//==============================================
// EXECUTION
//==============================================

std::vector<TransferResult> TransferOrchestrator::run(const std::vector<TransferTask>& tasks,
                                                      const Manifest& source,
                                                      CancellationToken& token) {
  if (tasks.empty()) {
    return {};
  }

  const std::size_t workers = std::min(config_.effective_workers(), tasks.size());
  BOOST_LOG_TRIVIAL(info) << "Orchestrator: Running " << tasks.size() << " task(s) on " << workers << " worker(s)";

  ResultCollector collector;
  {
    boost::asio::thread_pool pool(workers);
    for (const auto& task : tasks) {
      const ManifestEntry* entry = source.find(task.relative_path);
      boost::asio::post(pool, [this, &collector, &token, &task, entry]() {
        collector.add(execute(task, entry, token));
      });
    }
    pool.join();
  }

  std::vector<TransferResult> results = collector.take_all();
  std::sort(results.begin(), results.end(), [](const TransferResult& a, const TransferResult& b) {
    return a.relative_path < b.relative_path;
  });
  return results;
}

std::chrono::milliseconds TransferOrchestrator::backoff_delay(unsigned int retry) const {
  std::chrono::milliseconds delay = config_.sync.backoff_initial;
  for (unsigned int i = 1; i < retry && delay < config_.sync.backoff_max; ++i) {
    delay *= 2;
  }
  return std::min(delay, config_.sync.backoff_max);
}

TransferResult TransferOrchestrator::execute(const TransferTask& task, const ManifestEntry* source_entry,
                                             CancellationToken& token) {
  TransferResult result;
  result.relative_path = task.relative_path;

  if (token.is_cancelled()) {
    BOOST_LOG_TRIVIAL(info) << "Orchestrator: Skipping " << task.relative_path << " (cancelled)";
    result.outcome = TransferOutcome::SKIPPED;
    result.error_detail = "cancelled";
    return result;
  }

  const unsigned int max_attempts = std::max(1u, config_.sync.max_attempts);
  for (result.attempts = 1; ; ++result.attempts) {
    try {
      attempt(task, source_entry);
      result.outcome = TransferOutcome::SUCCEEDED;
      return result;
    }
    catch (const TransientTransferError& e) {
      if (result.attempts >= max_attempts) {
        BOOST_LOG_TRIVIAL(error) << "Orchestrator: Giving up on " << task.relative_path << " after "
                                 << result.attempts << " attempt(s): " << e.what();
        result.outcome = TransferOutcome::FAILED;
        result.error_detail = e.what();
        return result;
      }

      auto delay = backoff_delay(result.attempts);
      BOOST_LOG_TRIVIAL(warning) << "Orchestrator: Attempt " << result.attempts << " for " << task.relative_path
                                 << " failed, retrying in " << delay.count() << " ms: " << e.what();
      if (token.wait_for(delay)) {
        result.outcome = TransferOutcome::FAILED;
        result.error_detail = "cancelled during retry";
        return result;
      }
    }
    catch (const PermanentTransferError& e) {
      BOOST_LOG_TRIVIAL(error) << "Orchestrator: " << task.relative_path << " failed: " << e.what();
      result.outcome = TransferOutcome::FAILED;
      result.error_detail = e.what();
      return result;
    }
  }
}

void TransferOrchestrator::attempt(const TransferTask& task, const ManifestEntry* source_entry) {
  try {
    const std::string key = mapper_.to_key(task.relative_path);
    const std::filesystem::path native = PathKeyMapper::to_native(local_root_, task.relative_path);

    if (task.direction == TransferDirection::DOWNLOAD) {
      fs::reject_symlinked_parents(files_, local_root_, PathKeyMapper::to_native({}, task.relative_path));
    }

    if (task.reason == TransferReason::STALE_LOCAL_ONLY) {
      remove_stale(task, key, native);
    } else if (task.direction == TransferDirection::UPLOAD) {
      upload(key, native);
    } else {
      download(key, native, source_entry);
    }
  }
  catch (const storage::StorageError& e) {
    if (e.is_transient()) {
      throw TransientTransferError(e.what());
    }
    throw PermanentTransferError(e.what());
  }
  catch (const fs::FileSystemError& e) {
    throw PermanentTransferError(e.what());
  }
  catch (const InvalidPathError& e) {
    throw PermanentTransferError(e.what());
  }
  catch (const std::bad_alloc&) {
    throw PermanentTransferError("out of memory");
  }
  catch (const std::exception& e) {
    throw PermanentTransferError(e.what());
  }
}


//==============================================
// TRANSFER OPERATIONS
//==============================================

void TransferOrchestrator::upload(const std::string& key, const std::filesystem::path& native) {
  auto input = files_.open_read(native);
  store_.put_object(key, *input);
  BOOST_LOG_TRIVIAL(info) << "Uploaded file " << native.string() << " to " << store_.bucket() << "/" << key;
}

void TransferOrchestrator::download(const std::string& key, const std::filesystem::path& native,
                                    const ManifestEntry* source_entry) {
  std::stringstream buffer(std::ios::in | std::ios::out | std::ios::binary);
  store_.get_object(key, buffer);
  buffer.seekg(0, std::ios::beg);
  files_.write_file(native, buffer);
  if (source_entry != nullptr) {
    files_.set_mtime(native, source_entry->last_modified);
  }
  BOOST_LOG_TRIVIAL(info) << "Downloaded file " << store_.bucket() << "/" << key << " to " << native.string();
}

void TransferOrchestrator::remove_stale(const TransferTask& task, const std::string& key,
                                        const std::filesystem::path& native) {
  if (task.direction == TransferDirection::UPLOAD) {
    store_.delete_object(key);
    BOOST_LOG_TRIVIAL(info) << "Deleted object " << store_.bucket() << "/" << key << " (no longer present locally)";
  } else {
    files_.remove_file(native);
    BOOST_LOG_TRIVIAL(info) << "Deleted file " << native.string() << " (no longer present in bucket)";
  }
}

} // namespace sync
} // namespace bsync
