#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include "config/config.hpp"
#include "fake_object_store.hpp"
#include "fs/file_system.hpp"
#include "mock_object_store.hpp"
#include "sync/transfer_orchestrator.hpp"
#include "test_utils.hpp"

using namespace bsync;
using namespace bsync::sync;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class TransferOrchestratorTest : public ::testing::Test {
protected:
  std::filesystem::path root;
  config::SyncConfig config;
  fs::LocalFileSystem files;
  PathKeyMapper mapper;
  test::FakeObjectStore store;
  CancellationToken token;
  Manifest source;

  void SetUp() override {
    root = make_temp_dir("orchestrator_test");
    config.sync.workers = 4;
    config.sync.backoff_initial = std::chrono::milliseconds(1);
    config.sync.backoff_max = std::chrono::milliseconds(4);
  }

  void TearDown() override {
    std::filesystem::remove_all(root);
  }

  static TransferTask task(const std::string& path, TransferDirection direction = TransferDirection::UPLOAD,
                           TransferReason reason = TransferReason::NEW) {
    return TransferTask{RelativePath::parse(path), direction, reason};
  }

  std::vector<TransferResult> run(const std::vector<TransferTask>& tasks) {
    TransferOrchestrator orchestrator(config, store, files, mapper, root);
    return orchestrator.run(tasks, source, token);
  }
};

TEST_F(TransferOrchestratorTest, UploadsEveryTask) {
  write_text_file(root / "a.txt", "hello");
  write_text_file(root / "sub" / "b.txt", "world");

  auto results = run({task("a.txt"), task("sub/b.txt")});

  ASSERT_EQ(results.size(), 2u);
  for (const auto& result : results) {
    EXPECT_EQ(result.outcome, TransferOutcome::SUCCEEDED) << result.relative_path;
    EXPECT_EQ(result.attempts, 1u);
    EXPECT_FALSE(result.error_detail.has_value());
  }
  EXPECT_EQ(store.data("a.txt"), "hello");
  EXPECT_EQ(store.data("sub/b.txt"), "world");
}

TEST_F(TransferOrchestratorTest, TransientFailuresAreRetried) {
  write_text_file(root / "a.txt", "hello");
  store.fail_key("a.txt", storage::StorageErrorKind::TRANSIENT, 2);

  auto results = run({task("a.txt")});

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].outcome, TransferOutcome::SUCCEEDED);
  EXPECT_EQ(results[0].attempts, 3u);
  EXPECT_EQ(store.put_calls(), 3);
}

TEST_F(TransferOrchestratorTest, RetriesStopAtAttemptCeiling) {
  write_text_file(root / "a.txt", "hello");
  store.fail_key("a.txt", storage::StorageErrorKind::TRANSIENT, -1);

  auto results = run({task("a.txt")});

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].outcome, TransferOutcome::FAILED);
  EXPECT_EQ(results[0].attempts, config.sync.max_attempts);
  EXPECT_EQ(store.put_calls(), static_cast<int>(config.sync.max_attempts));
  ASSERT_TRUE(results[0].error_detail.has_value());
}

TEST_F(TransferOrchestratorTest, PermanentFailuresAreNotRetried) {
  write_text_file(root / "a.txt", "hello");
  store.fail_key("a.txt", storage::StorageErrorKind::PERMISSION_DENIED, -1);

  auto results = run({task("a.txt")});

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].outcome, TransferOutcome::FAILED);
  EXPECT_EQ(results[0].attempts, 1u);
  EXPECT_EQ(store.put_calls(), 1);
}

TEST_F(TransferOrchestratorTest, MissingLocalFileFailsPermanently) {
  auto results = run({task("gone.txt")});

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].outcome, TransferOutcome::FAILED);
  EXPECT_EQ(results[0].attempts, 1u);
  EXPECT_EQ(store.put_calls(), 0);
}

TEST_F(TransferOrchestratorTest, OneFailureDoesNotAffectOthers) {
  std::vector<TransferTask> tasks;
  for (int i = 0; i < 10; ++i) {
    const std::string name = "file" + std::to_string(i) + ".txt";
    write_text_file(root / name, "content " + std::to_string(i));
    tasks.push_back(task(name));
  }
  store.fail_key("file3.txt", storage::StorageErrorKind::PERMISSION_DENIED, -1);

  auto results = run(tasks);

  ASSERT_EQ(results.size(), 10u);
  int succeeded = 0;
  for (const auto& result : results) {
    if (result.relative_path.str() == "file3.txt") {
      EXPECT_EQ(result.outcome, TransferOutcome::FAILED);
    } else {
      EXPECT_EQ(result.outcome, TransferOutcome::SUCCEEDED);
      ++succeeded;
    }
  }
  EXPECT_EQ(succeeded, 9);
  EXPECT_FALSE(store.has("file3.txt"));
}

TEST_F(TransferOrchestratorTest, DownloadsWriteFilesAndTimestamps) {
  const auto remote_time = std::chrono::system_clock::from_time_t(1600000000);
  store.set_object("a.txt", "hello", remote_time);
  store.set_object("sub/deep/b.txt", "world", remote_time);

  ManifestEntry entry;
  entry.relative_path = RelativePath::parse("a.txt");
  entry.size = 5;
  entry.last_modified = remote_time;
  source.add(entry);

  auto results = run({task("a.txt", TransferDirection::DOWNLOAD),
                      task("sub/deep/b.txt", TransferDirection::DOWNLOAD)});

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].outcome, TransferOutcome::SUCCEEDED);
  EXPECT_EQ(results[1].outcome, TransferOutcome::SUCCEEDED);
  EXPECT_EQ(read_text_file(root / "a.txt"), "hello");
  EXPECT_EQ(read_text_file(root / "sub" / "deep" / "b.txt"), "world");
  EXPECT_EQ(files.stat(root / "a.txt").mtime, remote_time);
}

TEST_F(TransferOrchestratorTest, MissingRemoteObjectFailsWithoutRetry) {
  auto results = run({task("nope.txt", TransferDirection::DOWNLOAD)});

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].outcome, TransferOutcome::FAILED);
  EXPECT_EQ(results[0].attempts, 1u);
  EXPECT_FALSE(std::filesystem::exists(root / "nope.txt"));
}

TEST_F(TransferOrchestratorTest, StaleTasksRemoveDestinationCopy) {
  store.set_object("old.txt", "x");
  write_text_file(root / "local-old.txt", "y");

  auto results = run({task("old.txt", TransferDirection::UPLOAD, TransferReason::STALE_LOCAL_ONLY),
                      task("local-old.txt", TransferDirection::DOWNLOAD, TransferReason::STALE_LOCAL_ONLY)});

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].outcome, TransferOutcome::SUCCEEDED);
  EXPECT_EQ(results[1].outcome, TransferOutcome::SUCCEEDED);
  EXPECT_FALSE(store.has("old.txt"));
  EXPECT_FALSE(std::filesystem::exists(root / "local-old.txt"));
}

TEST_F(TransferOrchestratorTest, CancelledRunSkipsUndispatchedTasks) {
  write_text_file(root / "a.txt", "hello");
  write_text_file(root / "b.txt", "world");
  token.cancel();

  auto results = run({task("a.txt"), task("b.txt")});

  ASSERT_EQ(results.size(), 2u);
  for (const auto& result : results) {
    EXPECT_EQ(result.outcome, TransferOutcome::SKIPPED);
    EXPECT_EQ(result.attempts, 1u);
    EXPECT_EQ(result.error_detail.value_or(""), "cancelled");
  }
  EXPECT_EQ(store.put_calls(), 0);
}

TEST_F(TransferOrchestratorTest, CancellationInterruptsBackoff) {
  config.sync.backoff_initial = std::chrono::milliseconds(10000);
  config.sync.backoff_max = std::chrono::milliseconds(10000);
  write_text_file(root / "a.txt", "hello");
  store.fail_key("a.txt", storage::StorageErrorKind::TRANSIENT, -1);

  std::thread canceller([this]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token.cancel();
  });

  const auto start = std::chrono::steady_clock::now();
  auto results = run({task("a.txt")});
  const auto elapsed = std::chrono::steady_clock::now() - start;
  canceller.join();

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].outcome, TransferOutcome::FAILED);
  EXPECT_EQ(results[0].error_detail.value_or(""), "cancelled during retry");
  EXPECT_EQ(results[0].attempts, 1u);
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(TransferOrchestratorTest, BackoffDoublesUpToCap) {
  config.sync.backoff_initial = std::chrono::milliseconds(200);
  config.sync.backoff_max = std::chrono::milliseconds(5000);
  TransferOrchestrator orchestrator(config, store, files, mapper, root);

  EXPECT_EQ(orchestrator.backoff_delay(1), std::chrono::milliseconds(200));
  EXPECT_EQ(orchestrator.backoff_delay(2), std::chrono::milliseconds(400));
  EXPECT_EQ(orchestrator.backoff_delay(3), std::chrono::milliseconds(800));
  EXPECT_EQ(orchestrator.backoff_delay(6), std::chrono::milliseconds(5000));
  EXPECT_EQ(orchestrator.backoff_delay(40), std::chrono::milliseconds(5000));
}

TEST_F(TransferOrchestratorTest, EmptyPlanRunsNothing) {
  EXPECT_TRUE(run({}).empty());
}

TEST_F(TransferOrchestratorTest, MockStoreSeesRetriedPut) {
  write_text_file(root / "a.txt", "hello");
  test::MockObjectStore mock;
  EXPECT_CALL(mock, put_object("a.txt", _))
    .WillOnce(Throw(storage::StorageError(storage::StorageErrorKind::TRANSIENT, "503 SlowDown")))
    .WillOnce(Return());

  TransferOrchestrator orchestrator(config, mock, files, mapper, root);
  auto results = orchestrator.run({task("a.txt")}, source, token);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].outcome, TransferOutcome::SUCCEEDED);
  EXPECT_EQ(results[0].attempts, 2u);
}

TEST_F(TransferOrchestratorTest, UnexpectedExceptionFailsOnlyItsTask) {
  write_text_file(root / "a.txt", "hello");
  write_text_file(root / "b.txt", "world");
  test::MockObjectStore mock;
  EXPECT_CALL(mock, put_object("a.txt", _)).WillOnce(Throw(std::runtime_error("boom")));
  EXPECT_CALL(mock, put_object("b.txt", _)).WillOnce(Return());

  TransferOrchestrator orchestrator(config, mock, files, mapper, root);
  auto results = orchestrator.run({task("a.txt"), task("b.txt")}, source, token);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].outcome, TransferOutcome::FAILED);
  EXPECT_EQ(results[0].attempts, 1u);
  EXPECT_THAT(results[0].error_detail.value_or(""), ::testing::HasSubstr("boom"));
  EXPECT_EQ(results[1].outcome, TransferOutcome::SUCCEEDED);
}

TEST_F(TransferOrchestratorTest, DownloadBelowSymlinkedDirectoryFails) {
  auto outside = make_temp_dir("orchestrator_outside");
  std::filesystem::create_directory_symlink(outside, root / "sub");
  store.set_object("sub/b.txt", "world");
  store.set_object("c.txt", "fine");

  auto results = run({task("sub/b.txt", TransferDirection::DOWNLOAD),
                      task("c.txt", TransferDirection::DOWNLOAD)});

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].relative_path.str(), "c.txt");
  EXPECT_EQ(results[0].outcome, TransferOutcome::SUCCEEDED);
  EXPECT_EQ(results[1].outcome, TransferOutcome::FAILED);
  EXPECT_EQ(results[1].attempts, 1u);
  EXPECT_EQ(store.get_calls(), 1);
  EXPECT_FALSE(std::filesystem::exists(outside / "b.txt"));

  std::filesystem::remove_all(outside);
}

TEST_F(TransferOrchestratorTest, MockStoreKeysCarryPrefix) {
  write_text_file(root / "sub" / "b.txt", "world");
  PathKeyMapper prefixed("laptop");
  test::MockObjectStore mock;
  EXPECT_CALL(mock, put_object("laptop/sub/b.txt", _)).Times(1);

  TransferOrchestrator orchestrator(config, mock, files, prefixed, root);
  auto results = orchestrator.run({task("sub/b.txt")}, source, token);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].outcome, TransferOutcome::SUCCEEDED);
}
