#include <gtest/gtest.h>
#include <filesystem>
#include "config/config.hpp"
#include "fake_object_store.hpp"
#include "fs/file_system.hpp"
#include "sync/sync_error.hpp"
#include "sync/tree_scanner.hpp"
#include "test_utils.hpp"

using namespace bsync;
using namespace bsync::sync;

class TreeScannerTest : public ::testing::Test {
protected:
  std::filesystem::path root;
  config::SyncConfig config;
  fs::LocalFileSystem files;
  PathKeyMapper mapper;

  void SetUp() override {
    root = make_temp_dir("tree_scanner_test");
  }

  void TearDown() override {
    std::filesystem::remove_all(root);
  }

  Manifest scan() {
    TreeScanner scanner(config, mapper, files);
    return scanner.scan_local(root);
  }
};

TEST_F(TreeScannerTest, RegularFilesBecomeEntries) {
  write_text_file(root / "a.txt", "hello");
  write_text_file(root / "sub" / "b.txt", "world");
  write_text_file(root / "sub" / "deeper" / "c.bin", "");

  Manifest manifest = scan();

  ASSERT_EQ(manifest.size(), 3u);
  const ManifestEntry* a = manifest.find(RelativePath::parse("a.txt"));
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->size, 5u);
  ASSERT_TRUE(a->content_hash.has_value());
  EXPECT_EQ(*a->content_hash, "5d41402abc4b2a76b9719d911017c592");
  EXPECT_TRUE(manifest.contains(RelativePath::parse("sub/b.txt")));
  EXPECT_TRUE(manifest.contains(RelativePath::parse("sub/deeper/c.bin")));
  EXPECT_EQ(manifest.total_bytes(), 10u);
}

TEST_F(TreeScannerTest, SymlinksAreSkipped) {
  write_text_file(root / "real.txt", "data");
  std::filesystem::create_directories(root / "realdir");
  write_text_file(root / "realdir" / "inner.txt", "inner");
  std::filesystem::create_symlink(root / "real.txt", root / "link.txt");
  std::filesystem::create_directory_symlink(root / "realdir", root / "linkdir");

  Manifest manifest = scan();

  EXPECT_EQ(manifest.size(), 2u);
  EXPECT_FALSE(manifest.contains(RelativePath::parse("link.txt")));
  EXPECT_FALSE(manifest.contains(RelativePath::parse("linkdir/inner.txt")));
  EXPECT_TRUE(manifest.rejected().empty());
}

TEST_F(TreeScannerTest, EmptyDirectoriesProduceNoEntries) {
  std::filesystem::create_directories(root / "empty" / "nested");
  write_text_file(root / "file.txt", "x");

  Manifest manifest = scan();

  ASSERT_EQ(manifest.size(), 1u);
  EXPECT_TRUE(manifest.contains(RelativePath::parse("file.txt")));
  EXPECT_TRUE(manifest.directories().empty());
}

TEST_F(TreeScannerTest, InvalidNamesAreRejectedNotFatal) {
  write_text_file(root / "good.txt", "ok");
  write_text_file(root / "back\\slash.txt", "bad");

  Manifest manifest = scan();

  EXPECT_EQ(manifest.size(), 1u);
  ASSERT_EQ(manifest.rejected().size(), 1u);
  EXPECT_NE(manifest.rejected()[0].first.find("back\\slash.txt"), std::string::npos);
}

TEST_F(TreeScannerTest, HashingCanBeDisabled) {
  config.sync.compute_hashes = false;
  write_text_file(root / "a.txt", "hello");

  Manifest manifest = scan();
  ASSERT_EQ(manifest.size(), 1u);
  EXPECT_FALSE(manifest.begin()->second.content_hash.has_value());
}

TEST_F(TreeScannerTest, MissingRootIsScanError) {
  TreeScanner scanner(config, mapper, files);
  EXPECT_THROW(scanner.scan_local(root / "missing"), ScanError);

  write_text_file(root / "plain.txt", "x");
  EXPECT_THROW(scanner.scan_local(root / "plain.txt"), ScanError);
}

TEST_F(TreeScannerTest, EmptyRootGivesEmptyManifest) {
  EXPECT_TRUE(scan().empty());
}


class RemoteScanTest : public ::testing::Test {
protected:
  config::SyncConfig config;
  fs::LocalFileSystem files;
};

TEST_F(RemoteScanTest, PaginatesUntilExhausted) {
  test::FakeObjectStore store("bucket", 2);
  for (int i = 0; i < 7; ++i) {
    store.set_object("file" + std::to_string(i) + ".txt", "content" + std::to_string(i));
  }

  PathKeyMapper mapper;
  TreeScanner scanner(config, mapper, files);
  Manifest manifest = scanner.scan_remote(store);

  EXPECT_EQ(manifest.size(), 7u);
  EXPECT_EQ(store.list_calls(), 4);
  const ManifestEntry* entry = manifest.find(RelativePath::parse("file0.txt"));
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->size, 8u);
  EXPECT_TRUE(entry->content_hash.has_value());
}

TEST_F(RemoteScanTest, PrefixAndMarkers) {
  test::FakeObjectStore store;
  store.set_object("laptop/", "");
  store.set_object("laptop/a.txt", "a");
  store.set_object("laptop/photos/", "");
  store.set_object("laptop/sub/b.txt", "b");
  store.set_object("desktop/c.txt", "c");

  PathKeyMapper mapper("laptop");
  TreeScanner scanner(config, mapper, files);
  Manifest manifest = scanner.scan_remote(store);

  EXPECT_EQ(manifest.size(), 2u);
  EXPECT_TRUE(manifest.contains(RelativePath::parse("a.txt")));
  EXPECT_TRUE(manifest.contains(RelativePath::parse("sub/b.txt")));
  ASSERT_EQ(manifest.directories().size(), 1u);
  EXPECT_EQ(manifest.directories().begin()->str(), "photos");
}

TEST_F(RemoteScanTest, InvalidKeysAreRejected) {
  test::FakeObjectStore store;
  store.set_object("ok.txt", "x");
  store.set_object("a//b.txt", "x");
  store.set_object("../escape", "x");

  PathKeyMapper mapper;
  TreeScanner scanner(config, mapper, files);
  Manifest manifest = scanner.scan_remote(store);

  EXPECT_EQ(manifest.size(), 1u);
  EXPECT_EQ(manifest.rejected().size(), 2u);
}

TEST_F(RemoteScanTest, UnreachableBucketIsScanError) {
  test::FakeObjectStore store;
  store.set_bucket_exists(false);

  PathKeyMapper mapper;
  TreeScanner scanner(config, mapper, files);
  EXPECT_THROW(scanner.scan_remote(store), ScanError);
}

TEST_F(RemoteScanTest, ListingFailureIsScanError) {
  test::FakeObjectStore store;
  store.set_object("a.txt", "x");
  store.fail_listing(storage::StorageErrorKind::PERMISSION_DENIED);

  PathKeyMapper mapper;
  TreeScanner scanner(config, mapper, files);
  EXPECT_THROW(scanner.scan_remote(store), ScanError);
}

TEST_F(RemoteScanTest, MultipartEtagsCarryNoHash) {
  EXPECT_TRUE(TreeScanner::is_plain_md5("5d41402abc4b2a76b9719d911017c592"));
  EXPECT_TRUE(TreeScanner::is_plain_md5("5D41402ABC4B2A76B9719D911017C592"));
  EXPECT_FALSE(TreeScanner::is_plain_md5("3858f62230ac3c915f300c664312c11f-2"));
  EXPECT_FALSE(TreeScanner::is_plain_md5(""));
}
