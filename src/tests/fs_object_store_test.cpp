#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <set>
#include <sstream>
#include <thread>
#include <vector>
#include "storage/fs_object_store.hpp"
#include "test_utils.hpp"

using namespace bsync::storage;

class FsObjectStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<FsObjectStore> store;

  void SetUp() override {
    test_dir = make_temp_dir("fs_store_test");
    std::filesystem::create_directories(test_dir / "bucket");
    store = std::make_unique<FsObjectStore>(test_dir.string(), "bucket");
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Helper methods to reduce repetition
  void store_and_verify(const std::string& key, const std::string& data) {
    auto input = create_test_stream(data);
    ASSERT_NO_THROW(store->put_object(key, *input)) << "Failed to store key: " << key;
    ASSERT_TRUE(store->object_exists(key)) << "Key should exist after storing: " << key;

    std::stringstream output;
    ASSERT_NO_THROW(store->get_object(key, output)) << "Failed to retrieve key: " << key;
    ASSERT_EQ(output.str(), data) << "Data mismatch for key: " << key;
  }

  void expect_retrieval_fails(const std::string& key) {
    EXPECT_FALSE(store->object_exists(key)) << "Key should not exist: " << key;
    std::stringstream output;
    try {
      store->get_object(key, output);
      ADD_FAILURE() << "Getting non-existent key should throw: " << key;
    } catch (const StorageError& e) {
      EXPECT_EQ(e.kind(), StorageErrorKind::NOT_FOUND);
    }
  }

  std::vector<std::string> list_all(const std::string& prefix = "") {
    std::vector<std::string> keys;
    std::string token;
    do {
      ListPage page = store->list_objects(prefix, token);
      for (const auto& object : page.objects) {
        keys.push_back(object.key);
      }
      token = page.continuation_token;
    } while (!token.empty());
    return keys;
  }
};

TEST_F(FsObjectStoreTest, BasicOperations) {
  store_and_verify("a.txt", "hello");
  store_and_verify("sub/b.txt", "world");
  store_and_verify("empty.txt", "");
  expect_retrieval_fails("nonexistent.txt");

  EXPECT_TRUE(std::filesystem::is_regular_file(test_dir / "bucket" / "sub" / "b.txt"));
}

TEST_F(FsObjectStoreTest, Overwrite) {
  store_and_verify("key", std::string(1024 * 1024, 'X'));
  store_and_verify("key", "Updated content");
}

TEST_F(FsObjectStoreTest, ListingIsSortedWithEtags) {
  store_and_verify("b.txt", "world");
  store_and_verify("a.txt", "hello");
  store_and_verify("sub/c.txt", "!");

  ListPage page = store->list_objects("", "");
  ASSERT_EQ(page.objects.size(), 3u);
  EXPECT_EQ(page.objects[0].key, "a.txt");
  EXPECT_EQ(page.objects[1].key, "b.txt");
  EXPECT_EQ(page.objects[2].key, "sub/c.txt");
  EXPECT_EQ(page.objects[0].size, 5u);
  ASSERT_TRUE(page.objects[0].etag.has_value());
  EXPECT_EQ(*page.objects[0].etag, "5d41402abc4b2a76b9719d911017c592");
  EXPECT_TRUE(page.continuation_token.empty());
}

TEST_F(FsObjectStoreTest, Pagination) {
  FsObjectStore paged(test_dir.string(), "bucket", 2);
  for (int i = 0; i < 5; ++i) {
    auto input = create_test_stream("data" + std::to_string(i));
    paged.put_object("file" + std::to_string(i), *input);
  }

  ListPage first = paged.list_objects("", "");
  ASSERT_EQ(first.objects.size(), 2u);
  EXPECT_EQ(first.continuation_token, "file1");

  std::vector<std::string> keys;
  std::string token;
  int pages = 0;
  do {
    ListPage page = paged.list_objects("", token);
    for (const auto& object : page.objects) {
      keys.push_back(object.key);
    }
    token = page.continuation_token;
    ++pages;
  } while (!token.empty());

  EXPECT_EQ(pages, 3);
  EXPECT_EQ(keys, (std::vector<std::string>{"file0", "file1", "file2", "file3", "file4"}));
}

TEST_F(FsObjectStoreTest, PrefixFiltering) {
  store_and_verify("laptop/a.txt", "1");
  store_and_verify("laptop/sub/b.txt", "2");
  store_and_verify("desktop/c.txt", "3");

  EXPECT_EQ(list_all("laptop/"), (std::vector<std::string>{"laptop/a.txt", "laptop/sub/b.txt"}));
}

TEST_F(FsObjectStoreTest, DirectoryMarkers) {
  auto input = create_test_stream("");
  store->put_object("photos/", *input);
  EXPECT_TRUE(std::filesystem::is_directory(test_dir / "bucket" / "photos"));
  EXPECT_TRUE(store->object_exists("photos/"));
  EXPECT_EQ(list_all(), (std::vector<std::string>{"photos/"}));
}

TEST_F(FsObjectStoreTest, DeleteRemovesEmptyParents) {
  store_and_verify("deep/nested/file.txt", "x");
  ASSERT_NO_THROW(store->delete_object("deep/nested/file.txt"));
  expect_retrieval_fails("deep/nested/file.txt");
  EXPECT_FALSE(std::filesystem::exists(test_dir / "bucket" / "deep"));
  EXPECT_TRUE(std::filesystem::exists(test_dir / "bucket"));

  // Deleting a missing key succeeds
  EXPECT_NO_THROW(store->delete_object("never-existed"));
}

TEST_F(FsObjectStoreTest, ErrorHandling) {
  std::stringstream bad_stream;
  bad_stream.setstate(std::ios::badbit);
  EXPECT_THROW(store->put_object("bad_stream", bad_stream), StorageError);

  const std::vector<std::string> invalid_keys = {"", "/absolute", "../escape", "a//b", "a/./b"};
  for (const auto& key : invalid_keys) {
    auto input = create_test_stream("data");
    try {
      store->put_object(key, *input);
      ADD_FAILURE() << "Key should be rejected: " << key;
    } catch (const StorageError& e) {
      EXPECT_EQ(e.kind(), StorageErrorKind::INVALID_KEY) << key;
    }
  }
}

TEST_F(FsObjectStoreTest, MissingBucket) {
  FsObjectStore missing(test_dir.string(), "no-such-bucket");
  try {
    missing.check_bucket();
    ADD_FAILURE() << "check_bucket should fail for a missing bucket";
  } catch (const StorageError& e) {
    EXPECT_EQ(e.kind(), StorageErrorKind::NOT_FOUND);
  }
  EXPECT_THROW(missing.list_objects("", ""), StorageError);
  EXPECT_THROW(FsObjectStore(test_dir.string(), "a/b"), StorageError);
}

TEST_F(FsObjectStoreTest, ConcurrentAccess) {
  const size_t num_threads = 5;
  const size_t ops_per_thread = 50;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        try {
          std::string key = "shared/concurrent_" + std::to_string(i) + "_" + std::to_string(j);
          std::string data = "Data for " + key;
          store_and_verify(key, data);
          successful_ops++;
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
  EXPECT_EQ(list_all("shared/").size(), num_threads * ops_per_thread);
}
