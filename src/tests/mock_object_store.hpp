#ifndef BSYNC_MOCK_OBJECT_STORE_HPP
#define BSYNC_MOCK_OBJECT_STORE_HPP

#include <gmock/gmock.h>
#include <string>
#include "storage/object_store.hpp"

namespace bsync {
namespace test {

class MockObjectStore : public storage::ObjectStore {
public:
    explicit MockObjectStore(std::string bucket = "mock-bucket") : bucket_(std::move(bucket)) {}

    MOCK_METHOD(void, check_bucket, (), (override));
    MOCK_METHOD(void, put_object, (const std::string& key, std::istream& data), (override));
    MOCK_METHOD(void, get_object, (const std::string& key, std::ostream& output), (override));
    MOCK_METHOD(storage::ListPage, list_objects, (const std::string& prefix, const std::string& continuation_token), (override));
    MOCK_METHOD(bool, object_exists, (const std::string& key), (override));
    MOCK_METHOD(void, delete_object, (const std::string& key), (override));

    const std::string& bucket() const override { return bucket_; }

private:
    std::string bucket_;
};

} // namespace test
} // namespace bsync

#endif // BSYNC_MOCK_OBJECT_STORE_HPP
