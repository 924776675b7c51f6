#ifndef BSYNC_S3_OBJECT_STORE_HPP
#define BSYNC_S3_OBJECT_STORE_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include "storage/object_store.hpp"
#include "storage/s3_signer.hpp"

namespace boost { namespace asio { namespace ssl { class context; } } }

namespace bsync {
namespace storage {

struct S3Options {
  // "https://s3.us-east-1.amazonaws.com" style URL; derived from the region when empty
  std::string endpoint;
  S3Credentials credentials;
  std::chrono::seconds timeout{30};
  std::size_t max_keys{1000};
};

/**
 * S3 REST adapter over Boost.Beast with path-style addressing
 * (<endpoint>/<bucket>/<key>). Each call opens its own connection, so the
 * store can be shared by the transfer workers without locking.
 */
class S3ObjectStore : public ObjectStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  S3ObjectStore(const S3Options& options, const std::string& bucket);
  ~S3ObjectStore() override;


  // ---- CORE STORAGE OPERATIONS ----
  void check_bucket() override;
  void put_object(const std::string& key, std::istream& data) override;
  void get_object(const std::string& key, std::ostream& output) override;
  ListPage list_objects(const std::string& prefix, const std::string& continuation_token) override;
  bool object_exists(const std::string& key) override;
  void delete_object(const std::string& key) override;

  const std::string& bucket() const override { return bucket_; }


  // ---- RESPONSE PARSING ----
  // Parses a ListObjectsV2 XML body
  static ListPage parse_list_response(const std::string& xml);
  // Maps an HTTP status and S3 error body to an error kind
  static StorageErrorKind classify_status(unsigned int status, const std::string& error_code);
  // "2009-10-12T17:50:30.000Z"
  static std::chrono::system_clock::time_point parse_iso8601(const std::string& text);

private:
  struct Endpoint {
    bool tls{true};
    std::string host;
    std::string port;
  };

  struct Response {
    unsigned int status{0};
    std::string body;
  };

  // ---- PARAMETERS ----
  S3Options options_;
  std::string bucket_;
  Endpoint endpoint_;
  S3Signer signer_;
  std::unique_ptr<boost::asio::ssl::context> ssl_context_;


  // ---- REQUEST EXECUTION ----
  static Endpoint parse_endpoint(const std::string& url);
  std::string host_header() const;
  std::string object_uri(const std::string& key) const;
  // Signs and sends one request; network failures become TRANSIENT StorageErrors
  Response perform(const std::string& method,
                   const std::string& canonical_uri,
                   const std::map<std::string, std::string>& query,
                   const std::string& body) const;
  // Throws a StorageError built from a non-2xx response
  [[noreturn]] void raise_for(const std::string& operation, const std::string& target, const Response& response) const;
};

} // namespace storage
} // namespace bsync

#endif // BSYNC_S3_OBJECT_STORE_HPP
