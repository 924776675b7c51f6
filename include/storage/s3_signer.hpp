#ifndef BSYNC_S3_SIGNER_HPP
#define BSYNC_S3_SIGNER_HPP

#include <chrono>
#include <map>
#include <string>

namespace bsync {
namespace storage {

struct S3Credentials {
  std::string access_key;
  std::string secret_key;
  // Only set for temporary credentials
  std::string session_token;
  std::string region{"us-east-1"};
};

/**
 * AWS Signature Version 4 for the S3 REST API.
 * Header names passed in must be lowercase; "host" is required.
 */
class S3Signer {
public:
  static constexpr const char* ALGORITHM = "AWS4-HMAC-SHA256";
  static constexpr const char* SERVICE = "s3";

  explicit S3Signer(S3Credentials credentials);

  // Adds x-amz-date, x-amz-content-sha256, x-amz-security-token (if any) and
  // authorization to headers. canonical_uri must already be URI-encoded.
  void sign(const std::string& method,
            const std::string& canonical_uri,
            const std::map<std::string, std::string>& query,
            std::map<std::string, std::string>& headers,
            const std::string& payload_hash,
            std::chrono::system_clock::time_point now) const;

  // RFC 3986 encoding as required by SigV4; '/' kept when encode_slash is false
  static std::string uri_encode(const std::string& value, bool encode_slash);
  // Sorted, encoded "k=v&k=v" form
  static std::string canonical_query(const std::map<std::string, std::string>& query);
  // "20130524T000000Z"
  static std::string amz_date(std::chrono::system_clock::time_point now);

  const S3Credentials& credentials() const { return credentials_; }

private:
  S3Credentials credentials_;

  std::string signing_key(const std::string& date_stamp) const;
};

} // namespace storage
} // namespace bsync

#endif // BSYNC_S3_SIGNER_HPP
