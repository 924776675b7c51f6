#include "storage/s3_signer.hpp"
#include "crypto/digest.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace bsync {
namespace storage {

S3Signer::S3Signer(S3Credentials credentials)
  : credentials_(std::move(credentials)) {
}

std::string S3Signer::uri_encode(const std::string& value, bool encode_slash) {
  std::stringstream ss;
  ss << std::uppercase << std::hex;
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encode_slash)) {
      ss << static_cast<char>(c);
    } else {
      ss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
  }
  return ss.str();
}

std::string S3Signer::canonical_query(const std::map<std::string, std::string>& query) {
  // Encoded names sort the same as raw names for the parameters S3 uses
  std::map<std::string, std::string> encoded;
  for (const auto& [name, value] : query) {
    encoded.emplace(uri_encode(name, true), uri_encode(value, true));
  }

  std::string result;
  for (const auto& [name, value] : encoded) {
    if (!result.empty()) {
      result += '&';
    }
    result += name + "=" + value;
  }
  return result;
}

std::string S3Signer::amz_date(std::chrono::system_clock::time_point now) {
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
  return ss.str();
}

std::string S3Signer::signing_key(const std::string& date_stamp) const {
  std::string k_date = crypto::hmac_sha256("AWS4" + credentials_.secret_key, date_stamp);
  std::string k_region = crypto::hmac_sha256(k_date, credentials_.region);
  std::string k_service = crypto::hmac_sha256(k_region, SERVICE);
  return crypto::hmac_sha256(k_service, "aws4_request");
}

void S3Signer::sign(const std::string& method,
                    const std::string& canonical_uri,
                    const std::map<std::string, std::string>& query,
                    std::map<std::string, std::string>& headers,
                    const std::string& payload_hash,
                    std::chrono::system_clock::time_point now) const {
  const std::string date_time = amz_date(now);
  const std::string date_stamp = date_time.substr(0, 8);

  headers["x-amz-date"] = date_time;
  headers["x-amz-content-sha256"] = payload_hash;
  if (!credentials_.session_token.empty()) {
    headers["x-amz-security-token"] = credentials_.session_token;
  }
  headers.erase("authorization");

  // 1. Canonical headers, already sorted by the map
  std::string canonical_headers;
  std::string signed_headers;
  for (const auto& [name, value] : headers) {
    canonical_headers += name + ":" + value + "\n";
    if (!signed_headers.empty()) {
      signed_headers += ';';
    }
    signed_headers += name;
  }

  // 2. Canonical request
  std::stringstream canonical_request;
  canonical_request << method << "\n"
                    << canonical_uri << "\n"
                    << canonical_query(query) << "\n"
                    << canonical_headers << "\n"
                    << signed_headers << "\n"
                    << payload_hash;

  // 3. String to sign
  const std::string scope = date_stamp + "/" + credentials_.region + "/" + SERVICE + "/aws4_request";
  std::stringstream string_to_sign;
  string_to_sign << ALGORITHM << "\n"
                 << date_time << "\n"
                 << scope << "\n"
                 << crypto::sha256_hex(canonical_request.str());

  // 4. Signature
  const std::string signature = crypto::to_hex(
    crypto::hmac_sha256(signing_key(date_stamp), string_to_sign.str()));

  headers["authorization"] = std::string(ALGORITHM) + " Credential=" + credentials_.access_key + "/" + scope
    + ",SignedHeaders=" + signed_headers + ",Signature=" + signature;

  BOOST_LOG_TRIVIAL(trace) << "S3 signer: Signed " << method << " " << canonical_uri
                           << " with headers " << signed_headers;
}

} // namespace storage
} // namespace bsync
