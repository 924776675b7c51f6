#ifndef BSYNC_CRYPTO_DIGEST_HPP
#define BSYNC_CRYPTO_DIGEST_HPP

#include <istream>
#include <string>
#include <filesystem>
#include <memory>
#include <stdexcept>

namespace bsync::crypto {

// Raised when OpenSSL fails to set up, feed or finalize a digest
class DigestError : public std::runtime_error {
public:
  explicit DigestError(const std::string& message)
    : std::runtime_error("Digest error: " + message) {}
};

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Supported message digests
enum class Algorithm {
  MD5,
  SHA256
};

// Incremental digest over OpenSSL EVP. One instance computes one digest.
class Digest {
public:
  static constexpr size_t BUFFER_SIZE = 1024 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Digest(Algorithm algorithm);
  ~Digest();

  Digest(const Digest&) = delete;
  Digest& operator=(const Digest&) = delete;


  // ---- DIGEST OPERATIONS ----
  void update(const void* data, size_t length);
  void update(std::istream& input);
  // Finalizes and returns the raw digest bytes; the instance cannot be reused
  std::string finish();

private:
  std::unique_ptr<DigestContext> context_;
  bool finished_ = false;
};


// ---- CONVENIENCE HELPERS ----
// Lowercase hex encoding of raw bytes
std::string to_hex(const std::string& raw);

std::string md5_hex(std::istream& input);
// MD5 of a file's content, the value S3 reports as ETag for single-part uploads
std::string md5_file_hex(const std::filesystem::path& path);

std::string sha256_hex(const std::string& data);
// Raw HMAC-SHA256, used to derive AWS signing keys
std::string hmac_sha256(const std::string& key, const std::string& data);

} // namespace bsync::crypto

#endif // BSYNC_CRYPTO_DIGEST_HPP
