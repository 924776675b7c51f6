#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <boost/log/trivial.hpp>

namespace bsync::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Digest::Digest(Algorithm algorithm)
  : context_(std::make_unique<DigestContext>()) {
  const EVP_MD* md = (algorithm == Algorithm::MD5) ? EVP_md5() : EVP_sha256();
  if (!EVP_DigestInit_ex(context_->get(), md, nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }
}

Digest::~Digest() = default;


//==============================================
// DIGEST OPERATIONS
//==============================================

void Digest::update(const void* data, size_t length) {
  if (finished_) {
    throw DigestError("Digest already finalized");
  }
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    throw DigestError("Failed to update hash");
  }
}

void Digest::update(std::istream& input) {
  std::vector<char> buffer(BUFFER_SIZE);

  // Read input stream in chunks and feed the digest
  while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()))) {
    update(buffer.data(), static_cast<size_t>(input.gcount()));
  }

  // Handle final partial chunk if present
  if (input.gcount() > 0) {
    update(buffer.data(), static_cast<size_t>(input.gcount()));
  }

  if (input.bad()) {
    throw DigestError("Failed to read input stream");
  }
}

std::string Digest::finish() {
  if (finished_) {
    throw DigestError("Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw DigestError("Failed to finalize hash");
  }

  finished_ = true;
  return std::string(reinterpret_cast<const char*>(hash), hash_len);
}


//==============================================
// CONVENIENCE HELPERS
//==============================================

std::string to_hex(const std::string& raw) {
  std::stringstream ss;
  for (unsigned char c : raw) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

std::string md5_hex(std::istream& input) {
  Digest digest(Algorithm::MD5);
  digest.update(input);
  return to_hex(digest.finish());
}

std::string md5_file_hex(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to open file for hashing: " << path.string();
    throw DigestError("Failed to open file: " + path.string());
  }
  return md5_hex(file);
}

std::string sha256_hex(const std::string& data) {
  Digest digest(Algorithm::SHA256);
  digest.update(data.data(), data.size());
  return to_hex(digest.finish());
}

std::string hmac_sha256(const std::string& key, const std::string& data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;

  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(),
            digest, &digest_len)) {
    throw DigestError("HMAC-SHA256 computation failed");
  }
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

} // namespace bsync::crypto
