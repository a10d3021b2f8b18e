#include "digest/digest.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <iomanip>
#include <sstream>
#include <vector>
#include <boost/log/trivial.hpp>

namespace csu::digest {

using checksum::DigestError;

namespace {

std::string openssl_error(const std::string& what) {
  char buffer[256];
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return what;
  }
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return what + ": " + buffer;
}

} // namespace

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError(openssl_error("Failed to create hash context"));
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

Sha512Hasher::Sha512Hasher() : context_(std::make_unique<DigestContext>()) {
  initialize();
}

Sha512Hasher::~Sha512Hasher() = default;

void Sha512Hasher::initialize() {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha512(), nullptr)) {
    throw DigestError(openssl_error("Failed to initialize hash context"));
  }
}


//==============================================
// HASHING OPERATIONS
//==============================================

void Sha512Hasher::update(const void* data, size_t length) {
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    throw DigestError(openssl_error("Failed to update hash"));
  }
}

Digest Sha512Hasher::finalize() {
  Digest digest{};
  unsigned int digest_len = 0;

  if (!EVP_DigestFinal_ex(context_->get(), digest.data(), &digest_len)) {
    throw DigestError(openssl_error("Failed to finalize hash"));
  }
  if (digest_len != DIGEST_SIZE) {
    throw DigestError("Unexpected digest length " + std::to_string(digest_len));
  }

  initialize();
  return digest;
}


//==============================================
// STREAM HELPERS
//==============================================

Digest compute_digest(std::istream& input) {
  Sha512Hasher hasher;
  std::vector<char> buffer(READ_BUFFER_SIZE);
  std::uintmax_t total_bytes = 0;

  // Read input stream in chunks and feed the hasher
  while (input.read(buffer.data(), buffer.size())) {
    hasher.update(buffer.data(), static_cast<size_t>(input.gcount()));
    total_bytes += input.gcount();
  }

  // Handle final partial chunk if present
  if (input.gcount() > 0) {
    hasher.update(buffer.data(), static_cast<size_t>(input.gcount()));
    total_bytes += input.gcount();
  }

  if (input.bad()) {
    throw DigestError("Input stream failed after " + std::to_string(total_bytes) + " bytes");
  }

  BOOST_LOG_TRIVIAL(trace) << "Digest: Hashed " << total_bytes << " bytes";
  return hasher.finalize();
}

std::string to_hex(const Digest& digest) {
  std::stringstream ss;
  for (uint8_t byte : digest) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace csu::digest
