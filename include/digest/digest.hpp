#ifndef CSU_DIGEST_HPP
#define CSU_DIGEST_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include "checksum/checksum_error.hpp"

namespace csu::digest {

static constexpr size_t DIGEST_SIZE = 64;         // 512 bits for SHA-512
static constexpr size_t READ_BUFFER_SIZE = 65536; // bytes pulled per update

using Digest = std::array<uint8_t, DIGEST_SIZE>;

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-512 over OpenSSL EVP
class Sha512Hasher {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha512Hasher();
  ~Sha512Hasher();

  
  // ---- HASHING OPERATIONS ----
  void update(const void* data, size_t length);
  // Completes the hash; the hasher is reinitialized afterwards
  Digest finalize();

private:
  std::unique_ptr<DigestContext> context_;

  void initialize();
};

// Streams the whole input through SHA-512 without buffering it.
// Exceptions raised by the stream's buffer propagate unchanged
Digest compute_digest(std::istream& input);

// Lowercase hex, two characters per byte
std::string to_hex(const Digest& digest);

} // namespace csu::digest

#endif // CSU_DIGEST_HPP
