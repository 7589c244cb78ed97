#ifndef SHARDROOT_SHA256_HPP
#define SHARDROOT_SHA256_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include "crypto/crypto_error.hpp"

namespace shardroot::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

using Digest = std::array<uint8_t, 32>;

// Incremental SHA-256 over OpenSSL EVP
class Sha256 {
public:

  static constexpr size_t DIGEST_SIZE = 32;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();
  Sha256(Sha256&& other) noexcept;
  Sha256& operator=(Sha256&& other) noexcept;
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;


  // ---- HASHING OPERATIONS ----
  void update(const uint8_t* data, size_t length);
  void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }
  // Finishes the digest; the accumulator cannot be updated afterwards
  Digest finalize();

  bool is_finalized() const { return finalized_; }
  uint64_t bytes_absorbed() const { return bytes_absorbed_; }


  // ---- ONE-SHOT HELPERS ----
  static Digest digest(const uint8_t* data, size_t length);
  static Digest digest(const std::vector<uint8_t>& data) { return digest(data.data(), data.size()); }
  static Digest digest(const std::string& data);
  // Reads the stream to its end
  static Digest digest(std::istream& input);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
  uint64_t bytes_absorbed_ = 0;
  static constexpr size_t BUFFER_SIZE = 8192;
};

// Lower-case hex rendering of a byte range
std::string to_hex(const uint8_t* data, size_t length);
inline std::string to_hex(const Digest& digest) { return to_hex(digest.data(), digest.size()); }
// Parses exactly 64 hex characters into a digest, throws HexDecodeError
Digest digest_from_hex(const std::string& hex);

} // namespace shardroot::crypto

#endif // SHARDROOT_SHA256_HPP
