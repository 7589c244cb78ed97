#include "crypto/sha256.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace shardroot::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  // Create and initialize a SHA-256 context
  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
    if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
      EVP_MD_CTX_free(ctx);
      throw DigestError("Failed to initialize hash context");
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

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {}

Sha256::~Sha256() = default;

Sha256::Sha256(Sha256&& other) noexcept = default;

Sha256& Sha256::operator=(Sha256&& other) noexcept = default;


//==============================================
// HASHING OPERATIONS
//==============================================

void Sha256::update(const uint8_t* data, size_t length) {
  if (finalized_) {
    throw DigestError("Update after finalize");
  }
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    throw DigestError("Failed to update hash");
  }
  bytes_absorbed_ += length;
}

Digest Sha256::finalize() {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }

  Digest out;
  unsigned int out_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), out.data(), &out_len)) {
    throw DigestError("Failed to finalize hash");
  }
  if (out_len != DIGEST_SIZE) {
    throw DigestError("Unexpected digest length " + std::to_string(out_len));
  }
  finalized_ = true;
  return out;
}


//==============================================
// ONE-SHOT HELPERS
//==============================================

Digest Sha256::digest(const uint8_t* data, size_t length) {
  Sha256 hasher;
  hasher.update(data, length);
  return hasher.finalize();
}

Digest Sha256::digest(const std::string& data) {
  return digest(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Digest Sha256::digest(std::istream& input) {
  if (!input.good()) {
    throw DigestError("Invalid input stream state");
  }

  Sha256 hasher;
  std::vector<char> buffer(BUFFER_SIZE);

  // Read input stream in chunks until the end
  while (input.read(buffer.data(), buffer.size())) {
    hasher.update(reinterpret_cast<const uint8_t*>(buffer.data()), input.gcount());
  }
  if (input.bad()) {
    throw DigestError("Failed to read from input stream");
  }

  // Handle final partial chunk if present
  if (input.gcount() > 0) {
    hasher.update(reinterpret_cast<const uint8_t*>(buffer.data()), input.gcount());
  }

  BOOST_LOG_TRIVIAL(debug) << "Sha256: Hashed " << hasher.bytes_absorbed() << " bytes from stream";
  return hasher.finalize();
}


//==============================================
// HEX CONVERSION
//==============================================

std::string to_hex(const uint8_t* data, size_t length) {
  std::stringstream ss;
  for (size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

Digest digest_from_hex(const std::string& hex) {
  if (hex.size() != Sha256::DIGEST_SIZE * 2) {
    throw HexDecodeError("expected " + std::to_string(Sha256::DIGEST_SIZE * 2) +
                         " characters, got " + std::to_string(hex.size()));
  }

  auto nibble = [&hex](char c) -> uint8_t {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    throw HexDecodeError("invalid character in " + hex);
  };

  Digest out;
  for (size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
  }
  return out;
}

} // namespace shardroot::crypto
