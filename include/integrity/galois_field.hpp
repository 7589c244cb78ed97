#ifndef SHARDROOT_GALOIS_FIELD_HPP
#define SHARDROOT_GALOIS_FIELD_HPP

#include <cstdint>
#include <array>
#include <cstddef>

namespace shardroot::integrity {

// Arithmetic over GF(2^8). Changing any constant here changes every parity byte
// and breaks verification of previously stored objects.
class GaloisField {
public:
  static constexpr uint32_t CODEC_VERSION = 1;
  static constexpr uint16_t POLYNOMIAL = 0x11D;   // x^8 + x^4 + x^3 + x^2 + 1
  static constexpr uint8_t GENERATOR = 2;
  static constexpr int FIELD_SIZE = 256;

  static uint8_t add(uint8_t a, uint8_t b) { return a ^ b; }
  static uint8_t sub(uint8_t a, uint8_t b) { return a ^ b; }

  static uint8_t multiply(uint8_t a, uint8_t b);
  // Throws std::invalid_argument on division by zero
  static uint8_t divide(uint8_t a, uint8_t b);
  // a^n, with exp(a, 0) == 1 and exp(0, n > 0) == 0
  static uint8_t exp(uint8_t a, unsigned n);

  static uint8_t log(uint8_t a);

  // Multiplies every byte of in by c and xors the product into out
  static void mul_add_slice(uint8_t c, const uint8_t* in, uint8_t* out, size_t length);
  // Writes c * in[i] into out
  static void mul_slice(uint8_t c, const uint8_t* in, uint8_t* out, size_t length);

private:
  struct Tables {
    std::array<uint8_t, FIELD_SIZE> log{};
    std::array<uint8_t, FIELD_SIZE * 2> exp{};
    Tables();
  };

  static const Tables& tables();
};

} // namespace shardroot::integrity

#endif // SHARDROOT_GALOIS_FIELD_HPP
