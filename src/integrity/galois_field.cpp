#include "integrity/galois_field.hpp"
#include <stdexcept>

namespace shardroot::integrity {

//==============================================
// TABLE CONSTRUCTION
//==============================================

GaloisField::Tables::Tables() {
  unsigned value = 1;
  for (int i = 0; i < FIELD_SIZE - 1; ++i) {
    exp[i] = static_cast<uint8_t>(value);
    log[value] = static_cast<uint8_t>(i);
    value <<= 1;
    if (value & 0x100) {
      value ^= POLYNOMIAL;
    }
  }

  // Doubled so that exp[log a + log b] never needs a modulo
  for (int i = FIELD_SIZE - 1; i < FIELD_SIZE * 2; ++i) {
    exp[i] = exp[i - (FIELD_SIZE - 1)];
  }
}

const GaloisField::Tables& GaloisField::tables() {
  static const Tables instance;
  return instance;
}


//==============================================
// FIELD OPERATIONS
//==============================================

uint8_t GaloisField::multiply(uint8_t a, uint8_t b) {
  if (a == 0 || b == 0) {
    return 0;
  }
  const auto& t = tables();
  return t.exp[t.log[a] + t.log[b]];
}

uint8_t GaloisField::divide(uint8_t a, uint8_t b) {
  if (b == 0) {
    throw std::invalid_argument("Galois field: division by zero");
  }
  if (a == 0) {
    return 0;
  }
  const auto& t = tables();
  int diff = static_cast<int>(t.log[a]) - static_cast<int>(t.log[b]);
  if (diff < 0) {
    diff += FIELD_SIZE - 1;
  }
  return t.exp[diff];
}

uint8_t GaloisField::exp(uint8_t a, unsigned n) {
  if (n == 0) {
    return 1;
  }
  if (a == 0) {
    return 0;
  }
  const auto& t = tables();
  unsigned log_result = (static_cast<unsigned>(t.log[a]) * n) % (FIELD_SIZE - 1);
  return t.exp[log_result];
}

uint8_t GaloisField::log(uint8_t a) {
  if (a == 0) {
    throw std::invalid_argument("Galois field: log of zero");
  }
  return tables().log[a];
}


//==============================================
// SLICE OPERATIONS
//==============================================

void GaloisField::mul_add_slice(uint8_t c, const uint8_t* in, uint8_t* out, size_t length) {
  if (c == 0) {
    return;
  }
  if (c == 1) {
    for (size_t i = 0; i < length; ++i) {
      out[i] ^= in[i];
    }
    return;
  }

  // Per-coefficient row keeps the inner loop to one table lookup
  std::array<uint8_t, FIELD_SIZE> row;
  for (int v = 0; v < FIELD_SIZE; ++v) {
    row[v] = multiply(c, static_cast<uint8_t>(v));
  }
  for (size_t i = 0; i < length; ++i) {
    out[i] ^= row[in[i]];
  }
}

void GaloisField::mul_slice(uint8_t c, const uint8_t* in, uint8_t* out, size_t length) {
  std::array<uint8_t, FIELD_SIZE> row;
  for (int v = 0; v < FIELD_SIZE; ++v) {
    row[v] = multiply(c, static_cast<uint8_t>(v));
  }
  for (size_t i = 0; i < length; ++i) {
    out[i] = row[in[i]];
  }
}

} // namespace shardroot::integrity
