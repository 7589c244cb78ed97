#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace shardroot {
namespace integrity {

// Dense row-major matrix over GF(2^8)
class Matrix {
public:

  // ---- CONSTRUCTION ----
  Matrix() = default;
  Matrix(size_t rows, size_t cols);

  static Matrix identity(size_t size);
  // Entry (r, c) is r^c in GF(2^8)
  static Matrix vandermonde(size_t rows, size_t cols);


  // ---- ACCESS ----
  size_t rows() const { return rows_; }
  size_t cols() const { return cols_; }

  uint8_t& at(size_t r, size_t c) { return data_[r * cols_ + c]; }
  uint8_t at(size_t r, size_t c) const { return data_[r * cols_ + c]; }

  const uint8_t* row(size_t r) const { return data_.data() + r * cols_; }


  // ---- ALGEBRA ----
  Matrix multiply(const Matrix& rhs) const;
  // Joins rhs to the right of this matrix
  Matrix augment(const Matrix& rhs) const;
  // Rows [rmin, rmax) and columns [cmin, cmax)
  Matrix sub_matrix(size_t rmin, size_t cmin, size_t rmax, size_t cmax) const;
  // Gauss-Jordan inversion, throws std::domain_error if singular
  Matrix invert() const;

  bool is_identity() const;
  std::string to_string() const;

  bool operator==(const Matrix& other) const;

private:
  // ---- PARAMETERS ----
  size_t rows_{0};
  size_t cols_{0};
  std::vector<uint8_t> data_;

  void swap_rows(size_t r1, size_t r2);
  void gaussian_elimination();
};

} // namespace integrity
} // namespace shardroot
