#include "integrity/matrix.hpp"
#include "integrity/galois_field.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace shardroot {
namespace integrity {

//==============================================
// CONSTRUCTION
//==============================================

Matrix::Matrix(size_t rows, size_t cols)
  : rows_(rows)
  , cols_(cols)
  , data_(rows * cols, 0) {}

Matrix Matrix::identity(size_t size) {
  Matrix m(size, size);
  for (size_t i = 0; i < size; ++i) {
    m.at(i, i) = 1;
  }
  return m;
}

Matrix Matrix::vandermonde(size_t rows, size_t cols) {
  Matrix m(rows, cols);
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      m.at(r, c) = GaloisField::exp(static_cast<uint8_t>(r), static_cast<unsigned>(c));
    }
  }
  return m;
}


//==============================================
// ALGEBRA
//==============================================

Matrix Matrix::multiply(const Matrix& rhs) const {
  if (cols_ != rhs.rows_) {
    throw std::invalid_argument("Matrix: column count " + std::to_string(cols_) +
                                " does not match row count " + std::to_string(rhs.rows_));
  }

  Matrix result(rows_, rhs.cols_);
  for (size_t r = 0; r < rows_; ++r) {
    for (size_t c = 0; c < rhs.cols_; ++c) {
      uint8_t value = 0;
      for (size_t i = 0; i < cols_; ++i) {
        value ^= GaloisField::multiply(at(r, i), rhs.at(i, c));
      }
      result.at(r, c) = value;
    }
  }
  return result;
}

Matrix Matrix::augment(const Matrix& rhs) const {
  if (rows_ != rhs.rows_) {
    throw std::invalid_argument("Matrix: row counts differ in augment");
  }

  Matrix result(rows_, cols_ + rhs.cols_);
  for (size_t r = 0; r < rows_; ++r) {
    std::copy(row(r), row(r) + cols_, &result.at(r, 0));
    std::copy(rhs.row(r), rhs.row(r) + rhs.cols_, &result.at(r, cols_));
  }
  return result;
}

Matrix Matrix::sub_matrix(size_t rmin, size_t cmin, size_t rmax, size_t cmax) const {
  if (rmin > rmax || cmin > cmax || rmax > rows_ || cmax > cols_) {
    throw std::out_of_range("Matrix: sub-matrix bounds out of range");
  }

  Matrix result(rmax - rmin, cmax - cmin);
  for (size_t r = rmin; r < rmax; ++r) {
    for (size_t c = cmin; c < cmax; ++c) {
      result.at(r - rmin, c - cmin) = at(r, c);
    }
  }
  return result;
}

Matrix Matrix::invert() const {
  if (rows_ != cols_) {
    throw std::invalid_argument("Matrix: only square matrices can be inverted");
  }

  Matrix work = augment(identity(rows_));
  work.gaussian_elimination();
  return work.sub_matrix(0, rows_, rows_, rows_ * 2);
}

void Matrix::gaussian_elimination() {
  // Clear out the part below the main diagonal and scale the main diagonal to 1
  for (size_t r = 0; r < rows_; ++r) {
    if (at(r, r) == 0) {
      for (size_t below = r + 1; below < rows_; ++below) {
        if (at(below, r) != 0) {
          swap_rows(r, below);
          break;
        }
      }
    }

    if (at(r, r) == 0) {
      throw std::domain_error("Matrix: matrix is singular");
    }

    if (at(r, r) != 1) {
      uint8_t scale = GaloisField::divide(1, at(r, r));
      for (size_t c = 0; c < cols_; ++c) {
        at(r, c) = GaloisField::multiply(at(r, c), scale);
      }
    }

    for (size_t below = r + 1; below < rows_; ++below) {
      uint8_t factor = at(below, r);
      if (factor != 0) {
        for (size_t c = 0; c < cols_; ++c) {
          at(below, c) ^= GaloisField::multiply(factor, at(r, c));
        }
      }
    }
  }

  // Now clear the part above the main diagonal
  for (size_t d = 0; d < rows_; ++d) {
    for (size_t above = 0; above < d; ++above) {
      uint8_t factor = at(above, d);
      if (factor != 0) {
        for (size_t c = 0; c < cols_; ++c) {
          at(above, c) ^= GaloisField::multiply(factor, at(d, c));
        }
      }
    }
  }
}

void Matrix::swap_rows(size_t r1, size_t r2) {
  if (r1 == r2) {
    return;
  }
  std::swap_ranges(data_.begin() + r1 * cols_, data_.begin() + (r1 + 1) * cols_,
                   data_.begin() + r2 * cols_);
}


//==============================================
// UTILITY METHODS
//==============================================

bool Matrix::is_identity() const {
  return *this == identity(rows_);
}

std::string Matrix::to_string() const {
  std::stringstream ss;
  ss << "[";
  for (size_t r = 0; r < rows_; ++r) {
    ss << (r == 0 ? "[" : ", [");
    for (size_t c = 0; c < cols_; ++c) {
      ss << (c == 0 ? "" : ", ") << static_cast<int>(at(r, c));
    }
    ss << "]";
  }
  ss << "]";
  return ss.str();
}

bool Matrix::operator==(const Matrix& other) const {
  return rows_ == other.rows_ && cols_ == other.cols_ && data_ == other.data_;
}

} // namespace integrity
} // namespace shardroot
