#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <vector>

namespace catmatch::similarity {

// SimilarityMatrix is a dense row-major matrix S[u][c]:
// rows index unstructured items, columns index catalog items, both in the
// order of the item sequences handed to the engine.
class SimilarityMatrix {
 public:
  SimilarityMatrix() = default;
  SimilarityMatrix(std::size_t rows, std::size_t cols) : rows_(rows), cols_(cols), data_(rows * cols) {}

  // Throws std::invalid_argument if values.size() != rows * cols.
  SimilarityMatrix(std::size_t rows, std::size_t cols, std::vector<double> values)
      : rows_(rows), cols_(cols), data_(std::move(values)) {
    if (data_.size() != rows_ * cols_) {
      throw std::invalid_argument("similarity matrix data does not match its shape");
    }
  }

  [[nodiscard]] std::size_t rows() const { return rows_; }
  [[nodiscard]] std::size_t cols() const { return cols_; }

  [[nodiscard]] double at(std::size_t row, std::size_t col) const {
    return data_.at(row * cols_ + col);
  }

  void set(std::size_t row, std::size_t col, double value) { data_.at(row * cols_ + col) = value; }

  [[nodiscard]] std::span<const double> row(std::size_t row) const {
    if (row >= rows_) {
      throw std::out_of_range("similarity matrix row out of range");
    }
    return std::span<const double>(data_).subspan(row * cols_, cols_);
  }

 private:
  std::size_t rows_{0};
  std::size_t cols_{0};
  std::vector<double> data_;
};

}  // namespace catmatch::similarity
