// Copyright 2025 Fidesinnova.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// matrix.hpp
// Raw bytes -> row-major matrix of scalars.
//
//   rows = ceil(len / (row_len * element_width))
//
// Each element_width-byte chunk is read big-endian. The input is padded with
// zero bytes on the right up to rows * row_len * element_width, so a short
// input encodes exactly like the same bytes followed by explicit zeros.

#pragma once
#include "hyrax/curve.hpp"
#include "hyrax/params.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hyrax {

// Holds data-derived scalars; wiped on destruction and never copied.
class ScalarMatrix {
public:
    ScalarMatrix() = default;
    ScalarMatrix(size_t rows, size_t cols);
    ~ScalarMatrix();

    ScalarMatrix(ScalarMatrix&& o) noexcept;
    ScalarMatrix& operator=(ScalarMatrix&& o) noexcept;
    ScalarMatrix(const ScalarMatrix&) = delete;
    ScalarMatrix& operator=(const ScalarMatrix&) = delete;

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }

    const Fr* row(size_t r) const { return cells_.data() + r * cols_; }
    Fr* row(size_t r) { return cells_.data() + r * cols_; }
    std::vector<Fr> row_vector(size_t r) const { return std::vector<Fr>(row(r), row(r) + cols_); }

    const Fr& at(size_t r, size_t c) const { return cells_[r * cols_ + c]; }
    Fr& at(size_t r, size_t c) { return cells_[r * cols_ + c]; }

    bool operator==(const ScalarMatrix& o) const {
        return rows_ == o.rows_ && cols_ == o.cols_ && cells_ == o.cells_;
    }
    bool operator!=(const ScalarMatrix& o) const { return !(*this == o); }

private:
    void wipe();

    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<Fr> cells_;
};

size_t row_count_for(size_t data_len, size_t row_len, size_t element_width = ELEMENT_WIDTH);

// Big-endian chunk of `width` bytes (1..32) to a scalar; false if >= r.
bool encode_element(const uint8_t* chunk, size_t width, Fr& out);

// Throws EncodingError for row_len == 0, element_width outside [1, 32], or a
// chunk whose value is not below r.
ScalarMatrix encode_matrix(const uint8_t* data, size_t len, size_t row_len, size_t element_width = ELEMENT_WIDTH);
ScalarMatrix encode_matrix(const std::vector<uint8_t>& data, size_t row_len, size_t element_width = ELEMENT_WIDTH);

} // namespace hyrax
