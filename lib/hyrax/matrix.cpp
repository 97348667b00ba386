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

#include "hyrax/matrix.hpp"

#include "hyrax/errors.hpp"
#include "hyrax/util.hpp"

#include <algorithm>
#include <cstring>

namespace hyrax {

ScalarMatrix::ScalarMatrix(size_t rows, size_t cols)
    : rows_(rows), cols_(cols), cells_(rows * cols) {}

ScalarMatrix::~ScalarMatrix(){ wipe(); }

ScalarMatrix::ScalarMatrix(ScalarMatrix&& o) noexcept
    : rows_(o.rows_), cols_(o.cols_), cells_(std::move(o.cells_)) {
    o.rows_ = o.cols_ = 0;
    o.cells_.clear();
}

ScalarMatrix& ScalarMatrix::operator=(ScalarMatrix&& o) noexcept {
    if(this != &o){
        wipe();
        rows_ = o.rows_;
        cols_ = o.cols_;
        cells_ = std::move(o.cells_);
        o.rows_ = o.cols_ = 0;
        o.cells_.clear();
    }
    return *this;
}

void ScalarMatrix::wipe(){
    secure_erase(cells_.data(), cells_.size() * sizeof(Fr));
    cells_.clear();
}

size_t row_count_for(size_t data_len, size_t row_len, size_t element_width){
    if(row_len == 0 || element_width == 0) throw EncodingError("row length and element width must be positive");
    size_t row_bytes = row_len * element_width;
    return (data_len + row_bytes - 1) / row_bytes;
}

bool encode_element(const uint8_t* chunk, size_t width, Fr& out){
    if(width == 0 || width > SCALAR_BYTES) return false;
    uint8_t le[SCALAR_BYTES] = {0};
    for(size_t i=0;i<width;i++) le[i] = chunk[width - 1 - i];
    bool ok = scalar_from_bytes(le, out);
    secure_erase(le, sizeof(le));
    return ok;
}

ScalarMatrix encode_matrix(const uint8_t* data, size_t len, size_t row_len, size_t element_width){
    if(row_len == 0) throw EncodingError("row length must be positive");
    if(element_width == 0 || element_width > SCALAR_BYTES)
        throw EncodingError("element width " + std::to_string(element_width) + " is outside [1, 32]");
    init_curve();

    const size_t rows = row_count_for(len, row_len, element_width);
    ScalarMatrix m(rows, row_len);

    uint8_t chunk[SCALAR_BYTES];
    for(size_t r=0;r<rows;r++){
        Fr* out = m.row(r);
        for(size_t c=0;c<row_len;c++){
            size_t off = (r * row_len + c) * element_width;
            std::memset(chunk, 0, sizeof(chunk));
            if(off < len) std::memcpy(chunk, data + off, std::min(element_width, len - off));
            if(!encode_element(chunk, element_width, out[c])){
                secure_erase(chunk, sizeof(chunk));
                throw EncodingError("chunk at byte offset " + std::to_string(off) + " is not below the scalar modulus");
            }
        }
    }
    secure_erase(chunk, sizeof(chunk));
    return m;
}

ScalarMatrix encode_matrix(const std::vector<uint8_t>& data, size_t row_len, size_t element_width){
    return encode_matrix(data.data(), data.size(), row_len, element_width);
}

} // namespace hyrax
