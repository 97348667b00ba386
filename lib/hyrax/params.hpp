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

// params.hpp
// Layout constants. Together with the encodings in curve.hpp they are the wire
// format: a verifier must use the same values to make sense of a commitment.

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace hyrax {

// Sole input to generator sampling. Never change it once commitments exist.
constexpr const char* PUBLIC_STRING = "hyrax-bn254 pedersen generators: biometric self-custody v1";

// log2 of the number of matrix columns (the row length)
constexpr size_t LOG_NUM_COLS = 9;
constexpr size_t NUM_COLS = size_t(1) << LOG_NUM_COLS;

// bytes of input per matrix element; one byte is always below r
constexpr size_t ELEMENT_WIDTH = 1;

constexpr size_t SEED_BYTES = 32;
using Seed = std::array<uint8_t, SEED_BYTES>;

struct CommitParams {
    size_t element_width = ELEMENT_WIDTH;
    unsigned num_threads = 0;  // 0 = std::thread::hardware_concurrency()
};

} // namespace hyrax
