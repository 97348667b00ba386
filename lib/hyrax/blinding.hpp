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

// blinding.hpp
// Per-row blinding factors from a 32-byte seed.
//
// The seed keys ChaCha20 (zero nonce, counter from 0). The keystream is cut
// into 32-byte little-endian candidates, the top two bits are cleared and a
// candidate is kept only if it is below r. The same seed always yields the
// same sequence, and a prefix of a longer run equals a shorter run.

#pragma once
#include "hyrax/curve.hpp"
#include "hyrax/params.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hyrax {

// Secret scalars. Wiped with OPENSSL_cleanse on destruction; move only.
class BlindingFactors {
public:
    BlindingFactors() = default;
    ~BlindingFactors();

    BlindingFactors(BlindingFactors&& o) noexcept;
    BlindingFactors& operator=(BlindingFactors&& o) noexcept;
    BlindingFactors(const BlindingFactors&) = delete;
    BlindingFactors& operator=(const BlindingFactors&) = delete;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    const Fr& operator[](size_t i) const { return values_[i]; }
    const std::vector<Fr>& values() const { return values_; }

    // growth goes through reserve(), which wipes the buffer it replaces
    void reserve(size_t n);
    void push_back(const Fr& x);
    void wipe();

    bool operator==(const BlindingFactors& o) const { return values_ == o.values_; }
    bool operator!=(const BlindingFactors& o) const { return !(*this == o); }

private:
    std::vector<Fr> values_;
};

BlindingFactors generate_blinding_factors(const Seed& seed, size_t row_count);
// Throws InvalidSeedError unless seed_len == SEED_BYTES.
BlindingFactors generate_blinding_factors(const uint8_t* seed, size_t seed_len, size_t row_count);
BlindingFactors generate_blinding_factors(const std::vector<uint8_t>& seed, size_t row_count);

} // namespace hyrax
