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

// pedersen.hpp
// Row commitments  C = sum_j row[j] * g_j + blinding * h.
//
// commit_row is the general multi-scalar multiplication (mcl mulVec).
// PedersenCommitter keeps 2^i * g_j for i < DOUBLING_BITS next to the
// generators so rows of small elements (one byte per element in the default
// layout) are committed with additions only. Both paths give the same point.

#pragma once
#include "hyrax/curve.hpp"
#include "hyrax/generators.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace hyrax {

// Throws DimensionMismatchError unless n == gens.size().
G1 commit_row(const Fr* row, size_t n, const GeneratorSet& gens, const Fr& blinding);
G1 commit_row(const std::vector<Fr>& row, const GeneratorSet& gens, const Fr& blinding);

// base, 2*base, 4*base, ..., 2^(bits-1)*base
std::vector<G1> precompute_doublings(const G1& base, size_t bits);

class PedersenCommitter {
public:
    static constexpr size_t DOUBLING_BITS = 8;

    explicit PedersenCommitter(std::shared_ptr<const GeneratorSet> gens);

    const GeneratorSet& generators() const { return *gens_; }
    size_t size() const { return gens_->size(); }
    const std::vector<G1>& doublings(size_t j) const { return doublings_[j]; }

    G1 commit(const Fr* row, size_t n, const Fr& blinding) const;
    G1 commit(const std::vector<Fr>& row, const Fr& blinding) const;

    // Same result as commit(); elements below 2^DOUBLING_BITS cost at most
    // DOUBLING_BITS additions, larger ones fall back to a scalar multiplication.
    G1 commit_small(const Fr* row, size_t n, const Fr& blinding) const;

    // true if every element of width `element_width` bytes fits the table
    static bool covers_width(size_t element_width) { return element_width * 8 <= DOUBLING_BITS; }

private:
    void add_byte(G1& acc, size_t j, uint8_t v) const;

    std::shared_ptr<const GeneratorSet> gens_;
    std::vector<std::vector<G1>> doublings_;
};

// Process-wide, keyed like cached_generators().
std::shared_ptr<const PedersenCommitter> cached_committer(const std::string& public_string, size_t num_generators);

} // namespace hyrax
