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

// commitment.hpp
// Whole-buffer Hyrax-style commitment: encode -> blind -> commit each row ->
// serialize.
//
//   commitment_serialized       = row_count * POINT_BYTES  (34)
//   blinding_factors_serialized = row_count * SCALAR_BYTES (32)
//
// The row count is not stored in either stream.

#pragma once
#include "hyrax/blinding.hpp"
#include "hyrax/curve.hpp"
#include "hyrax/params.hpp"
#include "hyrax/pedersen.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hyrax {

struct Config;

using Commitment = std::vector<G1>;

struct CommitmentOutput {
    Commitment commitment;
    BlindingFactors blinding_factors;
};

// Owns the serialized blinding factors; wipes them on destruction.
struct CommitmentOutputSerialized {
    std::vector<uint8_t> commitment_serialized;
    std::vector<uint8_t> blinding_factors_serialized;

    CommitmentOutputSerialized() = default;
    ~CommitmentOutputSerialized();
    CommitmentOutputSerialized(CommitmentOutputSerialized&& o) noexcept;
    // wipes the blinding bytes this object held before taking o's
    CommitmentOutputSerialized& operator=(CommitmentOutputSerialized&& o) noexcept;
    CommitmentOutputSerialized(const CommitmentOutputSerialized&) = delete;
    CommitmentOutputSerialized& operator=(const CommitmentOutputSerialized&) = delete;
};

// Rows are committed on params.num_threads workers. The result does not
// depend on the thread count.
CommitmentOutput compute_commitments(const uint8_t* data, size_t len, const PedersenCommitter& committer,
                                     const Seed& seed, const CommitParams& params = CommitParams());
CommitmentOutput compute_commitments(const std::vector<uint8_t>& data, const PedersenCommitter& committer,
                                     const Seed& seed, const CommitParams& params = CommitParams());

// Production entry point: PUBLIC_STRING, NUM_COLS columns, ELEMENT_WIDTH.
CommitmentOutputSerialized compute_commitments_binary_outputs(const std::vector<uint8_t>& data, const Seed& seed);
// Throws InvalidSeedError unless the seed is SEED_BYTES long.
CommitmentOutputSerialized compute_commitments_binary_outputs(const std::vector<uint8_t>& data,
                                                              const std::vector<uint8_t>& seed);
CommitmentOutputSerialized compute_commitments_binary_outputs(const std::vector<uint8_t>& data, const Seed& seed,
                                                              const Config& cfg);

std::vector<uint8_t> serialize_commitment(const Commitment& c);
std::vector<uint8_t> serialize_blinding_factors(const BlindingFactors& b);

// Throw DeserializationError naming the offending element.
Commitment deserialize_commitment(const uint8_t* p, size_t n);
Commitment deserialize_commitment(const std::vector<uint8_t>& v);
BlindingFactors deserialize_blinding_factors(const uint8_t* p, size_t n);
BlindingFactors deserialize_blinding_factors(const std::vector<uint8_t>& v);

// Row count of the default layout for a buffer of data_len bytes.
size_t expected_row_count(size_t data_len);

// Returns the common row count; DeserializationError if the streams have
// bad lengths or disagree.
size_t check_outputs_consistent(const CommitmentOutputSerialized& out);

} // namespace hyrax
