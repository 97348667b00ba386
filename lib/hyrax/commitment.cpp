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

#include "hyrax/commitment.hpp"

#include "hyrax/config.hpp"
#include "hyrax/errors.hpp"
#include "hyrax/log.hpp"
#include "hyrax/matrix.hpp"
#include "hyrax/parallel.hpp"
#include "hyrax/util.hpp"

#include <algorithm>

namespace hyrax {

CommitmentOutputSerialized::~CommitmentOutputSerialized(){
    secure_erase(blinding_factors_serialized);
}

CommitmentOutputSerialized::CommitmentOutputSerialized(CommitmentOutputSerialized&& o) noexcept
    : commitment_serialized(std::move(o.commitment_serialized)),
      blinding_factors_serialized(std::move(o.blinding_factors_serialized)) {
    o.commitment_serialized.clear();
    o.blinding_factors_serialized.clear();
}

CommitmentOutputSerialized& CommitmentOutputSerialized::operator=(CommitmentOutputSerialized&& o) noexcept {
    if(this != &o){
        secure_erase(blinding_factors_serialized);
        commitment_serialized = std::move(o.commitment_serialized);
        blinding_factors_serialized = std::move(o.blinding_factors_serialized);
        o.commitment_serialized.clear();
        o.blinding_factors_serialized.clear();
    }
    return *this;
}

CommitmentOutput compute_commitments(const uint8_t* data, size_t len, const PedersenCommitter& committer,
                                     const Seed& seed, const CommitParams& params){
    ScalarMatrix m = encode_matrix(data, len, committer.size(), params.element_width);

    CommitmentOutput out;
    out.blinding_factors = generate_blinding_factors(seed, m.rows());
    out.commitment.resize(m.rows());

    const bool small = PedersenCommitter::covers_width(params.element_width);
    const BlindingFactors& bf = out.blinding_factors;
    for_each_row(m.rows(), params.num_threads, [&](size_t r){
        out.commitment[r] = small ? committer.commit_small(m.row(r), m.cols(), bf[r])
                                  : committer.commit(m.row(r), m.cols(), bf[r]);
    });

    log::dbg("committed " + std::to_string(len) + " bytes as " + std::to_string(m.rows()) + "x"
             + std::to_string(m.cols()) + (small ? " (doubling path)" : " (msm path)"));
    return out;
}

CommitmentOutput compute_commitments(const std::vector<uint8_t>& data, const PedersenCommitter& committer,
                                     const Seed& seed, const CommitParams& params){
    return compute_commitments(data.data(), data.size(), committer, seed, params);
}

static CommitmentOutputSerialized serialize_output(const CommitmentOutput& out){
    CommitmentOutputSerialized s;
    s.commitment_serialized = serialize_commitment(out.commitment);
    s.blinding_factors_serialized = serialize_blinding_factors(out.blinding_factors);
    return s;
}

CommitmentOutputSerialized compute_commitments_binary_outputs(const std::vector<uint8_t>& data, const Seed& seed){
    auto committer = cached_committer(PUBLIC_STRING, NUM_COLS);
    CommitmentOutput out = compute_commitments(data, *committer, seed);
    return serialize_output(out);
}

CommitmentOutputSerialized compute_commitments_binary_outputs(const std::vector<uint8_t>& data,
                                                              const std::vector<uint8_t>& seed){
    if(seed.size() != SEED_BYTES)
        throw InvalidSeedError("expected " + std::to_string(SEED_BYTES) + " bytes, got " + std::to_string(seed.size()));
    Seed s;
    std::copy(seed.begin(), seed.end(), s.begin());
    CommitmentOutputSerialized out = compute_commitments_binary_outputs(data, s);
    secure_erase(s.data(), s.size());
    return out;
}

CommitmentOutputSerialized compute_commitments_binary_outputs(const std::vector<uint8_t>& data, const Seed& seed,
                                                              const Config& cfg){
    if(cfg.public_string != PUBLIC_STRING)
        log::warn("non-default public string; commitments will not verify against the standard generators");
    if(cfg.log_num_cols != LOG_NUM_COLS || cfg.element_width != ELEMENT_WIDTH)
        log::warn("non-default matrix layout: " + std::to_string(cfg.num_cols()) + " columns, element width "
                  + std::to_string(cfg.element_width));
    auto committer = cached_committer(cfg.public_string, cfg.num_cols());
    CommitmentOutput out = compute_commitments(data, *committer, seed, cfg.commit_params());
    return serialize_output(out);
}

std::vector<uint8_t> serialize_commitment(const Commitment& c){
    std::vector<uint8_t> out;
    out.reserve(c.size() * POINT_BYTES);
    for(const G1& P : c){
        PointBytes b = point_to_bytes(P);
        out.insert(out.end(), b.begin(), b.end());
    }
    return out;
}

std::vector<uint8_t> serialize_blinding_factors(const BlindingFactors& bf){
    std::vector<uint8_t> out;
    out.reserve(bf.size() * SCALAR_BYTES);
    for(size_t i=0;i<bf.size();i++){
        ScalarBytes b = scalar_to_bytes(bf[i]);
        out.insert(out.end(), b.begin(), b.end());
        secure_erase(b.data(), b.size());
    }
    return out;
}

Commitment deserialize_commitment(const uint8_t* p, size_t n){
    if(n % POINT_BYTES != 0)
        throw DeserializationError("commitment length " + std::to_string(n) + " is not a multiple of "
                                   + std::to_string(POINT_BYTES));
    init_curve();
    Commitment c(n / POINT_BYTES);
    for(size_t i=0;i<c.size();i++){
        if(!point_from_bytes(p + i * POINT_BYTES, c[i]))
            throw DeserializationError("commitment element " + std::to_string(i) + " is not a valid point");
    }
    return c;
}

Commitment deserialize_commitment(const std::vector<uint8_t>& v){
    return deserialize_commitment(v.data(), v.size());
}

BlindingFactors deserialize_blinding_factors(const uint8_t* p, size_t n){
    if(n % SCALAR_BYTES != 0)
        throw DeserializationError("blinding factors length " + std::to_string(n) + " is not a multiple of "
                                   + std::to_string(SCALAR_BYTES));
    init_curve();
    BlindingFactors bf;
    bf.reserve(n / SCALAR_BYTES);
    for(size_t i=0;i<n/SCALAR_BYTES;i++){
        Fr x;
        if(!scalar_from_bytes(p + i * SCALAR_BYTES, x))
            throw DeserializationError("blinding factor " + std::to_string(i) + " is not a canonical scalar");
        bf.push_back(x);
        secure_erase(&x, sizeof(x));
    }
    return bf;
}

BlindingFactors deserialize_blinding_factors(const std::vector<uint8_t>& v){
    return deserialize_blinding_factors(v.data(), v.size());
}

size_t expected_row_count(size_t data_len){
    return row_count_for(data_len, NUM_COLS, ELEMENT_WIDTH);
}

size_t check_outputs_consistent(const CommitmentOutputSerialized& out){
    const size_t nc = out.commitment_serialized.size();
    const size_t nb = out.blinding_factors_serialized.size();
    if(nc % POINT_BYTES != 0) throw DeserializationError("commitment stream length is not a multiple of 34");
    if(nb % SCALAR_BYTES != 0) throw DeserializationError("blinding stream length is not a multiple of 32");
    if(nc / POINT_BYTES != nb / SCALAR_BYTES)
        throw DeserializationError("streams disagree: " + std::to_string(nc / POINT_BYTES) + " commitments, "
                                   + std::to_string(nb / SCALAR_BYTES) + " blinding factors");
    return nc / POINT_BYTES;
}

} // namespace hyrax
