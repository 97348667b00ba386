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

#include "hyrax/pedersen.hpp"

#include "hyrax/errors.hpp"
#include "hyrax/log.hpp"
#include "hyrax/util.hpp"

#include <map>
#include <mutex>
#include <utility>

namespace hyrax {

static void check_dims(size_t n, size_t want){
    if(n != want)
        throw DimensionMismatchError("row has " + std::to_string(n) + " elements, generator set has " + std::to_string(want));
}

G1 commit_row(const Fr* row, size_t n, const GeneratorSet& gens, const Fr& blinding){
    check_dims(n, gens.size());
    init_curve();

    // mulVec may normalize its bases in place, so hand it a copy
    std::vector<G1> bases(gens.message_generators);
    bases.push_back(gens.blinding_generator);
    std::vector<Fr> scalars(row, row + n);
    scalars.push_back(blinding);

    G1 C;
    G1::mulVec(C, bases.data(), scalars.data(), scalars.size());
    secure_erase(scalars.data(), scalars.size() * sizeof(Fr));
    return C;
}

G1 commit_row(const std::vector<Fr>& row, const GeneratorSet& gens, const Fr& blinding){
    return commit_row(row.data(), row.size(), gens, blinding);
}

std::vector<G1> precompute_doublings(const G1& base, size_t bits){
    std::vector<G1> out;
    out.reserve(bits);
    G1 cur = base;
    for(size_t i=0;i<bits;i++){
        out.push_back(cur);
        G1::dbl(cur, cur);
    }
    return out;
}

PedersenCommitter::PedersenCommitter(std::shared_ptr<const GeneratorSet> gens)
    : gens_(std::move(gens)) {
    if(!gens_ || gens_->size() == 0) throw GenerationError("committer needs a non-empty generator set");
    doublings_.reserve(gens_->size());
    for(const G1& g : gens_->message_generators){
        doublings_.push_back(precompute_doublings(g, DOUBLING_BITS));
    }
}

G1 PedersenCommitter::commit(const Fr* row, size_t n, const Fr& blinding) const {
    return commit_row(row, n, *gens_, blinding);
}

G1 PedersenCommitter::commit(const std::vector<Fr>& row, const Fr& blinding) const {
    return commit_row(row.data(), row.size(), *gens_, blinding);
}

void PedersenCommitter::add_byte(G1& acc, size_t j, uint8_t v) const {
    const std::vector<G1>& pow = doublings_[j];
    for(size_t i=0;i<DOUBLING_BITS;i++){
        if((v >> i) & 1) G1::add(acc, acc, pow[i]);
    }
}

G1 PedersenCommitter::commit_small(const Fr* row, size_t n, const Fr& blinding) const {
    check_dims(n, size());

    G1 acc;
    acc.clear();
    for(size_t j=0;j<n;j++){
        ScalarBytes b = scalar_to_bytes(row[j]);
        bool small = true;
        for(size_t i=1;i<SCALAR_BYTES;i++) if(b[i]){ small = false; break; }
        if(small){
            add_byte(acc, j, b[0]);
        } else {
            G1 t;
            G1::mul(t, gens_->message_generators[j], row[j]);
            G1::add(acc, acc, t);
        }
        secure_erase(b.data(), b.size());
    }
    G1 hb;
    G1::mul(hb, gens_->blinding_generator, blinding);
    G1::add(acc, acc, hb);
    return acc;
}

std::shared_ptr<const PedersenCommitter> cached_committer(const std::string& public_string, size_t num_generators){
    static std::mutex mu;
    static std::map<std::pair<std::string, size_t>, std::shared_ptr<const PedersenCommitter>> cache;

    std::lock_guard<std::mutex> lock(mu);
    auto key = std::make_pair(public_string, num_generators);
    auto it = cache.find(key);
    if(it != cache.end()) return it->second;

    auto c = std::make_shared<const PedersenCommitter>(cached_generators(public_string, num_generators));
    cache.emplace(std::move(key), c);
    log::dbg("committer ready: " + std::to_string(num_generators) + " generators, "
             + std::to_string(PedersenCommitter::DOUBLING_BITS) + " doublings each");
    return c;
}

} // namespace hyrax
