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

#include "hyrax/generators.hpp"

#include "hyrax/errors.hpp"
#include "hyrax/log.hpp"

#include <openssl/evp.h>

#include <map>
#include <mutex>
#include <utility>

namespace hyrax {

namespace {

// SHAKE256 via OpenSSL EVP, one context reused across candidates.
class Shake256 {
public:
    Shake256() : ctx_(EVP_MD_CTX_new(), EVP_MD_CTX_free) {
        if(!ctx_) throw GenerationError("EVP_MD_CTX_new failed");
        md_ = EVP_shake256();
        if(!md_) throw GenerationError("SHAKE256 is not available in this OpenSSL build");
    }

    void candidate(const std::string& public_string, uint64_t k, uint8_t* out, size_t outlen){
        uint8_t ctr[8];
        for(int i=0;i<8;i++) ctr[i] = uint8_t((k >> (8*i)) & 0xff);
        if(EVP_DigestInit_ex(ctx_.get(), md_, nullptr) != 1)
            throw GenerationError("SHAKE256 init failed");
        if(!public_string.empty() && EVP_DigestUpdate(ctx_.get(), public_string.data(), public_string.size()) != 1)
            throw GenerationError("SHAKE256 update failed");
        if(EVP_DigestUpdate(ctx_.get(), ctr, sizeof(ctr)) != 1)
            throw GenerationError("SHAKE256 update failed");
        if(EVP_DigestFinalXOF(ctx_.get(), out, outlen) != 1)
            throw GenerationError("SHAKE256 squeeze failed");
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
    const EVP_MD* md_ = nullptr;
};

bool lift_candidate(const uint8_t* block, G1& out){
    Fp x;
    bool ok = false;
    x.setLittleEndianMod(&ok, block, 2 * FIELD_BYTES);
    if(!ok) throw GenerationError("mcl could not reduce a 64-byte candidate");
    return decompress_x(x, (block[2 * FIELD_BYTES] & 1) != 0, out);
}

} // namespace

bool sample_candidate(const std::string& public_string, uint64_t k, G1& out){
    init_curve();
    Shake256 xof;
    uint8_t block[CANDIDATE_BYTES];
    xof.candidate(public_string, k, block, sizeof(block));
    return lift_candidate(block, out);
}

GeneratorSet sample_generators(const std::string& public_string, size_t count){
    if(count == 0) throw GenerationError("at least one message generator is required");
    init_curve();

    Shake256 xof;
    const uint64_t wanted = uint64_t(count) + 1;
    std::vector<G1> points;
    points.reserve(count + 1);

    uint64_t k = 0;
    uint8_t block[CANDIDATE_BYTES];
    while(points.size() < wanted){
        if(k >= wanted + MAX_SAMPLING_ATTEMPTS)
            throw std::logic_error("generator sampling exhausted its candidate budget");
        xof.candidate(public_string, k, block, sizeof(block));
        G1 P;
        if(lift_candidate(block, P)) points.push_back(P);
        k++;
    }

    GeneratorSet gens;
    gens.blinding_generator = points.back();
    points.pop_back();
    gens.message_generators = std::move(points);
    log::dbg("sampled " + std::to_string(count) + "+1 generators from " + std::to_string(k) + " candidates");
    return gens;
}

std::shared_ptr<const GeneratorSet> cached_generators(const std::string& public_string, size_t count){
    static std::mutex mu;
    static std::map<std::pair<std::string, size_t>, std::shared_ptr<const GeneratorSet>> cache;

    std::lock_guard<std::mutex> lock(mu);
    auto key = std::make_pair(public_string, count);
    auto it = cache.find(key);
    if(it != cache.end()) return it->second;

    auto gens = std::make_shared<const GeneratorSet>(sample_generators(public_string, count));
    cache.emplace(std::move(key), gens);
    return gens;
}

} // namespace hyrax
