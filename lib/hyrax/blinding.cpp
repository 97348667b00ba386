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

#include "hyrax/blinding.hpp"

#include "hyrax/errors.hpp"
#include "hyrax/util.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>

namespace hyrax {

BlindingFactors::~BlindingFactors(){ wipe(); }

BlindingFactors::BlindingFactors(BlindingFactors&& o) noexcept
    : values_(std::move(o.values_)) {
    o.values_.clear();
}

BlindingFactors& BlindingFactors::operator=(BlindingFactors&& o) noexcept {
    if(this != &o){
        wipe();
        values_ = std::move(o.values_);
        o.values_.clear();
    }
    return *this;
}

void BlindingFactors::reserve(size_t n){
    if(n <= values_.capacity()) return;
    std::vector<Fr> grown;
    grown.reserve(n);
    grown.assign(values_.begin(), values_.end());
    wipe();
    values_ = std::move(grown);
}

void BlindingFactors::push_back(const Fr& x){
    if(values_.size() == values_.capacity()) reserve(std::max<size_t>(8, 2 * values_.capacity()));
    values_.push_back(x);
}

void BlindingFactors::wipe(){
    secure_erase(values_.data(), values_.size() * sizeof(Fr));
    values_.clear();
}

namespace {

// ChaCha20 keystream (RFC 8439 block function, 32-bit counter, zero nonce).
class ChaChaStream {
public:
    explicit ChaChaStream(const uint8_t* key) : ctx_(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free) {
        if(!ctx_) throw GenerationError("EVP_CIPHER_CTX_new failed");
        const uint8_t iv[16] = {0};
        if(EVP_EncryptInit_ex(ctx_.get(), EVP_chacha20(), nullptr, key, iv) != 1)
            throw GenerationError("ChaCha20 init failed");
    }

    void fill(uint8_t* out, size_t n){
        static const uint8_t zeros[64] = {0};
        while(n){
            size_t c = std::min(n, sizeof(zeros));
            int outl = 0;
            if(EVP_EncryptUpdate(ctx_.get(), out, &outl, zeros, int(c)) != 1 || size_t(outl) != c)
                throw GenerationError("ChaCha20 keystream failed");
            out += c;
            n -= c;
        }
    }

private:
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx_;
};

} // namespace

BlindingFactors generate_blinding_factors(const Seed& seed, size_t row_count){
    init_curve();
    BlindingFactors bf;
    bf.reserve(row_count);
    if(row_count == 0) return bf;

    ChaChaStream stream(seed.data());
    uint8_t cand[SCALAR_BYTES];
    while(bf.size() < row_count){
        stream.fill(cand, sizeof(cand));
        cand[SCALAR_BYTES - 1] &= 0x3f;  // r < 2^254
        Fr x;
        if(scalar_from_bytes(cand, x)) bf.push_back(x);
        secure_erase(&x, sizeof(x));
    }
    secure_erase(cand, sizeof(cand));
    return bf;
}

BlindingFactors generate_blinding_factors(const uint8_t* seed, size_t seed_len, size_t row_count){
    if(seed_len != SEED_BYTES)
        throw InvalidSeedError("expected " + std::to_string(SEED_BYTES) + " bytes, got " + std::to_string(seed_len));
    Seed s;
    std::copy(seed, seed + SEED_BYTES, s.begin());
    BlindingFactors bf = generate_blinding_factors(s, row_count);
    secure_erase(s.data(), s.size());
    return bf;
}

BlindingFactors generate_blinding_factors(const std::vector<uint8_t>& seed, size_t row_count){
    return generate_blinding_factors(seed.data(), seed.size(), row_count);
}

} // namespace hyrax
