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

#include "hyrax/curve.hpp"

#include "hyrax/errors.hpp"
#include "hyrax/log.hpp"
#include "hyrax/util.hpp"

#include <cstring>
#include <mutex>

namespace hyrax {

static std::once_flag g_curve_once;
static bool g_curve_ok = false;

void init_curve(){
    std::call_once(g_curve_once, []{
        bool ok = false;
        mcl::bn::initPairing(&ok, mcl::BN_SNARK1);
        g_curve_ok = ok;
        log::dbg(ok ? "mcl initialized for BN_SNARK1" : "mcl initPairing(BN_SNARK1) failed");
    });
    if(!g_curve_ok) throw GenerationError("mcl rejected the BN254 curve parameters");
}

// BN254 G1: y^2 = x^3 + 3
static Fp curve_b(){ return Fp(3); }

ScalarBytes scalar_to_bytes(const Fr& x){
    ScalarBytes out{};
    if(x.serialize(out.data(), out.size()) != out.size())
        throw std::logic_error("Fr does not serialize to 32 bytes");
    return out;
}

bool scalar_from_bytes(const uint8_t* b, Fr& out){
    Fr x;
    if(x.deserialize(b, SCALAR_BYTES) != SCALAR_BYTES) return false;
    // must round-trip byte for byte, otherwise the input was >= r
    ScalarBytes back = scalar_to_bytes(x);
    bool canonical = std::memcmp(back.data(), b, SCALAR_BYTES) == 0;
    secure_erase(back.data(), back.size());
    if(canonical) out = x;
    secure_erase(&x, sizeof(x));
    return canonical;
}

bool field_from_bytes(const uint8_t* b, Fp& out){
    Fp x;
    if(x.deserialize(b, FIELD_BYTES) != FIELD_BYTES) return false;
    uint8_t back[FIELD_BYTES];
    if(x.serialize(back, sizeof(back)) != FIELD_BYTES) return false;
    if(std::memcmp(back, b, FIELD_BYTES) != 0) return false;
    out = x;
    return true;
}

bool decompress_x(const Fp& x, bool odd, G1& out){
    Fp y2 = x * x * x + curve_b();
    Fp y;
    if(!Fp::squareRoot(y, y2)) return false;
    if(y.isOdd() != odd) Fp::neg(y, y);
    if(y.isOdd() != odd) return false; // y == 0
    G1 P;
    P.x = x;
    P.y = y;
    P.z = 1;
    if(!P.isValid()) return false;
    out = P;
    return true;
}

PointBytes point_to_bytes(const G1& P){
    PointBytes out;
    if(P.isZero()){
        out.fill(0x01);
        return out;
    }
    G1 A(P);
    A.normalize();
    out[0] = 0x00;
    if(A.x.serialize(out.data() + 1, FIELD_BYTES) != FIELD_BYTES)
        throw std::logic_error("Fp does not serialize to 32 bytes");
    out[POINT_BYTES - 1] = A.y.isOdd() ? 0x01 : 0x00;
    return out;
}

bool point_from_bytes(const uint8_t* b, G1& out){
    if(b[0] == 0x01){
        for(size_t i=1;i<POINT_BYTES;i++) if(b[i] != 0x01) return false;
        out.clear();
        return true;
    }
    if(b[0] != 0x00) return false;
    uint8_t parity = b[POINT_BYTES - 1];
    if(parity > 1) return false;
    Fp x;
    if(!field_from_bytes(b + 1, x)) return false;
    return decompress_x(x, parity == 1, out);
}

std::string point_to_hex(const G1& P){
    PointBytes b = point_to_bytes(P);
    return to_hex(b.data(), b.size());
}

std::string scalar_to_hex(const Fr& x){
    ScalarBytes b = scalar_to_bytes(x);
    return to_hex(b.data(), b.size());
}

} // namespace hyrax
