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

// curve.hpp
// BN254 (alt_bn128) scalars and G1 points via Herumi mcl (https://github.com/herumi/mcl)
//
// Link flags:  -lmcl -lcrypto
//
// Wire encodings (fixed, little-endian):
//   scalar : 32 bytes, value < r
//   point  : 34 bytes = [0x00][x, 32 bytes][parity of y]
//            the point at infinity is 34 bytes of 0x01
//
// init_curve() must run before any other call; every public entry point of
// the library calls it.

#pragma once
#include <mcl/bn.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace hyrax {

using Fr = mcl::bn::Fr;
using Fp = mcl::bn::Fp;
using G1 = mcl::bn::G1;

constexpr size_t SCALAR_BYTES = 32;
constexpr size_t FIELD_BYTES  = 32;
constexpr size_t POINT_BYTES  = 1 + FIELD_BYTES + 1;

using ScalarBytes = std::array<uint8_t, SCALAR_BYTES>;
using PointBytes  = std::array<uint8_t, POINT_BYTES>;

// Idempotent and thread-safe. Throws GenerationError if mcl refuses the curve.
void init_curve();

ScalarBytes scalar_to_bytes(const Fr& x);
// Reads SCALAR_BYTES from b. Only the canonical encoding (< r) is accepted.
bool scalar_from_bytes(const uint8_t* b, Fr& out);

bool field_from_bytes(const uint8_t* b, Fp& out);

PointBytes point_to_bytes(const G1& P);
// Reads POINT_BYTES from b. Rejects unknown flag bytes, x >= p, x off the
// curve, parity bytes other than 0/1 and non-canonical infinity encodings.
bool point_from_bytes(const uint8_t* b, G1& out);

// Lift x to the curve point whose y has the requested parity.
bool decompress_x(const Fp& x, bool odd, G1& out);

std::string point_to_hex(const G1& P);
std::string scalar_to_hex(const Fr& x);

} // namespace hyrax
