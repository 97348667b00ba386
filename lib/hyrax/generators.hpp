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

// generators.hpp
// Public Pedersen generators derived from a public string, nothing up the sleeve.
//
// Candidate k (k = 0, 1, 2, ...):
//   block = SHAKE256(public_string || LE64(k)), 65 bytes
//   x     = LE(block[0..64)) mod p
//   odd   = block[64] & 1
// A candidate is kept when x lifts to the curve; y is chosen by parity.
// The first `count` kept points are the message generators, the next one is
// the blinding generator. Changing any of this invalidates every commitment
// ever issued.

#pragma once
#include "hyrax/curve.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace hyrax {

constexpr size_t CANDIDATE_BYTES = 2 * FIELD_BYTES + 1;
// Draws allowed beyond count + 1 before sampling is declared broken. About
// half of all x lift, so this is never reached for a working hash.
constexpr uint64_t MAX_SAMPLING_ATTEMPTS = uint64_t(1) << 20;

struct GeneratorSet {
    std::vector<G1> message_generators;  // "g_j", one per matrix column
    G1 blinding_generator;               // "h"

    size_t size() const { return message_generators.size(); }
    bool operator==(const GeneratorSet& o) const {
        return message_generators == o.message_generators && blinding_generator == o.blinding_generator;
    }
    bool operator!=(const GeneratorSet& o) const { return !(*this == o); }
};

// Candidate k of the derivation above. Returns false if x does not lift.
bool sample_candidate(const std::string& public_string, uint64_t k, G1& out);

// Throws GenerationError for count == 0 or when SHAKE256 is unavailable.
GeneratorSet sample_generators(const std::string& public_string, size_t count);

// Process-wide, keyed by (public_string, count). The first caller samples
// under the cache lock; every later caller shares the same immutable set.
std::shared_ptr<const GeneratorSet> cached_generators(const std::string& public_string, size_t count);

} // namespace hyrax
