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

#include <gtest/gtest.h>

using namespace hyrax;

static Seed seed_of(uint8_t v){
    Seed s;
    s.fill(v);
    return s;
}

TEST(Blinding, Deterministic){
    BlindingFactors a = generate_blinding_factors(seed_of(7), 64);
    BlindingFactors b = generate_blinding_factors(seed_of(7), 64);
    ASSERT_EQ(a.size(), 64u);
    EXPECT_EQ(a, b);
}

TEST(Blinding, SeedSensitive){
    BlindingFactors a = generate_blinding_factors(seed_of(7), 16);
    Seed s = seed_of(7);
    s[31] ^= 0x80;
    BlindingFactors b = generate_blinding_factors(s, 16);
    for(size_t i=0;i<16;i++) EXPECT_NE(a[i], b[i]) << i;
}

TEST(Blinding, ShortRunIsPrefixOfLongRun){
    BlindingFactors small = generate_blinding_factors(seed_of(3), 5);
    BlindingFactors big = generate_blinding_factors(seed_of(3), 50);
    for(size_t i=0;i<5;i++) EXPECT_EQ(small[i], big[i]) << i;
}

TEST(Blinding, DistinctAndCanonical){
    BlindingFactors bf = generate_blinding_factors(seed_of(0), 256);
    for(size_t i=0;i<bf.size();i++){
        ScalarBytes b = scalar_to_bytes(bf[i]);
        EXPECT_LE(b[SCALAR_BYTES - 1], 0x30) << i;
        Fr back;
        EXPECT_TRUE(scalar_from_bytes(b.data(), back)) << i;
        if(i) EXPECT_NE(bf[i], bf[i - 1]) << i;
    }
}

TEST(Blinding, ZeroRows){
    EXPECT_TRUE(generate_blinding_factors(seed_of(1), 0).empty());
}

TEST(Blinding, SeedLengthChecked){
    EXPECT_THROW(generate_blinding_factors(std::vector<uint8_t>(31), 4), InvalidSeedError);
    EXPECT_THROW(generate_blinding_factors(std::vector<uint8_t>(33), 4), InvalidSeedError);
    EXPECT_THROW(generate_blinding_factors(std::vector<uint8_t>(), 4), InvalidSeedError);

    BlindingFactors a = generate_blinding_factors(std::vector<uint8_t>(32, 9), 4);
    EXPECT_EQ(a, generate_blinding_factors(seed_of(9), 4));
}

TEST(Blinding, MoveAndWipe){
    BlindingFactors a = generate_blinding_factors(seed_of(2), 8);
    BlindingFactors b(std::move(a));
    EXPECT_EQ(b.size(), 8u);
    EXPECT_TRUE(a.empty());
    b.wipe();
    EXPECT_TRUE(b.empty());
}

TEST(Blinding, PushBackBeyondReserve){
    BlindingFactors bf;
    bf.reserve(2);
    for(int i=0;i<20;i++) bf.push_back(Fr(i));
    ASSERT_EQ(bf.size(), 20u);
    for(int i=0;i<20;i++) EXPECT_EQ(bf[i], Fr(i));
}

// ChaCha20 with an all-zero key and nonce starts with the RFC 8439 A.1 test
// vector 76b8e0ad...0dc7 da41597c...6586. Both 32-byte halves are below r once
// their top two bits are cleared, so they are the first two factors.
TEST(Blinding, KnownAnswerZeroSeed){
    BlindingFactors bf = generate_blinding_factors(Seed{}, 2);
    EXPECT_EQ(scalar_to_hex(bf[0]), "76b8e0ada0f13d90405d6ae55386bd28bdd219b8a08ded1aa836efcc8b770d07");
    EXPECT_EQ(scalar_to_hex(bf[1]), "da41597c5157488d7724e03fb8d84a376a43b8f41518a11cc387b669b2ee6506");
}

TEST(Blinding, GrowthKeepsValuesAndWipeEmpties){
    BlindingFactors bf = generate_blinding_factors(seed_of(5), 3);
    BlindingFactors copy;
    for(size_t i=0;i<bf.size();i++) copy.push_back(bf[i]);
    for(int i=0;i<40;i++) copy.push_back(Fr(i));
    ASSERT_EQ(copy.size(), 43u);
    for(size_t i=0;i<bf.size();i++) EXPECT_EQ(copy[i], bf[i]) << i;
    copy.wipe();
    EXPECT_TRUE(copy.empty());
}
