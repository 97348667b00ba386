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

#include "hyrax/errors.hpp"
#include "hyrax/pedersen.hpp"

#include <gtest/gtest.h>

#include <random>

using namespace hyrax;

class PedersenTest : public ::testing::Test {
protected:
    void SetUp() override {
        gens = cached_generators("HYRAX-TEST-V1", 16);
        committer = std::make_shared<PedersenCommitter>(gens);
    }

    static std::vector<Fr> random_row(size_t n){
        std::vector<Fr> row(n);
        for(auto& x : row) x.setByCSPRNG();
        return row;
    }

    static std::vector<Fr> byte_row(size_t n, uint32_t seed){
        std::mt19937 rng(seed);
        std::vector<Fr> row(n);
        for(auto& x : row) x = Fr(int(rng() & 0xff));
        return row;
    }

    static G1 naive(const std::vector<Fr>& row, const GeneratorSet& g, const Fr& blinding){
        G1 acc, t;
        acc.clear();
        for(size_t j=0;j<row.size();j++){
            G1::mul(t, g.message_generators[j], row[j]);
            G1::add(acc, acc, t);
        }
        G1::mul(t, g.blinding_generator, blinding);
        G1::add(acc, acc, t);
        return acc;
    }

    std::shared_ptr<const GeneratorSet> gens;
    std::shared_ptr<PedersenCommitter> committer;
};

TEST_F(PedersenTest, MatchesNaiveSum){
    std::vector<Fr> row = random_row(16);
    Fr b;
    b.setByCSPRNG();
    EXPECT_EQ(commit_row(row, *gens, b), naive(row, *gens, b));
}

TEST_F(PedersenTest, SmallPathMatchesMsm){
    for(uint32_t s=0;s<8;s++){
        std::vector<Fr> row = byte_row(16, s);
        Fr b(int(1000 + s));
        EXPECT_EQ(committer->commit_small(row.data(), row.size(), b), committer->commit(row, b)) << s;
    }
}

TEST_F(PedersenTest, SmallPathFallsBackForLargeElements){
    std::vector<Fr> row = byte_row(16, 42);
    row[3] = Fr(1 << 20);
    row[7].setByCSPRNG();
    Fr b(5);
    EXPECT_EQ(committer->commit_small(row.data(), row.size(), b), naive(row, *gens, b));
}

TEST_F(PedersenTest, ZeroRowCommitsToBlindingOnly){
    std::vector<Fr> row(16, Fr(0));
    Fr b(77);
    G1 hb;
    G1::mul(hb, gens->blinding_generator, b);
    EXPECT_EQ(commit_row(row, *gens, b), hb);
    EXPECT_EQ(committer->commit_small(row.data(), row.size(), b), hb);

    EXPECT_TRUE(commit_row(row, *gens, Fr(0)).isZero());
}

TEST_F(PedersenTest, BlindingChangesCommitment){
    std::vector<Fr> row = byte_row(16, 9);
    EXPECT_NE(commit_row(row, *gens, Fr(1)), commit_row(row, *gens, Fr(2)));
}

TEST_F(PedersenTest, OrderMatters){
    std::vector<Fr> row = byte_row(16, 11);
    row[0] = Fr(1);
    row[1] = Fr(2);
    std::vector<Fr> swapped(row);
    std::swap(swapped[0], swapped[1]);
    EXPECT_NE(commit_row(row, *gens, Fr(3)), commit_row(swapped, *gens, Fr(3)));
}

TEST_F(PedersenTest, DimensionMismatch){
    std::vector<Fr> short_row(15, Fr(1));
    std::vector<Fr> long_row(17, Fr(1));
    EXPECT_THROW(commit_row(short_row, *gens, Fr(0)), DimensionMismatchError);
    EXPECT_THROW(commit_row(long_row, *gens, Fr(0)), DimensionMismatchError);
    EXPECT_THROW(committer->commit_small(short_row.data(), short_row.size(), Fr(0)), DimensionMismatchError);
}

TEST_F(PedersenTest, DoublingsTable){
    for(size_t j : {size_t(0), size_t(15)}){
        const std::vector<G1>& d = committer->doublings(j);
        ASSERT_EQ(d.size(), PedersenCommitter::DOUBLING_BITS);
        for(size_t i=0;i<d.size();i++){
            G1 want;
            G1::mul(want, gens->message_generators[j], Fr(int(1 << i)));
            EXPECT_EQ(d[i], want) << j << "," << i;
        }
    }
}

TEST_F(PedersenTest, CoversWidth){
    EXPECT_TRUE(PedersenCommitter::covers_width(1));
    EXPECT_FALSE(PedersenCommitter::covers_width(2));
}

TEST_F(PedersenTest, CachedCommitterShared){
    auto a = cached_committer("HYRAX-TEST-V1", 16);
    auto b = cached_committer("HYRAX-TEST-V1", 16);
    EXPECT_EQ(a.get(), b.get());
    EXPECT_EQ(a->generators(), *gens);
}
