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

// benchmark_iris_commit.cpp
// Time each stage of a commitment over random data of 2^N bytes.
//
//   ./benchmark_iris_commit [--log-image-size N] [--threads N] [--debug]

#include "hyrax/hyrax.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>

using namespace hyrax;
using Clock = std::chrono::steady_clock;

static double ms_since(Clock::time_point t0){
    return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
}

int main(int argc, char** argv){
    int log_size = 17;
    unsigned threads = 0;
    try{
        for(int i=1;i<argc;i++){
            std::string a = argv[i];
            if(a=="--log-image-size" && i+1<argc) log_size = std::stoi(argv[++i]);
            else if(a=="--threads" && i+1<argc) threads = unsigned(std::stoul(argv[++i]));
            else if(a=="--debug") log::set_debug(true);
            else { fprintf(stderr, "Unknown argument: %s\n", a.c_str()); return 1; }
        }
    }catch(const std::exception& e){
        fprintf(stderr, "bad numeric argument: %s\n", e.what());
        return 1;
    }
    if(log_size < 0 || log_size > 30){
        fprintf(stderr, "--log-image-size must be in [0, 30]\n");
        return 1;
    }

    try{
        const size_t n = size_t(1) << log_size;
        std::vector<uint8_t> data = random_bytes(n);
        std::vector<uint8_t> sb = random_bytes(SEED_BYTES);
        Seed seed;
        std::copy(sb.begin(), sb.end(), seed.begin());

        auto t0 = Clock::now();
        auto committer = cached_committer(PUBLIC_STRING, NUM_COLS);
        double t_gens = ms_since(t0);

        CommitParams params;
        params.num_threads = threads;

        t0 = Clock::now();
        CommitmentOutput out = compute_commitments(data, *committer, seed, params);
        double t_commit = ms_since(t0);

        t0 = Clock::now();
        CommitmentOutputSerialized ser;
        ser.commitment_serialized = serialize_commitment(out.commitment);
        ser.blinding_factors_serialized = serialize_blinding_factors(out.blinding_factors);
        double t_ser = ms_since(t0);

        t0 = Clock::now();
        Commitment c2 = deserialize_commitment(ser.commitment_serialized);
        BlindingFactors b2 = deserialize_blinding_factors(ser.blinding_factors_serialized);
        double t_de = ms_since(t0);
        if(c2 != out.commitment || b2 != out.blinding_factors){
            fprintf(stderr, "round trip mismatch\n");
            return 2;
        }

        size_t rows = check_outputs_consistent(ser);
        printf("image          : 2^%d bytes, %zu rows x %zu cols\n", log_size, rows, NUM_COLS);
        printf("generators     : %10.2f ms\n", t_gens);
        printf("commit         : %10.2f ms (%.3f ms/row)\n", t_commit, rows ? t_commit / rows : 0.0);
        printf("serialize      : %10.2f ms\n", t_ser);
        printf("deserialize    : %10.2f ms\n", t_de);
        printf("commitment     : %zu bytes\n", ser.commitment_serialized.size());
        printf("blinding       : %zu bytes\n", ser.blinding_factors_serialized.size());
    }catch(const std::exception& e){
        log::error(e.what());
        return 2;
    }
    return 0;
}
