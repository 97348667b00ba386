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

// hyrax_commit.cpp
// Commit a file with a fresh random seed.
//
//   ./hyrax_commit --input-filepath <data.bin>
//                  --output-commitment-filepath <commitment.bin>
//                  --output-blinding-factors-filepath <blinding.bin>
//                  [--config <config.json>] [--debug]
//
// Exit codes: 0 ok, 1 usage or I/O, 2 commitment error.

#include "hyrax/hyrax.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>

using namespace hyrax;

static void usage(){
    fprintf(stderr,
        "Usage:\n"
        "  ./hyrax_commit --input-filepath <in> --output-commitment-filepath <out>\n"
        "                 --output-blinding-factors-filepath <out> [--config <json>] [--debug]\n");
}

int main(int argc, char** argv){
    std::string in_path, commit_path, blind_path, config_path;
    bool debug = false;
    for(int i=1;i<argc;i++){
        std::string a = argv[i];
        if(a=="--input-filepath" && i+1<argc) in_path = argv[++i];
        else if(a=="--output-commitment-filepath" && i+1<argc) commit_path = argv[++i];
        else if(a=="--output-blinding-factors-filepath" && i+1<argc) blind_path = argv[++i];
        else if(a=="--config" && i+1<argc) config_path = argv[++i];
        else if(a=="--debug") debug = true;
        else { fprintf(stderr, "Unknown argument: %s\n", a.c_str()); usage(); return 1; }
    }
    if(in_path.empty() || commit_path.empty() || blind_path.empty()){ usage(); return 1; }

    Config cfg;
    try{
        if(!config_path.empty()) cfg = Config::load(config_path);
    }catch(const std::exception& e){
        log::error(e.what());
        return 1;
    }
    log::set_debug(debug || cfg.debug);

    std::vector<uint8_t> data;
    try{
        data = read_file(in_path);
    }catch(const std::exception& e){
        log::error(e.what());
        return 1;
    }
    log::dbg("read " + std::to_string(data.size()) + " bytes from " + in_path);

    CommitmentOutputSerialized out;
    try{
        std::vector<uint8_t> seed_bytes = random_bytes(SEED_BYTES);
        Seed seed;
        std::copy(seed_bytes.begin(), seed_bytes.end(), seed.begin());
        secure_erase(seed_bytes);

        auto t0 = std::chrono::steady_clock::now();
        out = compute_commitments_binary_outputs(data, seed, cfg);
        secure_erase(seed.data(), seed.size());
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        log::dbg("commitment took " + std::to_string(ms) + " ms");

        size_t rows = check_outputs_consistent(out);
        if(cfg.is_default_layout() && rows != expected_row_count(data.size()))
            throw DeserializationError("row count " + std::to_string(rows) + " does not match the input length");
    }catch(const std::exception& e){
        secure_erase(data);
        log::error(e.what());
        return 2;
    }
    secure_erase(data);

    if(!write_file_atomic(commit_path, out.commitment_serialized)){
        fprintf(stderr, "error: cannot write %s\n", commit_path.c_str());
        return 1;
    }
    if(!write_file_atomic(blind_path, out.blinding_factors_serialized)){
        fprintf(stderr, "error: cannot write %s\n", blind_path.c_str());
        std::remove(commit_path.c_str());
        return 1;
    }

    log::info("wrote " + std::to_string(out.commitment_serialized.size() / POINT_BYTES) + " row commitments to "
              + commit_path + " and blinding factors to " + blind_path);
    return 0;
}
