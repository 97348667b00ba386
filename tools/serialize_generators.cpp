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

// serialize_generators.cpp
// Dump the Pedersen generators as JSON so a verifier can check them.
//
//   ./serialize_generators --output-filepath <generators.json> [--config <json>]

#include "hyrax/hyrax.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

using json = nlohmann::json;
using namespace hyrax;

int main(int argc, char** argv){
    std::string out_path, config_path;
    for(int i=1;i<argc;i++){
        std::string a = argv[i];
        if(a=="--output-filepath" && i+1<argc) out_path = argv[++i];
        else if(a=="--config" && i+1<argc) config_path = argv[++i];
        else if(a=="--debug") log::set_debug(true);
        else { fprintf(stderr, "Unknown argument: %s\n", a.c_str()); out_path.clear(); break; }
    }
    if(out_path.empty()){
        fprintf(stderr, "Usage: ./serialize_generators --output-filepath <json> [--config <json>]\n");
        return 1;
    }

    std::string text;
    try{
        Config cfg = config_path.empty() ? Config::defaults() : Config::load(config_path);
        if(cfg.debug) log::set_debug(true);
        if(cfg.public_string != PUBLIC_STRING) log::warn("non-default public string");

        auto gens = cached_generators(cfg.public_string, cfg.num_cols());
        json j;
        j["public_string"] = cfg.public_string;
        j["num_generators"] = gens->size();
        json msg = json::array();
        for(const G1& g : gens->message_generators) msg.push_back(point_to_hex(g));
        j["message_generators"] = msg;
        j["blinding_generator"] = point_to_hex(gens->blinding_generator);
        text = j.dump(2) + "\n";
    }catch(const std::exception& e){
        log::error(e.what());
        return 2;
    }

    if(!write_file_atomic(out_path, std::vector<uint8_t>(text.begin(), text.end()))){
        fprintf(stderr, "error: cannot write %s\n", out_path.c_str());
        return 1;
    }
    log::info("wrote generators to " + out_path);
    return 0;
}
