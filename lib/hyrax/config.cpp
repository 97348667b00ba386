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

#include "hyrax/config.hpp"

#include "hyrax/curve.hpp"
#include "hyrax/errors.hpp"

#include <fstream>

using json = nlohmann::json;

namespace hyrax {

bool Config::is_default_layout() const {
    return public_string == PUBLIC_STRING && log_num_cols == LOG_NUM_COLS && element_width == ELEMENT_WIDTH;
}

CommitParams Config::commit_params() const {
    CommitParams p;
    p.element_width = element_width;
    p.num_threads = num_threads;
    return p;
}

json Config::to_json() const {
    return json{
        {"public_string", public_string},
        {"log_num_cols", log_num_cols},
        {"element_width", element_width},
        {"num_threads", num_threads},
        {"debug", debug},
    };
}

static int64_t get_int(const json& j, const char* key){
    const json& v = j.at(key);
    if(!v.is_number_integer()) throw ConfigError(std::string(key) + " must be an integer");
    return v.get<int64_t>();
}

Config Config::from_json(const json& j){
    if(!j.is_object()) throw ConfigError("top level must be an object");
    Config c;

    if(j.contains("public_string")){
        if(!j["public_string"].is_string()) throw ConfigError("public_string must be a string");
        c.public_string = j["public_string"].get<std::string>();
        if(c.public_string.empty()) throw ConfigError("public_string must not be empty");
    }
    if(j.contains("log_num_cols")){
        int64_t v = get_int(j, "log_num_cols");
        if(v < 1 || v > int64_t(MAX_LOG_NUM_COLS))
            throw ConfigError("log_num_cols must be in [1, " + std::to_string(MAX_LOG_NUM_COLS) + "]");
        c.log_num_cols = size_t(v);
    }
    if(j.contains("element_width")){
        int64_t v = get_int(j, "element_width");
        if(v < 1 || v > int64_t(SCALAR_BYTES)) throw ConfigError("element_width must be in [1, 32]");
        c.element_width = size_t(v);
    }
    if(j.contains("num_threads")){
        int64_t v = get_int(j, "num_threads");
        if(v < 0 || v > 4096) throw ConfigError("num_threads must be in [0, 4096]");
        c.num_threads = unsigned(v);
    }
    if(j.contains("debug")){
        if(!j["debug"].is_boolean()) throw ConfigError("debug must be a boolean");
        c.debug = j["debug"].get<bool>();
    }
    return c;
}

Config Config::load(const std::string& path){
    std::ifstream f(path);
    if(!f) throw ConfigError("cannot open " + path);
    json j;
    try {
        j = json::parse(f);
    } catch(const json::parse_error& e){
        throw ConfigError(path + ": " + e.what());
    }
    return from_json(j);
}

} // namespace hyrax
