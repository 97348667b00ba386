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

// config.hpp
// Optional JSON configuration, e.g.
//
//   { "public_string": "...", "log_num_cols": 9, "element_width": 1,
//     "num_threads": 0, "debug": false }
//
// Missing keys keep their defaults, unknown keys are ignored. Anything other
// than the defaults for public_string, log_num_cols or element_width produces
// commitments that no default verifier accepts.

#pragma once
#include "hyrax/params.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace hyrax {

struct Config {
    std::string public_string = PUBLIC_STRING;
    size_t log_num_cols = LOG_NUM_COLS;
    size_t element_width = ELEMENT_WIDTH;
    unsigned num_threads = 0;
    bool debug = false;

    static constexpr size_t MAX_LOG_NUM_COLS = 20;

    size_t num_cols() const { return size_t(1) << log_num_cols; }
    bool is_default_layout() const;
    CommitParams commit_params() const;

    nlohmann::json to_json() const;

    static Config defaults() { return Config(); }
    // Throws ConfigError on wrong types or out-of-range values.
    static Config from_json(const nlohmann::json& j);
    static Config load(const std::string& path);
};

} // namespace hyrax
