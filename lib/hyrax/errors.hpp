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

// errors.hpp
// Exception taxonomy of the commitment core. Everything derives from
// hyrax::Error (itself a std::runtime_error) so callers can catch the whole
// family at a boundary.

#pragma once
#include <stdexcept>
#include <string>

namespace hyrax {

struct Error : std::runtime_error {
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// A data chunk does not fit in the scalar field, or the layout is unusable.
struct EncodingError : Error {
    explicit EncodingError(const std::string& msg) : Error("encoding: " + msg) {}
};

struct InvalidSeedError : Error {
    explicit InvalidSeedError(const std::string& msg) : Error("seed: " + msg) {}
};

// Row length and generator count disagree. Only reachable through a
// mis-composed call.
struct DimensionMismatchError : Error {
    explicit DimensionMismatchError(const std::string& msg) : Error("dimension: " + msg) {}
};

// Hash / cipher / curve primitive could not be set up.
struct GenerationError : Error {
    explicit GenerationError(const std::string& msg) : Error("generation: " + msg) {}
};

struct DeserializationError : Error {
    explicit DeserializationError(const std::string& msg) : Error("deserialize: " + msg) {}
};

struct ConfigError : Error {
    explicit ConfigError(const std::string& msg) : Error("config: " + msg) {}
};

} // namespace hyrax
