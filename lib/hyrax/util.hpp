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

// util.hpp
// hex, file and memory-wiping helpers shared by the library and the tools.

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hyrax {

std::string to_hex(const uint8_t* p, size_t n);

// Throws std::runtime_error when the file cannot be opened or read.
std::vector<uint8_t> read_file(const std::string& path);
bool write_file(const std::string& path, const std::vector<uint8_t>& data);
// Writes to "<path>.tmp" and renames over path, so a reader never sees a
// half-written file.
bool write_file_atomic(const std::string& path, const std::vector<uint8_t>& data);

// OPENSSL_cleanse; survives dead-store elimination.
void secure_erase(void* p, size_t n);
void secure_erase(std::vector<uint8_t>& v);

// OS entropy through OpenSSL RAND_bytes. Throws GenerationError on failure.
std::vector<uint8_t> random_bytes(size_t n);

} // namespace hyrax
