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

#include "hyrax/util.hpp"

#include "hyrax/errors.hpp"

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <cstdio>
#include <fstream>
#include <iterator>

namespace hyrax {

std::string to_hex(const uint8_t* p, size_t n){
    static const char* H="0123456789abcdef";
    std::string o; o.reserve(n*2);
    for(size_t i=0;i<n;i++){ o.push_back(H[p[i]>>4]); o.push_back(H[p[i]&0xf]); }
    return o;
}

std::vector<uint8_t> read_file(const std::string& path){
    std::ifstream f(path, std::ios::binary);
    if(!f) throw std::runtime_error("cannot open " + path + " for reading");
    std::vector<uint8_t> out((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if(f.bad()) throw std::runtime_error("read of " + path + " failed");
    return out;
}

bool write_file(const std::string& path, const std::vector<uint8_t>& data){
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if(!f) return false;
    f.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    f.flush();
    return static_cast<bool>(f);
}

bool write_file_atomic(const std::string& path, const std::vector<uint8_t>& data){
    std::string tmp = path + ".tmp";
    if(!write_file(tmp, data)){
        std::remove(tmp.c_str());
        return false;
    }
    if(std::rename(tmp.c_str(), path.c_str()) != 0){
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

void secure_erase(void* p, size_t n){
    if(p && n) OPENSSL_cleanse(p, n);
}

void secure_erase(std::vector<uint8_t>& v){
    secure_erase(v.data(), v.size());
    v.clear();
}

std::vector<uint8_t> random_bytes(size_t n){
    std::vector<uint8_t> out(n);
    if(n && RAND_bytes(out.data(), static_cast<int>(n)) != 1)
        throw GenerationError("RAND_bytes failed");
    return out;
}

} // namespace hyrax
