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

// parallel.hpp
// Row-parallel loop used by the commitment pipeline.

#pragma once
#include <algorithm>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

namespace hyrax {

// Calls fn(r) for every r in [0, rows) on up to `threads` workers
// (0 = hardware concurrency), each on a contiguous range of rows.
// The first worker exception is rethrown after every worker has joined. If a
// worker cannot be started, the workers already running are joined and the
// std::system_error is rethrown.
template<class Fn>
void for_each_row(size_t rows, unsigned threads, Fn fn){
    if(threads == 0) threads = std::max(1u, std::thread::hardware_concurrency());
    if(size_t(threads) > rows) threads = unsigned(rows);
    if(threads <= 1){
        for(size_t r=0;r<rows;r++) fn(r);
        return;
    }

    const size_t per = (rows + threads - 1) / threads;
    std::vector<std::exception_ptr> errs(threads);
    std::vector<std::thread> pool;
    pool.reserve(threads);
    try {
        for(unsigned t=0;t<threads;t++){
            size_t begin = std::min(rows, size_t(t) * per);
            size_t end = std::min(rows, begin + per);
            pool.emplace_back([&fn, &errs, t, begin, end]{
                try {
                    for(size_t r=begin;r<end;r++) fn(r);
                } catch(...){
                    errs[t] = std::current_exception();
                }
            });
        }
    } catch(...){
        for(auto& th : pool) th.join();
        throw;
    }
    for(auto& th : pool) th.join();
    for(auto& e : errs) if(e) std::rethrow_exception(e);
}

} // namespace hyrax
