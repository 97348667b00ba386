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

#include "hyrax/parallel.hpp"

#include <gtest/gtest.h>

#include <sys/resource.h>
#include <unistd.h>

#include <atomic>
#include <stdexcept>
#include <system_error>

using namespace hyrax;

TEST(Parallel, VisitsEveryRowOnce){
    std::vector<std::atomic<int>> hits(1000);
    for_each_row(hits.size(), 7, [&](size_t r){ hits[r]++; });
    for(size_t r=0;r<hits.size();r++) EXPECT_EQ(hits[r].load(), 1) << r;
}

TEST(Parallel, MoreThreadsThanRows){
    std::atomic<size_t> visited{0};
    for_each_row(3, 64, [&](size_t){ visited++; });
    EXPECT_EQ(visited.load(), 3u);

    for_each_row(0, 8, [&](size_t){ visited++; });
    EXPECT_EQ(visited.load(), 3u);
}

TEST(Parallel, WorkerExceptionReachesCaller){
    std::atomic<size_t> visited{0};
    EXPECT_THROW(for_each_row(100, 4, [&](size_t r){
        visited++;
        if(r == 60) throw std::runtime_error("row 60");
    }), std::runtime_error);
    // the other workers ran to completion before the rethrow
    EXPECT_GE(visited.load(), 75u);
}

// Thread creation fails once the address space is capped; the failure has to
// come back as an exception instead of std::terminate.
TEST(ParallelDeathTest, SpawnFailureIsRethrown){
    EXPECT_EXIT({
        struct rlimit lim;
        lim.rlim_cur = lim.rlim_max = rlim_t(400) << 20;
        if(setrlimit(RLIMIT_AS, &lim) != 0) _exit(3);
        std::atomic<size_t> visited{0};
        try {
            for_each_row(100000, 4096, [&](size_t){ visited++; });
        } catch(const std::system_error&){
            _exit(0);
        }
        _exit(visited.load() == 100000 ? 0 : 1);
    }, ::testing::ExitedWithCode(0), "");
}
