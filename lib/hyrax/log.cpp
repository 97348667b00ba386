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

#include "hyrax/log.hpp"

#include <atomic>
#include <cstdio>

namespace hyrax {
namespace log {

static std::atomic<bool> g_debug{false};

void set_debug(bool on){ g_debug.store(on, std::memory_order_relaxed); }
bool debug_enabled(){ return g_debug.load(std::memory_order_relaxed); }

// one fprintf per line so worker threads do not interleave mid-line
void dbg(const std::string& s){ if(debug_enabled()) fprintf(stderr, "[DBG] %s\n", s.c_str()); }
void info(const std::string& s){ fprintf(stderr, "[INFO] %s\n", s.c_str()); }
void warn(const std::string& s){ fprintf(stderr, "[WARN] %s\n", s.c_str()); }
void error(const std::string& s){ fprintf(stderr, "[ERROR] %s\n", s.c_str()); }

} // namespace log
} // namespace hyrax
