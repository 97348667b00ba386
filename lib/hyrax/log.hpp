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

// log.hpp
// stderr breadcrumbs. Debug lines are dropped unless enabled with set_debug().
// Never pass seeds, blinding factors or input bytes in here.

#pragma once
#include <string>

namespace hyrax {
namespace log {

void set_debug(bool on);
bool debug_enabled();

void dbg(const std::string& s);
void info(const std::string& s);
void warn(const std::string& s);
void error(const std::string& s);

} // namespace log
} // namespace hyrax
