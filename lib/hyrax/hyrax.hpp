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

// hyrax.hpp
// Everything a caller needs. Link flags: -lmcl -lcrypto

#pragma once
#include "hyrax/blinding.hpp"
#include "hyrax/commitment.hpp"
#include "hyrax/config.hpp"
#include "hyrax/curve.hpp"
#include "hyrax/errors.hpp"
#include "hyrax/generators.hpp"
#include "hyrax/log.hpp"
#include "hyrax/matrix.hpp"
#include "hyrax/parallel.hpp"
#include "hyrax/params.hpp"
#include "hyrax/pedersen.hpp"
#include "hyrax/util.hpp"
