// Copyright 2025 Qilimanjaro Quantum Tech
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
#pragma once

#include <cstdint>
#include <random>
#include <vector>
#include "../libs/eigen.h"

int choose_index(const std::vector<double>& weights, double random_value);
DenseVector sample_pure_state(const DenseMatrix& rho, std::mt19937_64& generator, double atol);
std::vector<std::uint64_t> make_trajectory_seeds(int seed, int n_trajectories);
