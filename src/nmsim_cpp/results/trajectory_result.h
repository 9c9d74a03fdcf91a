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
#include <vector>
#include "../libs/eigen.h"
#include "../monte_carlo/jump_integrator.h"

// The record of one weighted trajectory. States are stored as reported, with
// trace equal to the martingale; they are never renormalized.
class TrajectoryResult {
   private:
    std::uint64_t seed = 0;
    bool store_states = true;
    std::vector<double> times;
    std::vector<DenseMatrix> states;
    DenseMatrix final_state;
    std::vector<double> trace;
    std::vector<std::vector<double>> expect;
    std::vector<CollapseEvent> collapses;

   public:
    TrajectoryResult() = default;
    TrajectoryResult(std::uint64_t seed_, bool store_states_, size_t num_observables) : seed(seed_), store_states(store_states_), expect(num_observables) {}

    // trajectory_result.cpp
    void add(double t, const DenseMatrix& weighted_state, double trace_weight, const std::vector<SparseMatrix>& observables);
    void set_collapses(const std::vector<CollapseEvent>& collapses_);

    std::uint64_t get_seed() const { return seed; }
    const std::vector<double>& get_times() const { return times; }
    const std::vector<DenseMatrix>& get_states() const { return states; }
    const DenseMatrix& get_final_state() const { return final_state; }
    const std::vector<double>& get_trace() const { return trace; }
    const std::vector<std::vector<double>>& get_expect() const { return expect; }
    const std::vector<CollapseEvent>& get_collapses() const { return collapses; }
};
