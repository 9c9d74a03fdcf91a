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
#include <utility>
#include <vector>
#include "../config/nmsim_config.h"
#include "../libs/eigen.h"
#include "../monte_carlo/jump_integrator.h"
#include "../results/trajectory_result.h"
#include "martingale.h"
#include "operator_rate_pair.h"

// Drives one trajectory of a jump integrator and weights its states by the martingale.
// The integrator runs the shifted (non-negative) jump process; the reported density
// matrices have trace mu(t) and must not be renormalized.
class TrajectoryRunner {
   private:
    JumpIntegrator& integrator;
    MartingaleTracker tracker;
    bool store_states;

   public:
    TrajectoryRunner(JumpIntegrator& integrator_, const std::vector<OperatorRatePair>& ops_and_rates, double a_parameter, const NMSimConfig& config)
        : integrator(integrator_), tracker(ops_and_rates, a_parameter, config), store_states(config.get_store_intermediate_results()) {}

    // trajectory_runner.cpp
    void start(const DenseMatrix& state, double t0, std::uint64_t seed);
    void precompute(const std::vector<double>& times);
    DenseMatrix step(double t);
    double current_martingale();
    std::pair<std::uint64_t, TrajectoryResult> run_one_trajectory(std::uint64_t seed, const DenseMatrix& state, const std::vector<double>& times, const std::vector<SparseMatrix>& observables);

    const MartingaleTracker& get_tracker() const { return tracker; }
};
