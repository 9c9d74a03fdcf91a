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
#include <memory>
#include <vector>
#include "../config/nmsim_config.h"
#include "../libs/eigen.h"
#include "../monte_carlo/jump_integrator.h"
#include "../monte_carlo/mc_jump_integrator.h"
#include "../results/ensemble_result.h"
#include "completeness.h"
#include "operator_rate_pair.h"
#include "trajectory_runner.h"

// Monte-Carlo solver for master equations with possibly negative rates.
//
// The operator set is completed once at construction so that sum L^dagger L = a I,
// the jump engine runs with the shifted rates Gamma_i + sigma >= 0, and every
// trajectory is weighted by its martingale. The integrators and trackers keep
// references into this object, so it can be neither copied nor moved.
class NonMarkovianMcSolver {
   private:
    NMSimConfig config;
    std::vector<TimeDependentOperator> hamiltonian;
    std::vector<OperatorRatePair> ops_and_rates;
    CompletenessResult completeness;
    std::vector<TimeDependentOperator> paired_operators;

    // Single trajectory state, created by start
    std::unique_ptr<McJumpIntegrator> integrator;
    std::unique_ptr<TrajectoryRunner> runner;

   public:
    NonMarkovianMcSolver(const std::vector<TimeDependentOperator>& hamiltonian_, const std::vector<OperatorRatePair>& ops_and_rates_, const NMSimConfig& config_);
    NonMarkovianMcSolver(const NonMarkovianMcSolver&) = delete;
    NonMarkovianMcSolver& operator=(const NonMarkovianMcSolver&) = delete;

    // Getters
    double get_a_parameter() const { return completeness.a; }
    const std::vector<OperatorRatePair>& get_ops_and_rates() const { return ops_and_rates; }
    bool has_extra_operator() const { return completeness.has_extra_operator; }
    const SparseMatrix& get_extra_operator() const { return completeness.extra_operator; }
    const std::vector<TimeDependentOperator>& get_paired_operators() const { return paired_operators; }

    // nm_mc_solver.cpp
    double rate_shift(double t) const;
    void start(const DenseMatrix& state, double t0, std::uint64_t seed);
    DenseMatrix step(double t);
    double current_martingale();
    EnsembleResult run(const DenseMatrix& state, const std::vector<double>& times, const std::vector<SparseMatrix>& observables);
};
