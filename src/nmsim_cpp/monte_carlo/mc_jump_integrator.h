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
#include "../config/nmsim_config.h"
#include "../libs/eigen.h"
#include "jump_integrator.h"

// Waiting-time quantum-jump unravelling with time-dependent collapse operators.
// Between jumps the unnormalized state follows H_eff = H - i/2 sum c_i^dagger c_i;
// a jump happens once its squared norm falls below a uniform random target.
class McJumpIntegrator : public JumpIntegrator {
   private:
    const std::vector<TimeDependentOperator>& hamiltonian;
    const std::vector<TimeDependentOperator>& collapse_operators;
    std::vector<SparseMatrix> collapse_products;
    long dim;

    double max_step;
    int norm_steps;
    double norm_t_tol;
    double norm_tol;
    double state_atol;

    double t_current = 0.0;
    DenseVector psi;
    double target_norm = 0.0;
    std::vector<CollapseEvent> collapses;
    std::mt19937_64 generator;
    std::uniform_real_distribution<double> distribution;

    // mc_jump_integrator.cpp
    SparseMatrix effective_hamiltonian(double t) const;
    DenseVector rk4_step(const DenseVector& psi_0, double t, double dt) const;
    double find_collapse_time(double t_next, const DenseVector& psi_next, DenseVector& psi_collapse) const;
    void apply_collapse(double t, const DenseVector& psi_collapse);

   public:
    McJumpIntegrator(const std::vector<TimeDependentOperator>& hamiltonian_, const std::vector<TimeDependentOperator>& collapse_operators_, const NMSimConfig& config);

    // mc_jump_integrator.cpp
    void set_state(double t, const DenseMatrix& state, std::uint64_t seed);
    DenseMatrix integrate(double t);
    const std::vector<CollapseEvent>& get_collapses() const;
    double get_current_time() const;
};
