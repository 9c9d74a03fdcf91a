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
#include "trajectory_result.h"

// Accumulates weighted trajectories. Nothing is renormalized: the average trace
// is the average martingale and is part of the physical result.
class EnsembleResult {
   private:
    bool keep_runs_results;
    int num_trajectories = 0;
    std::vector<double> times;

    std::vector<DenseMatrix> sum_states;
    DenseMatrix sum_final_state;
    std::vector<double> sum_trace;
    std::vector<double> sum2_trace;
    std::vector<std::vector<double>> sum_expect;
    std::vector<std::vector<double>> sum2_expect;

    std::vector<std::uint64_t> seeds;
    std::vector<std::vector<CollapseEvent>> collapses;
    std::vector<std::vector<double>> runs_trace;
    std::vector<std::vector<std::vector<double>>> runs_expect;
    std::vector<std::vector<DenseMatrix>> runs_states;

   public:
    EnsembleResult(bool keep_runs_results_) : keep_runs_results(keep_runs_results_) {}

    // ensemble_result.cpp
    void add(const TrajectoryResult& trajectory);
    std::vector<DenseMatrix> average_states() const;
    DenseMatrix average_final_state() const;
    std::vector<double> average_trace() const;
    std::vector<double> std_trace() const;
    std::vector<std::vector<double>> average_expect() const;
    std::vector<std::vector<double>> std_expect() const;

    int get_num_trajectories() const { return num_trajectories; }
    const std::vector<double>& get_times() const { return times; }
    const std::vector<std::uint64_t>& get_seeds() const { return seeds; }
    const std::vector<std::vector<CollapseEvent>>& get_collapses() const { return collapses; }
    const std::vector<std::vector<double>>& get_runs_trace() const { return runs_trace; }
    const std::vector<std::vector<std::vector<double>>>& get_runs_expect() const { return runs_expect; }
    const std::vector<std::vector<DenseMatrix>>& get_runs_states() const { return runs_states; }
};
