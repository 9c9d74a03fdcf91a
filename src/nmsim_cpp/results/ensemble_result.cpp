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

#include "ensemble_result.h"
#include <cmath>
#include "../libs/pybind.h"

namespace {

std::vector<double> standard_deviation(const std::vector<double>& sum, const std::vector<double>& sum2, int n) {
    std::vector<double> result(sum.size(), 0.0);
    for (size_t i = 0; i < sum.size(); ++i) {
        double avg = sum[i] / n;
        double avg2 = sum2[i] / n;
        result[i] = std::sqrt(std::abs(avg2 - avg * avg));
    }
    return result;
}

}  // namespace

void EnsembleResult::add(const TrajectoryResult& trajectory) {
    /*
    Add one trajectory to the running sums. The states are added as they are, their
    trace (the martingale) is kept.

    Args:
        trajectory (TrajectoryResult): The finished trajectory.

    Raises:
        py::value_error: If the trajectory times differ from those of the first trajectory.
        py::value_error: If the number of observables differs from that of the first trajectory.
    */
    const std::vector<double>& traj_trace = trajectory.get_trace();
    const std::vector<std::vector<double>>& traj_expect = trajectory.get_expect();
    const std::vector<DenseMatrix>& traj_states = trajectory.get_states();

    if (num_trajectories == 0) {
        times = trajectory.get_times();
        sum_trace.assign(times.size(), 0.0);
        sum2_trace.assign(times.size(), 0.0);
        sum_expect.assign(traj_expect.size(), std::vector<double>(times.size(), 0.0));
        sum2_expect.assign(traj_expect.size(), std::vector<double>(times.size(), 0.0));
        sum_final_state = DenseMatrix::Zero(trajectory.get_final_state().rows(), trajectory.get_final_state().cols());
        for (const auto& state : traj_states) {
            sum_states.push_back(DenseMatrix::Zero(state.rows(), state.cols()));
        }
    }

    // Sanity checks
    if (trajectory.get_times() != times || traj_trace.size() != times.size()) {
        throw py::value_error("Trajectory times do not match the times of the ensemble.");
    }
    if (traj_expect.size() != sum_expect.size()) {
        throw py::value_error("Trajectory observables do not match the observables of the ensemble.");
    }
    if (traj_states.size() != sum_states.size()) {
        throw py::value_error("Trajectory stored states do not match the states of the ensemble.");
    }

    for (size_t k = 0; k < times.size(); ++k) {
        sum_trace[k] += traj_trace[k];
        sum2_trace[k] += traj_trace[k] * traj_trace[k];
    }
    for (size_t i = 0; i < traj_expect.size(); ++i) {
        for (size_t k = 0; k < times.size(); ++k) {
            sum_expect[i][k] += traj_expect[i][k];
            sum2_expect[i][k] += traj_expect[i][k] * traj_expect[i][k];
        }
    }
    for (size_t k = 0; k < traj_states.size(); ++k) {
        sum_states[k] += traj_states[k];
    }
    sum_final_state += trajectory.get_final_state();

    seeds.push_back(trajectory.get_seed());
    collapses.push_back(trajectory.get_collapses());
    if (keep_runs_results) {
        runs_trace.push_back(traj_trace);
        runs_expect.push_back(traj_expect);
        runs_states.push_back(traj_states);
    }
    num_trajectories++;
}

std::vector<DenseMatrix> EnsembleResult::average_states() const {
    /*
    Returns:
        std::vector<DenseMatrix>: The average weighted density matrix at every time, empty if states were not stored.
    */
    std::vector<DenseMatrix> result;
    for (const auto& state : sum_states) {
        result.push_back(state / double(num_trajectories));
    }
    return result;
}

DenseMatrix EnsembleResult::average_final_state() const {
    if (num_trajectories == 0) {
        return DenseMatrix();
    }
    return sum_final_state / double(num_trajectories);
}

std::vector<double> EnsembleResult::average_trace() const {
    /*
    Returns:
        std::vector<double>: The average martingale at every time. Converges to 1 for a trace-preserving master equation.
    */
    std::vector<double> result(sum_trace.size(), 0.0);
    for (size_t k = 0; k < sum_trace.size(); ++k) {
        result[k] = sum_trace[k] / num_trajectories;
    }
    return result;
}

std::vector<double> EnsembleResult::std_trace() const {
    return standard_deviation(sum_trace, sum2_trace, num_trajectories);
}

std::vector<std::vector<double>> EnsembleResult::average_expect() const {
    /*
    Returns:
        std::vector<std::vector<double>>: For every observable, its average weighted expectation value at every time.
    */
    std::vector<std::vector<double>> result;
    for (const auto& sums : sum_expect) {
        std::vector<double> averages(sums.size(), 0.0);
        for (size_t k = 0; k < sums.size(); ++k) {
            averages[k] = sums[k] / num_trajectories;
        }
        result.push_back(averages);
    }
    return result;
}

std::vector<std::vector<double>> EnsembleResult::std_expect() const {
    std::vector<std::vector<double>> result;
    for (size_t i = 0; i < sum_expect.size(); ++i) {
        result.push_back(standard_deviation(sum_expect[i], sum2_expect[i], num_trajectories));
    }
    return result;
}
