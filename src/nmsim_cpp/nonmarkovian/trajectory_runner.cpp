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

#include "trajectory_runner.h"
#include <stdexcept>
#include "../libs/pybind.h"
#include "../utils/matrix_utils.h"

void TrajectoryRunner::start(const DenseMatrix& state, double t0, std::uint64_t seed) {
    /*
    Start a new trajectory at time t0. The martingale cache is reset to {t0: 1}.

    Args:
        state (DenseMatrix): The initial state vector or density matrix.
        t0 (double): The start time.
        seed (std::uint64_t): Seed of the trajectory's random generator.
    */
    tracker.reset(t0);
    integrator.set_state(t0, state, seed);
}

void TrajectoryRunner::precompute(const std::vector<double>& times) {
    /*
    Fill the continuous martingale at every time, in order, before any step.

    Args:
        times (std::vector<double>): Increasing times, the first not earlier than the start time.

    Raises:
        std::runtime_error: If the trajectory was not started.
    */
    tracker.precompute(times);
}

DenseMatrix TrajectoryRunner::step(double t) {
    /*
    Advance the trajectory to time t.

    Args:
        t (double): The target time.

    Returns:
        DenseMatrix: The density matrix at t multiplied by mu(t), its trace is mu(t).

    Raises:
        std::runtime_error: If the trajectory was not started.
        py::value_error: If t is earlier than the current time.
    */
    if (!tracker.is_initialized()) {
        throw std::runtime_error("The `start` method must be called first.");
    }
    DenseMatrix state = integrator.integrate(t);
    DenseMatrix rho = to_density_matrix(state);
    return rho * current_martingale();
}

double TrajectoryRunner::current_martingale() {
    return tracker.current_martingale(integrator.get_current_time(), integrator.get_collapses());
}

std::pair<std::uint64_t, TrajectoryResult> TrajectoryRunner::run_one_trajectory(std::uint64_t seed, const DenseMatrix& state, const std::vector<double>& times, const std::vector<SparseMatrix>& observables) {
    /*
    Run a full trajectory over the given times.

    Args:
        seed (std::uint64_t): Seed of the trajectory's random generator.
        state (DenseMatrix): The initial state vector or density matrix.
        times (std::vector<double>): Increasing output times, the first is the start time.
        observables (std::vector<SparseMatrix>): Observables evaluated on the weighted states.

    Returns:
        std::pair<std::uint64_t, TrajectoryResult>: The seed and the weighted trajectory.

    Raises:
        py::value_error: If no times are given.
    */
    if (times.empty()) {
        throw py::value_error("At least one time must be given.");
    }

    TrajectoryResult result(seed, store_states, observables.size());
    start(state, times[0], seed);
    precompute(times);

    // At the start time the state is normalized and mu = 1
    DenseMatrix rho_0 = to_density_matrix(integrator.integrate(times[0]));
    result.add(times[0], rho_0, 1.0, observables);

    for (size_t k = 1; k < times.size(); ++k) {
        DenseMatrix rho = to_density_matrix(integrator.integrate(times[k]));
        double mu = current_martingale();
        result.add(times[k], rho * mu, mu, observables);
    }

    result.set_collapses(integrator.get_collapses());
    return std::make_pair(seed, result);
}
