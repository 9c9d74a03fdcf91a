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

#include "nm_mc_solver.h"
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include "../libs/pybind.h"
#include "../utils/random.h"
#include "paired_operators.h"
#include "rate_shift.h"

#if defined(_OPENMP)
#include <omp.h>
#endif

NonMarkovianMcSolver::NonMarkovianMcSolver(const std::vector<TimeDependentOperator>& hamiltonian_, const std::vector<OperatorRatePair>& ops_and_rates_, const NMSimConfig& config_)
    : config(config_), hamiltonian(hamiltonian_), ops_and_rates(ops_and_rates_) {
    /*
    Set up the solver: complete the operator set and build the shifted collapse operators.

    Args:
        hamiltonian_ (std::vector<TimeDependentOperator>): The Hamiltonian terms, H(t) = sum_k h_k(t) H_k.
        ops_and_rates_ (std::vector<OperatorRatePair>): The jump operators and their (possibly negative) rates.
        config_ (NMSimConfig): The solver configuration.

    Raises:
        py::value_error: If the configuration is invalid.
        py::value_error: If no jump operators are given, or shapes do not match.
    */
    config.validate();
    completeness = check_completeness(ops_and_rates, config);
    for (const auto& term : hamiltonian) {
        if (term.op.rows() != ops_and_rates[0].op.rows() || term.op.cols() != ops_and_rates[0].op.cols()) {
            throw py::value_error("Hamiltonian dimension does not match the jump operators.");
        }
    }

    // The extra operator only completes the identity, it never causes a physical jump
    if (completeness.has_extra_operator) {
        ops_and_rates.push_back(OperatorRatePair{completeness.extra_operator, [](double) { return 0.0; }});
    }
    paired_operators = build_paired_operators(ops_and_rates);

    if (config.get_verbose()) {
        std::cout << "NonMarkovianMcSolver: a = " << completeness.a << ", " << ops_and_rates.size() << " jump operators"
                  << (completeness.has_extra_operator ? " (including completion operator)" : "") << (completeness.is_hermitian ? "" : ", sum of L^dagger L is not Hermitian")
                  << std::endl;
    }
}

double NonMarkovianMcSolver::rate_shift(double t) const {
    return ::rate_shift(t, ops_and_rates);
}

void NonMarkovianMcSolver::start(const DenseMatrix& state, double t0, std::uint64_t seed) {
    /*
    Start a single trajectory, to be advanced with step. Any previous trajectory is discarded.

    Args:
        state (DenseMatrix): The initial state vector or density matrix.
        t0 (double): The start time.
        seed (std::uint64_t): Seed of the trajectory's random generator.
    */
    runner.reset();
    integrator = std::make_unique<McJumpIntegrator>(hamiltonian, paired_operators, config);
    runner = std::make_unique<TrajectoryRunner>(*integrator, ops_and_rates, completeness.a, config);
    runner->start(state, t0, seed);
}

DenseMatrix NonMarkovianMcSolver::step(double t) {
    /*
    Advance the current trajectory to time t.

    Args:
        t (double): The target time.

    Returns:
        DenseMatrix: The density matrix at t weighted by the martingale. Its trace is the martingale.

    Raises:
        std::runtime_error: If start was not called.
        py::value_error: If t is earlier than the current time.
    */
    if (!runner) {
        throw std::runtime_error("The `start` method must be called first.");
    }
    return runner->step(t);
}

double NonMarkovianMcSolver::current_martingale() {
    if (!runner) {
        throw std::runtime_error("The `start` method must be called first.");
    }
    return runner->current_martingale();
}

EnsembleResult NonMarkovianMcSolver::run(const DenseMatrix& state, const std::vector<double>& times, const std::vector<SparseMatrix>& observables) {
    /*
    Run num_trajectories weighted trajectories and average them.

    Args:
        state (DenseMatrix): The initial state vector or density matrix.
        times (std::vector<double>): Strictly increasing output times, the first is the start time.
        observables (std::vector<SparseMatrix>): Observables evaluated on the weighted states.

    Returns:
        EnsembleResult: The ensemble, not renormalized.

    Raises:
        py::value_error: If times is empty or not strictly increasing.
        py::value_error: If an observable does not match the system dimension.
    */

    // Sanity checks
    if (times.empty()) {
        throw py::value_error("At least one time must be provided.");
    }
    for (size_t k = 1; k < times.size(); ++k) {
        if (times[k] <= times[k - 1]) {
            throw py::value_error("Times must be strictly increasing.");
        }
    }
    long dim = long(ops_and_rates[0].op.rows());
    for (size_t i = 0; i < observables.size(); ++i) {
        if (observables[i].rows() != dim || observables[i].cols() != dim) {
            throw py::value_error("Observable " + std::to_string(i) + " does not match the system dimension.");
        }
    }

    int n_trajectories = config.get_num_trajectories();
    std::vector<std::uint64_t> seeds = make_trajectory_seeds(config.get_seed(), n_trajectories);
    std::vector<TrajectoryResult> trajectories(n_trajectories);

    if (config.get_verbose()) {
        std::cout << "NonMarkovianMcSolver: running " << n_trajectories << " trajectories on " << config.get_num_threads() << " threads" << std::endl;
    }

    // Each trajectory writes only its own slot, the first error is rethrown afterwards
    std::exception_ptr error = nullptr;
#if defined(_OPENMP)
    Eigen::setNbThreads(1);
    omp_set_num_threads(config.get_num_threads());
#pragma omp parallel for schedule(static)
#endif
    for (int i = 0; i < n_trajectories; ++i) {
        // Once a trajectory has failed the remaining ones are skipped
        bool failed = false;
#if defined(_OPENMP)
#pragma omp critical
#endif
        {
            failed = bool(error);
        }
        if (failed) {
            continue;
        }

        try {
            McJumpIntegrator trajectory_integrator(hamiltonian, paired_operators, config);
            TrajectoryRunner trajectory_runner(trajectory_integrator, ops_and_rates, completeness.a, config);
            trajectories[i] = trajectory_runner.run_one_trajectory(seeds[i], state, times, observables).second;
        } catch (...) {
#if defined(_OPENMP)
#pragma omp critical
#endif
            {
                if (!error) {
                    error = std::current_exception();
                }
            }
        }
    }
#if defined(_OPENMP)
    Eigen::setNbThreads(config.get_num_threads());
#endif
    if (error) {
        std::rethrow_exception(error);
    }

    // Aggregate in trajectory order
    EnsembleResult result(config.get_keep_runs_results());
    for (int i = 0; i < n_trajectories; ++i) {
        result.add(trajectories[i]);
    }
    return result;
}
