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

#include "../nmsim.h"
#include <vector>
#include "../config/nmsim_config.h"
#include "../nonmarkovian/nm_mc_solver.h"
#include "../results/ensemble_result.h"
#include "../utils/numpy.h"
#include "../utils/parsers.h"

py::dict NMSimCpp::execute_time_evolution(const py::object& hamiltonian,
                                          const py::object& ops_and_rates,
                                          const py::object& initial_state,
                                          const py::object& times,
                                          const py::object& observables,
                                          const py::dict& solver_params) {
    /*
    Run the non-Markovian Monte-Carlo solver.
    Note that this is just the wrapper mapping the Python objects to C++ objects.

    Args:
        hamiltonian (py::object): None, a 2D array, or a list of arrays / (array, coefficient) pairs.
        ops_and_rates (py::object): A list of (jump operator, rate) pairs, rates being callables or floats.
        initial_state (py::object): A ket or a density matrix.
        times (py::object): Strictly increasing output times, the first is the start time.
        observables (py::object): None or a list of observables.
        solver_params (py::dict): Solver parameters, see NMSimConfig.

    Returns:
        py::dict: The averaged results. The states are not renormalized; their trace is the
            average martingale, which is also returned as "average_trace".

    Raises:
        py::value_error: If no jump operators or no times are provided.
    */

    // Get parameters
    NMSimConfig config = parse_solver_params(solver_params);

    // Convert to C++ objects
    std::vector<TimeDependentOperator> hamiltonian_terms = parse_hamiltonian(hamiltonian);
    std::vector<OperatorRatePair> ops_and_rates_cpp = parse_ops_and_rates(ops_and_rates);
    DenseMatrix initial_state_cpp = parse_initial_state(initial_state);
    std::vector<double> time_list = parse_times(times);
    std::vector<SparseMatrix> observable_matrices = parse_observables(observables);

    // Sanity checks
    if (ops_and_rates_cpp.size() == 0) {
        throw py::value_error("At least one jump operator must be provided.");
    }
    if (time_list.size() == 0) {
        throw py::value_error("At least one time must be provided.");
    }

    // Rate callables take the GIL themselves
    NonMarkovianMcSolver solver(hamiltonian_terms, ops_and_rates_cpp, config);
    EnsembleResult result(config.get_keep_runs_results());
    {
        py::gil_scoped_release release;
        result = solver.run(initial_state_cpp, time_list, observable_matrices);
    }

    // Convert to Python objects
    py::dict output;
    output["times"] = to_numpy(result.get_times());
    output["a_parameter"] = solver.get_a_parameter();
    output["num_trajectories"] = result.get_num_trajectories();
    output["average_trace"] = to_numpy(result.average_trace());
    output["std_trace"] = to_numpy(result.std_trace());
    output["expectation_values"] = to_numpy(result.average_expect());
    output["std_expectation_values"] = to_numpy(result.std_expect());
    output["final_state"] = to_numpy(result.average_final_state());
    if (config.get_store_intermediate_results()) {
        py::list intermediate_states;
        for (const auto& state : result.average_states()) {
            intermediate_states.append(to_numpy(state));
        }
        output["intermediate_states"] = intermediate_states;
    }

    py::list collapses;
    for (const auto& trajectory_collapses : result.get_collapses()) {
        py::list events;
        for (const auto& collapse : trajectory_collapses) {
            events.append(py::make_tuple(collapse.time, collapse.index));
        }
        collapses.append(events);
    }
    output["collapses"] = collapses;

    py::list seeds;
    for (auto seed : result.get_seeds()) {
        seeds.append(seed);
    }
    output["seeds"] = seeds;

    if (config.get_keep_runs_results()) {
        py::list runs_trace;
        py::list runs_expect;
        for (const auto& run_trace : result.get_runs_trace()) {
            runs_trace.append(to_numpy(run_trace));
        }
        for (const auto& run_expect : result.get_runs_expect()) {
            runs_expect.append(to_numpy(run_expect));
        }
        output["runs_trace"] = runs_trace;
        output["runs_expectation_values"] = runs_expect;
    }

    return output;
}
