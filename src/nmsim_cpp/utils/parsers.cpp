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

#include "parsers.h"
#include <string>
#include "numpy.h"

NMSimConfig parse_solver_params(const py::dict& solver_params) {
    /*
    Extract NMSimConfig parameters from a Python dictionary. Missing keys keep their defaults.

    Args:
        solver_params (py::dict): The dictionary of solver parameters.

    Returns:
        NMSimConfig: The populated configuration object.

    Raises:
        py::value_error: If the resulting configuration is invalid.
    */
    NMSimConfig config;
    if (solver_params.contains("completeness_rtol")) {
        config.set_completeness_rtol(solver_params["completeness_rtol"].cast<double>());
    }
    if (solver_params.contains("completeness_atol")) {
        config.set_completeness_atol(solver_params["completeness_atol"].cast<double>());
    }
    if (solver_params.contains("state_atol")) {
        config.set_state_atol(solver_params["state_atol"].cast<double>());
    }
    if (solver_params.contains("num_trajectories")) {
        config.set_num_trajectories(solver_params["num_trajectories"].cast<int>());
    }
    if (solver_params.contains("num_threads")) {
        config.set_num_threads(solver_params["num_threads"].cast<int>());
    }
    if (solver_params.contains("seed")) {
        config.set_seed(solver_params["seed"].cast<int>());
    }
    if (solver_params.contains("max_step")) {
        config.set_max_step(solver_params["max_step"].cast<double>());
    }
    if (solver_params.contains("norm_steps")) {
        config.set_norm_steps(solver_params["norm_steps"].cast<int>());
    }
    if (solver_params.contains("norm_t_tol")) {
        config.set_norm_t_tol(solver_params["norm_t_tol"].cast<double>());
    }
    if (solver_params.contains("norm_tol")) {
        config.set_norm_tol(solver_params["norm_tol"].cast<double>());
    }
    if (solver_params.contains("quadrature_tol")) {
        config.set_quadrature_tol(solver_params["quadrature_tol"].cast<double>());
    }
    if (solver_params.contains("quadrature_max_depth")) {
        config.set_quadrature_max_depth(solver_params["quadrature_max_depth"].cast<int>());
    }
    if (solver_params.contains("store_intermediate_results")) {
        config.set_store_intermediate_results(solver_params["store_intermediate_results"].cast<bool>());
    }
    if (solver_params.contains("keep_runs_results")) {
        config.set_keep_runs_results(solver_params["keep_runs_results"].cast<bool>());
    }
    if (solver_params.contains("verbose")) {
        config.set_verbose(solver_params["verbose"].cast<bool>());
    }
    if (config.get_num_threads() <= 0) {
        config.set_num_threads(1);
    }
    config.validate();
    return config;
}

RateFunction parse_rate(const py::object& rate) {
    /*
    Turn a Python rate into a RateFunction.

    Args:
        rate (py::object): A callable taking the time and returning a float, or a constant float.

    Returns:
        RateFunction: The rate. Calls into Python take the GIL, so it can be evaluated from any thread.
    */
    if (PyCallable_Check(rate.ptr())) {
        py::function func = py::reinterpret_borrow<py::function>(rate);
        return [func](double t) {
            py::gil_scoped_acquire acquire;
            return func(t).cast<double>();
        };
    }
    double value = rate.cast<double>();
    return [value](double) { return value; };
}

std::vector<TimeDependentOperator> parse_hamiltonian(const py::object& hamiltonian) {
    /*
    Extract the Hamiltonian terms.

    Args:
        hamiltonian (py::object): None, a single 2D array (constant Hamiltonian), or a list whose
            items are either 2D arrays or (array, coefficient) pairs, the coefficient being a
            callable or a float.

    Returns:
        std::vector<TimeDependentOperator>: The Hamiltonian terms, an empty coefficient meaning constant.
    */
    std::vector<TimeDependentOperator> terms;
    if (hamiltonian.is_none()) {
        return terms;
    }
    if (py::isinstance<py::array>(hamiltonian)) {
        TimeDependentOperator term;
        term.op = from_numpy(hamiltonian, sparse_atol);
        terms.push_back(term);
        return terms;
    }
    for (auto item : hamiltonian) {
        TimeDependentOperator term;
        if (py::isinstance<py::tuple>(item) || py::isinstance<py::list>(item)) {
            py::sequence pair = py::reinterpret_borrow<py::sequence>(item);
            if (pair.size() != 2) {
                throw py::value_error("Hamiltonian terms must be arrays or (array, coefficient) pairs.");
            }
            term.op = from_numpy(pair[0], sparse_atol);
            term.coefficient = parse_rate(pair[1]);
        } else {
            term.op = from_numpy(py::reinterpret_borrow<py::object>(item), sparse_atol);
        }
        terms.push_back(term);
    }
    return terms;
}

std::vector<OperatorRatePair> parse_ops_and_rates(const py::object& ops_and_rates) {
    /*
    Extract the jump operators and their rates.

    Args:
        ops_and_rates (py::object): A list of (array, rate) pairs, the rate being a callable or a float.

    Returns:
        std::vector<OperatorRatePair>: The operators and rates, in the given order.

    Raises:
        py::value_error: If an item is not a pair.
    */
    std::vector<OperatorRatePair> pairs;
    int index = 0;
    for (auto item : ops_and_rates) {
        py::sequence pair = py::reinterpret_borrow<py::sequence>(item);
        if (pair.size() != 2) {
            throw py::value_error("Item " + std::to_string(index) + " of ops_and_rates is not an (operator, rate) pair.");
        }
        OperatorRatePair op_rate;
        op_rate.op = from_numpy(pair[0], sparse_atol);
        op_rate.rate = parse_rate(pair[1]);
        pairs.push_back(op_rate);
        index++;
    }
    return pairs;
}

std::vector<SparseMatrix> parse_observables(const py::object& observables) {
    /*
    Extract observable matrices.

    Args:
        observables (py::object): None or a list of 2D arrays.

    Returns:
        std::vector<SparseMatrix>: The observables.
    */
    std::vector<SparseMatrix> observable_matrices;
    if (observables.is_none()) {
        return observable_matrices;
    }
    for (auto obs : observables) {
        observable_matrices.push_back(from_numpy(py::reinterpret_borrow<py::object>(obs), sparse_atol));
    }
    return observable_matrices;
}

std::vector<double> parse_times(const py::object& times) {
    /*
    Extract the output times.

    Args:
        times (py::object): A list or 1D array of times.

    Returns:
        std::vector<double>: The times.
    */
    std::vector<double> time_list;
    for (auto t : times) {
        time_list.push_back(t.cast<double>());
    }
    return time_list;
}

DenseMatrix parse_initial_state(const py::object& initial_state) {
    /*
    Extract the initial state.

    Args:
        initial_state (py::object): A 1D or column ket, a row bra or a 2D density matrix.

    Returns:
        DenseMatrix: The state, a 1D input becomes a column.
    */
    return dense_from_numpy(initial_state);
}
