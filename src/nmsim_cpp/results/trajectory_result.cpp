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

#include "trajectory_result.h"
#include "../libs/pybind.h"
#include "../utils/matrix_utils.h"

void TrajectoryResult::add(double t, const DenseMatrix& weighted_state, double trace_weight, const std::vector<SparseMatrix>& observables) {
    /*
    Record the trajectory at one time.

    Args:
        t (double): The time.
        weighted_state (DenseMatrix): The density matrix multiplied by the martingale.
        trace_weight (double): The martingale, i.e. the trace of weighted_state.
        observables (std::vector<SparseMatrix>): Observables to evaluate on weighted_state.

    Raises:
        py::value_error: If the number of observables changes between calls.
    */
    if (observables.size() != expect.size()) {
        throw py::value_error("Number of observables does not match the trajectory result.");
    }
    times.push_back(t);
    trace.push_back(trace_weight);
    for (size_t i = 0; i < observables.size(); ++i) {
        expect[i].push_back(expectation_value(observables[i], weighted_state));
    }
    if (store_states) {
        states.push_back(weighted_state);
    }
    final_state = weighted_state;
}

void TrajectoryResult::set_collapses(const std::vector<CollapseEvent>& collapses_) {
    collapses = collapses_;
}
