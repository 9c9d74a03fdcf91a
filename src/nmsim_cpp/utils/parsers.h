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

#include <vector>
#include "../config/nmsim_config.h"
#include "../libs/eigen.h"
#include "../libs/pybind.h"
#include "../monte_carlo/jump_integrator.h"
#include "../nonmarkovian/operator_rate_pair.h"

// Entries of input matrices below this are treated as zero
const double sparse_atol = 1e-14;

NMSimConfig parse_solver_params(const py::dict& solver_params);
RateFunction parse_rate(const py::object& rate);
std::vector<TimeDependentOperator> parse_hamiltonian(const py::object& hamiltonian);
std::vector<OperatorRatePair> parse_ops_and_rates(const py::object& ops_and_rates);
std::vector<SparseMatrix> parse_observables(const py::object& observables);
std::vector<double> parse_times(const py::object& times);
DenseMatrix parse_initial_state(const py::object& initial_state);
