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

#include "nmsim_config.h"
#include "../libs/pybind.h"

void NMSimConfig::validate() const {
    /*
    Validate the NMSim configuration.

    Raises:
        py::value_error: If any configuration parameter is invalid.
    */

    if (completeness_rtol < 0) {
        throw py::value_error("Completeness relative tolerance must be non-negative.");
    }
    if (completeness_atol < 0) {
        throw py::value_error("Completeness absolute tolerance must be non-negative.");
    }
    if (num_trajectories <= 0) {
        throw py::value_error("Number of trajectories must be positive.");
    }
    if (num_threads <= 0) {
        throw py::value_error("Number of threads must be positive.");
    }
    if (max_step <= 0) {
        throw py::value_error("Maximum integration step must be positive.");
    }
    if (norm_steps <= 0) {
        throw py::value_error("Number of norm refinement steps must be positive.");
    }
    if (norm_t_tol <= 0) {
        throw py::value_error("Collapse time tolerance must be positive.");
    }
    if (norm_tol <= 0) {
        throw py::value_error("Collapse norm tolerance must be positive.");
    }
    if (quadrature_tol <= 0) {
        throw py::value_error("Quadrature tolerance must be positive.");
    }
    if (quadrature_max_depth <= 0) {
        throw py::value_error("Quadrature depth must be positive.");
    }
    if (state_atol <= 0) {
        throw py::value_error("Initial state tolerance must be positive.");
    }
}
