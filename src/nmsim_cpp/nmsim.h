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

#include "libs/pybind.h"

// The main NMSim C++ class
class NMSimCpp {
   public:
    // time_evolution/execute_time_evolution.cpp
    py::dict execute_time_evolution(const py::object& hamiltonian,
                                    const py::object& ops_and_rates,
                                    const py::object& initial_state,
                                    const py::object& times,
                                    const py::object& observables,
                                    const py::dict& solver_params);
};
