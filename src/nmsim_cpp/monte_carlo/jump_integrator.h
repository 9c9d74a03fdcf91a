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
#include <functional>
#include <vector>
#include "../libs/eigen.h"

// A fixed operator times a real, time-dependent coefficient.
// An empty coefficient means the term is constant.
struct TimeDependentOperator {
    SparseMatrix op;
    std::function<double(double)> coefficient;

    double coefficient_at(double t) const { return coefficient ? coefficient(t) : 1.0; }
};

// A recorded quantum jump: when it happened and on which operator.
struct CollapseEvent {
    double time;
    int index;
};

// The narrow view of a quantum-jump engine used by the trajectory runner
class JumpIntegrator {
   public:
    virtual ~JumpIntegrator() {}

    // Reset the trajectory: time, state (vector or density matrix) and random seed
    virtual void set_state(double t, const DenseMatrix& state, std::uint64_t seed) = 0;

    // Advance to time t and return the normalized state
    virtual DenseMatrix integrate(double t) = 0;

    // All jumps since the last set_state, in time order
    virtual const std::vector<CollapseEvent>& get_collapses() const = 0;

    virtual double get_current_time() const = 0;
};
