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

#include "paired_operators.h"
#include <algorithm>
#include <cmath>
#include <memory>
#include "rate_shift.h"

double sqrt_shifted_rate(double t, int index, const std::vector<OperatorRatePair>& ops_and_rates) {
    /*
    Coefficient sqrt(Gamma_i(t) + sigma(t)) of a paired collapse operator.
    The radicand is non-negative in exact arithmetic; rounding noise below zero is clamped.

    Args:
        t (double): The time.
        index (int): The operator index.
        ops_and_rates (std::vector<OperatorRatePair>): The operators and their rates.

    Returns:
        double: The coefficient.
    */
    double radicand = shifted_rate(t, index, ops_and_rates);
    return std::sqrt(std::max(0.0, radicand));
}

std::vector<TimeDependentOperator> build_paired_operators(const std::vector<OperatorRatePair>& ops_and_rates) {
    /*
    Build the collapse operators c_i(t) = sqrt(Gamma_i(t) + sigma(t)) L_i of the biased,
    always non-negative, jump process.

    Args:
        ops_and_rates (std::vector<OperatorRatePair>): The (augmented) operators and their rates.

    Returns:
        std::vector<TimeDependentOperator>: One time-dependent operator per input pair, in the same order.
    */
    // Every coefficient needs all the rates for sigma(t), so they share one copy
    std::shared_ptr<const std::vector<OperatorRatePair>> shared_ops = std::make_shared<const std::vector<OperatorRatePair>>(ops_and_rates);

    std::vector<TimeDependentOperator> paired_operators;
    for (size_t i = 0; i < ops_and_rates.size(); ++i) {
        int index = int(i);
        TimeDependentOperator paired;
        paired.op = ops_and_rates[i].op;
        paired.coefficient = [shared_ops, index](double t) { return sqrt_shifted_rate(t, index, *shared_ops); };
        paired_operators.push_back(paired);
    }
    return paired_operators;
}
