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

#include "rate_shift.h"
#include <algorithm>
#include <string>
#include "../libs/pybind.h"

double rate_shift(double t, const std::vector<OperatorRatePair>& ops_and_rates) {
    /*
    The shift sigma(t) = 2 * max(0, -min_i Gamma_i(t)) that makes every rate non-negative.
    Rates are evaluated on every call, nothing is cached.

    Args:
        t (double): The time.
        ops_and_rates (std::vector<OperatorRatePair>): The operators and their rates.

    Returns:
        double: sigma(t) >= 0, with Gamma_i(t) + sigma(t) >= 0 for every i.
    */
    if (ops_and_rates.empty()) {
        return 0.0;
    }
    double min_rate = ops_and_rates[0].rate(t);
    for (size_t i = 1; i < ops_and_rates.size(); ++i) {
        min_rate = std::min(min_rate, ops_and_rates[i].rate(t));
    }
    return 2.0 * std::max(0.0, -min_rate);
}

double shifted_rate(double t, int index, const std::vector<OperatorRatePair>& ops_and_rates) {
    /*
    The rate Gamma_i(t) + sigma(t) of the biased process for one operator.

    Args:
        t (double): The time.
        index (int): The operator index.
        ops_and_rates (std::vector<OperatorRatePair>): The operators and their rates.

    Returns:
        double: The shifted rate.

    Raises:
        py::value_error: If the index is out of range.
    */
    if (index < 0 || size_t(index) >= ops_and_rates.size()) {
        throw py::value_error("Operator index " + std::to_string(index) + " out of range.");
    }
    double rate = ops_and_rates[index].rate(t);
    return rate + rate_shift(t, ops_and_rates);
}
