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

#include "martingale.h"
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <string>

#include <boost/math/quadrature/gauss_kronrod.hpp>

#include "../libs/pybind.h"
#include "rate_shift.h"

void MartingaleTracker::reset(double t0) {
    /*
    Start a new trajectory: forget all cached values and set mu_c(t0) = 1.

    Args:
        t0 (double): The start time of the trajectory.
    */
    mu_c.clear();
    mu_c[t0] = 1.0;
    initialized = true;
}

bool MartingaleTracker::is_initialized() const {
    return initialized;
}

const std::map<double, double>& MartingaleTracker::get_cache() const {
    return mu_c;
}

void MartingaleTracker::precompute(const std::vector<double>& times) {
    /*
    Fill the cache at every given time, in order, so that later queries at exactly these
    times are lookups and each interval between consecutive times is integrated once.

    Args:
        times (std::vector<double>): Increasing times, all >= the reset time.
    */
    for (double t : times) {
        continuous_value(t);
    }
}

double MartingaleTracker::continuous_value(double t) {
    /*
    Continuous part of the martingale, mu_c(t) = mu_c(t0) * exp(a * int_{t0}^{t} sigma(s) ds),
    where t0 is the latest cached time before t. The new value is cached.

    Args:
        t (double): The time.

    Returns:
        double: mu_c(t).

    Raises:
        std::runtime_error: If reset was never called.
        py::value_error: If t is earlier than every cached time.
    */
    if (!initialized) {
        throw std::runtime_error("The `start` method must be called first.");
    }

    std::map<double, double>::iterator hit = mu_c.find(t);
    if (hit != mu_c.end()) {
        return hit->second;
    }

    // First key after t, its predecessor is the closest earlier time
    std::map<double, double>::iterator later = mu_c.upper_bound(t);
    if (later == mu_c.begin()) {
        throw py::value_error("Cannot integrate backwards in time.");
    }
    std::map<double, double>::iterator earlier = std::prev(later);

    const std::vector<OperatorRatePair>& ops = ops_and_rates;
    auto shift = [&ops](double s) { return rate_shift(s, ops); };
    double integral = boost::math::quadrature::gauss_kronrod<double, 15>::integrate(shift, earlier->first, t, unsigned(quadrature_max_depth), quadrature_tol);

    double result = earlier->second * std::exp(a_parameter * integral);
    mu_c.emplace_hint(later, t, result);
    return result;
}

double MartingaleTracker::discrete_value(const std::vector<CollapseEvent>& collapses) const {
    /*
    Discrete part of the martingale, the product over collapses (t_k, i_k) of
    Gamma_{i_k}(t_k) / (Gamma_{i_k}(t_k) + sigma(t_k)). Factors can be negative.

    Args:
        collapses (std::vector<CollapseEvent>): The jumps of the trajectory so far.

    Returns:
        double: mu_d, exactly 1 for no collapses.

    Raises:
        py::value_error: If a collapse refers to an unknown operator.
    */
    double result = 1.0;
    for (const auto& collapse : collapses) {
        if (collapse.index < 0 || size_t(collapse.index) >= ops_and_rates.size()) {
            throw py::value_error("Collapse on unknown operator " + std::to_string(collapse.index) + ".");
        }
        double rate = ops_and_rates[collapse.index].rate(collapse.time);
        result *= rate / (rate + rate_shift(collapse.time, ops_and_rates));
    }
    return result;
}

double MartingaleTracker::current_martingale(double t, const std::vector<CollapseEvent>& collapses) {
    /*
    The full martingale mu(t) = mu_c(t) * mu_d(collapses).

    Args:
        t (double): The current trajectory time.
        collapses (std::vector<CollapseEvent>): The jumps up to t.

    Returns:
        double: mu(t).
    */
    return continuous_value(t) * discrete_value(collapses);
}
