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

#include <map>
#include <vector>
#include "../config/nmsim_config.h"
#include "../monte_carlo/jump_integrator.h"
#include "operator_rate_pair.h"

// Tracks the martingale mu(t) = mu_c(t) * mu_d(collapses) of one trajectory.
// The continuous part is memoized per time and can only be extended forwards.
class MartingaleTracker {
   private:
    const std::vector<OperatorRatePair>& ops_and_rates;
    double a_parameter;
    double quadrature_tol;
    int quadrature_max_depth;

    bool initialized = false;
    std::map<double, double> mu_c;

   public:
    MartingaleTracker(const std::vector<OperatorRatePair>& ops_and_rates_, double a_parameter_, const NMSimConfig& config)
        : ops_and_rates(ops_and_rates_), a_parameter(a_parameter_), quadrature_tol(config.get_quadrature_tol()), quadrature_max_depth(config.get_quadrature_max_depth()) {}

    // martingale.cpp
    void reset(double t0);
    bool is_initialized() const;
    const std::map<double, double>& get_cache() const;
    void precompute(const std::vector<double>& times);
    double continuous_value(double t);
    double discrete_value(const std::vector<CollapseEvent>& collapses) const;
    double current_martingale(double t, const std::vector<CollapseEvent>& collapses);
};
