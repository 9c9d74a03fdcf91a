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
#include "operator_rate_pair.h"

// Outcome of the completeness check on sum_i L_i^dagger L_i
struct CompletenessResult {
    // Proportionality factor a of the (augmented) identity sum L^dagger L = a I
    double a;

    // Set if the operator set had to be completed with extra_operator
    bool has_extra_operator;
    SparseMatrix extra_operator;

    // Whether sum L^dagger L was Hermitian within completeness_atol, and by how much it was not
    bool is_hermitian;
    double hermiticity_error;
};

DenseMatrix compute_completeness_operator(const std::vector<OperatorRatePair>& ops_and_rates);
CompletenessResult check_completeness(const DenseMatrix& omega, double rtol, double atol);
CompletenessResult check_completeness(const std::vector<OperatorRatePair>& ops_and_rates, const NMSimConfig& config);
