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

#include "completeness.h"
#include <stdexcept>
#include <string>
#include "../libs/pybind.h"
#include "../utils/matrix_utils.h"

DenseMatrix compute_completeness_operator(const std::vector<OperatorRatePair>& ops_and_rates) {
    /*
    Form Omega = sum_i L_i^dagger L_i.

    Args:
        ops_and_rates (std::vector<OperatorRatePair>): The jump operators. Rates are not used.

    Returns:
        DenseMatrix: The operator Omega.

    Raises:
        py::value_error: If no operators are given.
        py::value_error: If an operator is not square or does not match the first one.
    */
    if (ops_and_rates.empty()) {
        throw py::value_error("At least one jump operator must be provided.");
    }
    long dim = long(ops_and_rates[0].op.rows());
    DenseMatrix omega = DenseMatrix::Zero(dim, dim);
    for (size_t i = 0; i < ops_and_rates.size(); ++i) {
        const SparseMatrix& L = ops_and_rates[i].op;
        if (L.rows() != dim || L.cols() != dim) {
            throw py::value_error("Jump operator " + std::to_string(i) + " dimension mismatch.");
        }
        SparseMatrix L_dag = L.adjoint();
        SparseMatrix L_dag_L = L_dag * L;
        omega += DenseMatrix(L_dag_L);
    }
    return omega;
}

CompletenessResult check_completeness(const DenseMatrix& omega, double rtol, double atol) {
    /*
    Check whether Omega is proportional to the identity. If it is not, build the extra
    operator L_extra = sqrt(a I - Omega), with a the largest eigenvalue of Omega, so that
    Omega + L_extra^dagger L_extra = a I.

    A Hermitian Omega is square-rooted through its eigendecomposition, clamping eigenvalues
    of a I - Omega that are negative by rounding to zero. A non-Hermitian Omega is left
    as it is: the general eigensolver and the Schur-based square root are used, and the
    asymmetry is reported in the result.

    Args:
        omega (DenseMatrix): The operator sum_i L_i^dagger L_i.
        rtol (double): Relative tolerance of the proportionality check.
        atol (double): Absolute tolerance of the proportionality and Hermiticity checks.

    Returns:
        CompletenessResult: The factor a and, if needed, the extra operator.

    Raises:
        py::value_error: If Omega is empty or not square.
    */
    if (omega.rows() == 0 || omega.rows() != omega.cols()) {
        throw py::value_error("Completeness operator must be square and non-empty.");
    }
    long dim = long(omega.rows());

    CompletenessResult result;
    result.has_extra_operator = false;
    result.hermiticity_error = anti_hermitian_norm(omega);
    result.is_hermitian = (result.hermiticity_error <= atol);

    // Already proportional to the identity
    std::complex<double> a_candidate = trace(omega) / double(dim);
    DenseMatrix iden = DenseMatrix(identity(dim));
    if (allclose(omega, a_candidate * iden, rtol, atol)) {
        result.a = std::real(a_candidate);
        return result;
    }

    DenseMatrix L_extra;
    if (result.is_hermitian) {
        Eigen::SelfAdjointEigenSolver<DenseMatrix> es(omega);
        if (es.info() != Eigen::Success) {
            throw std::runtime_error("Eigendecomposition of the completeness operator did not converge.");
        }
        result.a = es.eigenvalues().maxCoeff();
        Eigen::VectorXd sqrt_shifted = (result.a - es.eigenvalues().array()).max(0.0).sqrt().matrix();
        L_extra = es.eigenvectors() * sqrt_shifted.cast<std::complex<double>>().asDiagonal() * es.eigenvectors().adjoint();
    } else {
        Eigen::ComplexEigenSolver<DenseMatrix> ces(omega, false);
        if (ces.info() != Eigen::Success) {
            throw std::runtime_error("Eigendecomposition of the completeness operator did not converge.");
        }
        result.a = ces.eigenvalues().real().maxCoeff();
        DenseMatrix shifted = result.a * iden - omega;
        L_extra = shifted.sqrt();
    }

    result.has_extra_operator = true;
    result.extra_operator = L_extra.sparseView();
    return result;
}

CompletenessResult check_completeness(const std::vector<OperatorRatePair>& ops_and_rates, const NMSimConfig& config) {
    /*
    Run the completeness check on a list of jump operators.

    Args:
        ops_and_rates (std::vector<OperatorRatePair>): The jump operators.
        config (NMSimConfig): Provides completeness_rtol and completeness_atol.

    Returns:
        CompletenessResult: The factor a and, if needed, the extra operator.
    */
    DenseMatrix omega = compute_completeness_operator(ops_and_rates);
    return check_completeness(omega, config.get_completeness_rtol(), config.get_completeness_atol());
}
