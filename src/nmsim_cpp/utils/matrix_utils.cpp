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

#include "matrix_utils.h"
#include "../libs/pybind.h"

std::complex<double> trace(const DenseMatrix& matrix) {
    /*
    Compute the trace of a square matrix.

    Args:
        matrix (DenseMatrix): The input square matrix.

    Returns:
        std::complex<double>: The trace of the matrix.

    Raises:
        py::value_error: If the matrix is not square.
    */
    if (matrix.rows() != matrix.cols()) {
        throw py::value_error("Matrix must be square to compute trace.");
    }
    return matrix.trace();
}

double expectation_value(const SparseMatrix& observable, const DenseMatrix& rho) {
    /*
    Compute Re tr(O rho) for an observable and a (possibly unnormalized) density matrix.
    The trace is not divided out, so a weighted density matrix gives a weighted expectation value.

    Args:
        observable (SparseMatrix): The observable.
        rho (DenseMatrix): The density matrix.

    Returns:
        double: The real part of tr(O rho).
    */
    DenseMatrix O_rho = observable * rho;
    return std::real(O_rho.trace());
}

DenseMatrix to_density_matrix(const DenseMatrix& state) {
    /*
    Convert a state to density matrix form.
    Column and row vectors become |psi><psi|, square matrices are returned unchanged.

    Args:
        state (DenseMatrix): A state vector (either orientation) or a density matrix.

    Returns:
        DenseMatrix: The density matrix.
    */
    if (state.cols() == 1) {
        return state * state.adjoint();
    }
    if (state.rows() == 1) {
        return state.adjoint() * state;
    }
    return state;
}

SparseMatrix identity(long dim) {
    /*
    Build a sparse identity matrix.

    Args:
        dim (long): The dimension.

    Returns:
        SparseMatrix: The dim x dim identity.
    */
    Triplets iden_entries;
    for (long i = 0; i < dim; ++i) {
        iden_entries.emplace_back(Triplet(i, i, 1.0));
    }
    SparseMatrix iden(dim, dim);
    iden.setFromTriplets(iden_entries.begin(), iden_entries.end());
    return iden;
}

bool allclose(const DenseMatrix& A, const DenseMatrix& B, double rtol, double atol) {
    /*
    Element-wise closeness check, |A - B| <= atol + rtol * |B|.

    Args:
        A (DenseMatrix): The matrix to test.
        B (DenseMatrix): The reference matrix.
        rtol (double): Relative tolerance, applied to the reference entries.
        atol (double): Absolute tolerance.

    Returns:
        bool: True if every entry is within tolerance.
    */
    if (A.rows() != B.rows() || A.cols() != B.cols()) {
        return false;
    }
    for (long c = 0; c < A.cols(); ++c) {
        for (long r = 0; r < A.rows(); ++r) {
            if (std::abs(A(r, c) - B(r, c)) > atol + rtol * std::abs(B(r, c))) {
                return false;
            }
        }
    }
    return true;
}

double anti_hermitian_norm(const DenseMatrix& matrix) {
    /*
    Largest absolute entry of M - M^dagger, zero for an exactly Hermitian matrix.

    Args:
        matrix (DenseMatrix): A square matrix.

    Returns:
        double: max |M_ij - conj(M_ji)|.
    */
    if (matrix.size() == 0) {
        return 0.0;
    }
    DenseMatrix difference = matrix - matrix.adjoint();
    return difference.cwiseAbs().maxCoeff();
}
