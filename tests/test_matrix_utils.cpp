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

#include <gtest/gtest.h>
#include "libs/pybind.h"
#include "test_helpers.h"
#include "utils/matrix_utils.h"

using namespace test_utils;

TEST(MatrixUtilsTest, ColumnVectorToDensityMatrix) {
    DenseMatrix psi(2, 1);
    psi << std::complex<double>(1.0, 0.0), std::complex<double>(0.0, 1.0);
    psi /= std::sqrt(2.0);

    DenseMatrix rho = to_density_matrix(psi);
    DenseMatrix expected(2, 2);
    expected << 0.5, std::complex<double>(0.0, -0.5), std::complex<double>(0.0, 0.5), 0.5;
    expect_matrix_near(rho, expected, 1e-14);
}

TEST(MatrixUtilsTest, RowVectorToDensityMatrix) {
    DenseMatrix bra = ket(1).transpose();
    expect_matrix_near(to_density_matrix(bra), DenseMatrix(projector(1)), 0.0);
}

TEST(MatrixUtilsTest, DensityMatrixIsUnchanged) {
    DenseMatrix rho = 3.0 * DenseMatrix(projector(0));
    expect_matrix_near(to_density_matrix(rho), rho, 0.0);
}

TEST(MatrixUtilsTest, ExpectationValueKeepsTheWeight) {
    DenseMatrix weighted = -2.0 * DenseMatrix(projector(1));
    EXPECT_DOUBLE_EQ(expectation_value(projector(1), weighted), -2.0);
    EXPECT_DOUBLE_EQ(expectation_value(projector(0), weighted), 0.0);
    EXPECT_DOUBLE_EQ(expectation_value(sparse_identity(2), weighted), -2.0);
}

TEST(MatrixUtilsTest, TraceOfNonSquareThrows) {
    DenseMatrix m = DenseMatrix::Zero(2, 3);
    EXPECT_THROW(trace(m), py::value_error);
}

TEST(MatrixUtilsTest, Allclose) {
    DenseMatrix a = DenseMatrix::Identity(2, 2);
    DenseMatrix b = a;
    b(0, 1) = 1e-9;
    EXPECT_TRUE(allclose(b, a, 1e-5, 1e-8));
    EXPECT_FALSE(allclose(b, a, 1e-5, 1e-10));
    EXPECT_FALSE(allclose(DenseMatrix::Identity(3, 3), a, 1e-5, 1e-8));
}

TEST(MatrixUtilsTest, AntiHermitianNorm) {
    DenseMatrix m = DenseMatrix(sigma_x());
    EXPECT_DOUBLE_EQ(anti_hermitian_norm(m), 0.0);
    DenseMatrix lower = DenseMatrix(sigma_minus());
    EXPECT_DOUBLE_EQ(anti_hermitian_norm(lower), 1.0);
}

TEST(MatrixUtilsTest, Identity) {
    SparseMatrix iden = identity(3);
    expect_matrix_near(DenseMatrix(iden), DenseMatrix::Identity(3, 3), 0.0);
}
