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

#include <complex>
#include <vector>
#include "../libs/eigen.h"

std::complex<double> trace(const DenseMatrix& matrix);
double expectation_value(const SparseMatrix& observable, const DenseMatrix& rho);
DenseMatrix to_density_matrix(const DenseMatrix& state);
SparseMatrix identity(long dim);
bool allclose(const DenseMatrix& A, const DenseMatrix& B, double rtol, double atol);
double anti_hermitian_norm(const DenseMatrix& matrix);
