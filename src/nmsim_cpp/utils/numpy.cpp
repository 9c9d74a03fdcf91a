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

#include "numpy.h"
#include <cmath>

DenseMatrix dense_from_numpy(const py::object& array) {
    /*
    Convert a numpy array (or anything numpy can turn into one) to a DenseMatrix.
    A 1D array becomes a column vector.

    Args:
        array (py::object): The array, any numeric dtype.

    Returns:
        DenseMatrix: The converted matrix.

    Raises:
        py::value_error: If the array is not 1D or 2D.
    */
    py::array_t<std::complex<double>, py::array::c_style | py::array::forcecast> buffer = py::array_t<std::complex<double>, py::array::c_style | py::array::forcecast>::ensure(array);
    if (!buffer) {
        throw py::value_error("Input could not be converted to a complex array.");
    }
    py::buffer_info buf = buffer.request();
    if (buf.ndim != 1 && buf.ndim != 2) {
        throw py::value_error("Input array must be 1D or 2D.");
    }
    long rows = long(buf.shape[0]);
    long cols = (buf.ndim == 2) ? long(buf.shape[1]) : 1;
    auto ptr = static_cast<std::complex<double>*>(buf.ptr);
    DenseMatrix mat(rows, cols);
    for (long r = 0; r < rows; ++r) {
        for (long c = 0; c < cols; ++c) {
            mat(r, c) = ptr[r * cols + c];
        }
    }
    return mat;
}

SparseMatrix from_numpy(const py::object& array, double atol) {
    /*
    Convert a 2D numpy array to a SparseMatrix, dropping entries below atol.

    Args:
        array (py::object): The 2D array.
        atol (double): Entries with an absolute value not above this are dropped.

    Returns:
        SparseMatrix: The converted sparse matrix.

    Raises:
        py::value_error: If the array is not 2D.
    */
    py::array checked = py::array::ensure(array);
    if (!checked || checked.ndim() != 2) {
        throw py::value_error("Input array must be 2D.");
    }
    DenseMatrix dense = dense_from_numpy(array);
    Triplets entries;
    for (long r = 0; r < dense.rows(); ++r) {
        for (long c = 0; c < dense.cols(); ++c) {
            std::complex<double> val = dense(r, c);
            if (std::abs(val) > atol) {
                entries.emplace_back(Triplet(int(r), int(c), val));
            }
        }
    }
    SparseMatrix mat(dense.rows(), dense.cols());
    mat.setFromTriplets(entries.begin(), entries.end());
    return mat;
}

py::array_t<double> to_numpy(const std::vector<double>& vec) {
    /*
    Convert a vector of doubles to a NumPy array.

    Args:
        vec (std::vector<double>): The input vector.

    Returns:
        py::array_t<double>: The corresponding NumPy array.
    */
    int size = int(vec.size());
    py::array_t<double> np_array(size);
    py::buffer_info buf = np_array.request();
    auto ptr = static_cast<double*>(buf.ptr);
    for (int i = 0; i < size; ++i) {
        ptr[i] = vec[i];
    }
    return np_array;
}

py::array_t<double> to_numpy(const std::vector<std::vector<double>>& vecs) {
    /*
    Convert a vector of equally long vectors of doubles to a 2D NumPy array.

    Args:
        vecs (std::vector<std::vector<double>>): The input vector of vectors.

    Returns:
        py::array_t<double>: The corresponding 2D NumPy array, with shape (0, 0) for no input.
    */
    int rows = int(vecs.size());
    int cols = rows > 0 ? int(vecs[0].size()) : 0;
    py::array_t<double> np_array({rows, cols});
    py::buffer_info buf = np_array.request();
    auto ptr = static_cast<double*>(buf.ptr);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            ptr[r * cols + c] = vecs[r][c];
        }
    }
    return np_array;
}

py::array_t<std::complex<double>> to_numpy(const DenseMatrix& matrix) {
    /*
    Convert a DenseMatrix to a 2D NumPy array.

    Args:
        matrix (DenseMatrix): The input matrix.

    Returns:
        py::array_t<std::complex<double>>: The corresponding NumPy array.
    */
    int rows = int(matrix.rows());
    int cols = int(matrix.cols());
    py::array_t<std::complex<double>> np_array({rows, cols});
    py::buffer_info buf = np_array.request();
    auto ptr = static_cast<std::complex<double>*>(buf.ptr);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            ptr[r * cols + c] = matrix(r, c);
        }
    }
    return np_array;
}
