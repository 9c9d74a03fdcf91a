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

#include "random.h"
#include <cmath>
#include <string>
#include "../libs/pybind.h"

int choose_index(const std::vector<double>& weights, double random_value) {
    /*
    Pick an index with probability proportional to its weight.

    Args:
        weights (std::vector<double>): Non-negative, not necessarily normalized, weights.
        random_value (double): A uniform random number in [0, 1).

    Returns:
        int: The chosen index, or -1 if all weights are zero.
    */
    double total = 0.0;
    for (double w : weights) {
        total += w;
    }
    if (total <= 0.0) {
        return -1;
    }
    double cumulative_prob = 0.0;
    int last_nonzero = -1;
    for (size_t i = 0; i < weights.size(); ++i) {
        if (weights[i] <= 0.0) {
            continue;
        }
        last_nonzero = int(i);
        cumulative_prob += weights[i] / total;
        if (random_value < cumulative_prob) {
            return int(i);
        }
    }

    // Rounding can leave the cumulative sum just below one
    return last_nonzero;
}

DenseVector sample_pure_state(const DenseMatrix& rho, std::mt19937_64& generator, double atol) {
    /*
    Draw a pure state from a density matrix, using the eigendecomposition.
    The eigenvector k is returned with probability equal to its eigenvalue.

    Args:
        rho (DenseMatrix): The input density matrix.
        generator (std::mt19937_64&): The random generator of the trajectory.
        atol (double): Eigenvalues below this are treated as zero.

    Returns:
        DenseVector: A normalized state vector.

    Raises:
        py::value_error: If the matrix is not square.
        py::value_error: If the eigenvalues do not sum to 1.
    */
    if (rho.rows() != rho.cols()) {
        throw py::value_error("Density matrix must be square.");
    }

    // Eigendecompose the density matrix
    Eigen::SelfAdjointEigenSolver<DenseMatrix> es(rho);
    Eigen::VectorXd evals = es.eigenvalues();
    std::vector<double> probabilities(evals.size(), 0.0);
    double total_prob = 0.0;
    for (int i = 0; i < evals.size(); ++i) {
        if (evals(i) > atol) {
            probabilities[i] = evals(i);
            total_prob += evals(i);
        }
    }

    // Make sure probabilities sum to 1
    if (std::abs(total_prob - 1.0) > std::sqrt(atol)) {
        throw py::value_error("Probabilities from state do not sum to 1 (sum = " + std::to_string(total_prob) + ")");
    }

    std::uniform_real_distribution<double> distribution(0.0, 1.0);
    int index = choose_index(probabilities, distribution(generator));
    DenseVector state = es.eigenvectors().col(index);
    return state / state.norm();
}

std::vector<std::uint64_t> make_trajectory_seeds(int seed, int n_trajectories) {
    /*
    Derive one independent seed per trajectory from the user seed.

    Args:
        seed (int): The base seed.
        n_trajectories (int): Number of trajectories.

    Returns:
        std::vector<std::uint64_t>: The per-trajectory seeds.
    */
    std::seed_seq sequence{seed};
    std::vector<std::uint32_t> words(2 * size_t(n_trajectories));
    sequence.generate(words.begin(), words.end());
    std::vector<std::uint64_t> seeds(n_trajectories);
    for (int i = 0; i < n_trajectories; ++i) {
        seeds[i] = (std::uint64_t(words[2 * i]) << 32) | std::uint64_t(words[2 * i + 1]);
    }
    return seeds;
}
