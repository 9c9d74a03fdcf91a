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

#include "mc_jump_integrator.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include "../libs/pybind.h"
#include "../utils/random.h"

McJumpIntegrator::McJumpIntegrator(const std::vector<TimeDependentOperator>& hamiltonian_, const std::vector<TimeDependentOperator>& collapse_operators_, const NMSimConfig& config)
    : hamiltonian(hamiltonian_),
      collapse_operators(collapse_operators_),
      dim(0),
      max_step(config.get_max_step()),
      norm_steps(config.get_norm_steps()),
      norm_t_tol(config.get_norm_t_tol()),
      norm_tol(config.get_norm_tol()),
      state_atol(config.get_state_atol()),
      distribution(0.0, 1.0) {
    /*
    Args:
        hamiltonian_ (std::vector<TimeDependentOperator>): The Hamiltonian terms, H(t) = sum_k h_k(t) H_k.
        collapse_operators_ (std::vector<TimeDependentOperator>): The collapse operators c_i(t) = f_i(t) L_i.
        config (NMSimConfig): Provides max_step, norm_steps, norm_t_tol, norm_tol and state_atol.

    Raises:
        py::value_error: If there are no operators at all, or their dimensions differ.
    */
    if (!collapse_operators.empty()) {
        dim = long(collapse_operators[0].op.rows());
    } else if (!hamiltonian.empty()) {
        dim = long(hamiltonian[0].op.rows());
    } else {
        throw py::value_error("At least one Hamiltonian term or collapse operator must be provided.");
    }
    for (const auto& term : hamiltonian) {
        if (term.op.rows() != dim || term.op.cols() != dim) {
            throw py::value_error("Hamiltonian dimension mismatch.");
        }
    }

    // L_i^dagger L_i does not depend on time, only its coefficient f_i(t)^2 does
    for (const auto& c : collapse_operators) {
        if (c.op.rows() != dim || c.op.cols() != dim) {
            throw py::value_error("Collapse operator dimension mismatch.");
        }
        SparseMatrix c_dag = c.op.adjoint();
        SparseMatrix c_dag_c = c_dag * c.op;
        collapse_products.push_back(c_dag_c);
    }
}

void McJumpIntegrator::set_state(double t, const DenseMatrix& state, std::uint64_t seed) {
    /*
    Start a new trajectory.

    Args:
        t (double): The start time.
        state (DenseMatrix): A state vector (either orientation) or a density matrix. A density
            matrix is replaced by one of its eigenvectors, drawn with the eigenvalue as probability.
        seed (std::uint64_t): Seed of the trajectory's random generator.

    Raises:
        py::value_error: If the state dimension does not match the operators.
        py::value_error: If the state is zero.
    */
    generator.seed(seed);
    distribution.reset();
    collapses.clear();
    t_current = t;

    if (state.cols() == 1) {
        psi = state.col(0);
    } else if (state.rows() == 1) {
        psi = state.row(0).adjoint();
    } else {
        psi = sample_pure_state(state, generator, state_atol);
    }
    if (psi.size() != dim) {
        throw py::value_error("Initial state dimension mismatch.");
    }
    double norm = psi.norm();
    if (norm == 0.0) {
        throw py::value_error("Initial state must be non-zero.");
    }
    psi /= norm;

    target_norm = distribution(generator);
}

SparseMatrix McJumpIntegrator::effective_hamiltonian(double t) const {
    /*
    Form H_eff(t) = H(t) - i/2 sum_i f_i(t)^2 L_i^dagger L_i.

    Args:
        t (double): The time.

    Returns:
        SparseMatrix: The non-Hermitian effective Hamiltonian.
    */
    SparseMatrix H_eff(dim, dim);
    for (const auto& term : hamiltonian) {
        H_eff += std::complex<double>(term.coefficient_at(t), 0.0) * term.op;
    }
    for (size_t i = 0; i < collapse_operators.size(); ++i) {
        double f = collapse_operators[i].coefficient_at(t);
        H_eff += std::complex<double>(0.0, -0.5 * f * f) * collapse_products[i];
    }
    return H_eff;
}

DenseVector McJumpIntegrator::rk4_step(const DenseVector& psi_0, double t, double dt) const {
    /*
    One 4th-order Runge-Kutta step of d psi/dt = -i H_eff(t) psi, without normalization.

    Args:
        psi_0 (DenseVector): The state at time t.
        t (double): The start time of the step.
        dt (double): The step size.

    Returns:
        DenseVector: The unnormalized state at time t + dt.
    */
    const std::complex<double> I(0.0, 1.0);
    SparseMatrix H_start = effective_hamiltonian(t);
    SparseMatrix H_mid = effective_hamiltonian(t + 0.5 * dt);
    SparseMatrix H_end = effective_hamiltonian(t + dt);

    DenseVector psi_tmp = psi_0;
    DenseVector k1 = H_start * psi_tmp;
    k1 *= -I;

    psi_tmp = psi_0 + 0.5 * dt * k1;
    DenseVector k2 = H_mid * psi_tmp;
    k2 *= -I;

    psi_tmp = psi_0 + 0.5 * dt * k2;
    DenseVector k3 = H_mid * psi_tmp;
    k3 *= -I;

    psi_tmp = psi_0 + dt * k3;
    DenseVector k4 = H_end * psi_tmp;
    k4 *= -I;

    DenseVector psi_next = psi_0;
    psi_next += (dt / 6.0) * k1;
    psi_next += (dt / 3.0) * k2;
    psi_next += (dt / 3.0) * k3;
    psi_next += (dt / 6.0) * k4;
    return psi_next;
}

double McJumpIntegrator::find_collapse_time(double t_next, const DenseVector& psi_next, DenseVector& psi_collapse) const {
    /*
    Locate the time in (t_current, t_next] at which the squared norm crosses the target,
    by interpolating log(norm) and re-propagating from the state at t_current.

    Args:
        t_next (double): End of the step in which the norm dropped below the target.
        psi_next (DenseVector): The state at t_next.
        psi_collapse (DenseVector&): Output, the state at the returned time.

    Returns:
        double: The collapse time.
    */
    double t_low = t_current;
    double norm_low = psi.squaredNorm();
    double t_high = t_next;
    double norm_high = psi_next.squaredNorm();

    double t_guess = t_high;
    psi_collapse = psi_next;
    for (int step = 0; step < norm_steps; ++step) {
        if (t_high - t_low < norm_t_tol) {
            break;
        }

        double ratio = std::log(norm_low / target_norm) / std::log(norm_low / norm_high);
        if (!std::isfinite(ratio)) {
            ratio = 0.5;
        }
        ratio = std::min(1.0, std::max(0.0, ratio));
        t_guess = t_low + (t_high - t_low) * ratio;
        if (t_guess <= t_current) {
            t_guess = t_low + 0.5 * (t_high - t_low);
        }

        psi_collapse = rk4_step(psi, t_current, t_guess - t_current);
        double norm_guess = psi_collapse.squaredNorm();
        if (std::abs(norm_guess - target_norm) <= norm_tol * target_norm) {
            break;
        }
        if (norm_guess > target_norm) {
            t_low = t_guess;
            norm_low = norm_guess;
        } else {
            t_high = t_guess;
            norm_high = norm_guess;
        }
    }
    return t_guess;
}

void McJumpIntegrator::apply_collapse(double t, const DenseVector& psi_collapse) {
    /*
    Perform a jump at time t: pick operator i with probability proportional to
    |c_i(t) psi|^2, replace the state by the normalized c_i(t) psi, record the event
    and draw a new norm target.

    Args:
        t (double): The collapse time.
        psi_collapse (DenseVector): The unnormalized state at time t.

    Raises:
        std::runtime_error: If no collapse operator has a non-zero probability.
    */
    std::vector<DenseVector> jumped_states;
    std::vector<double> probabilities;
    for (const auto& c : collapse_operators) {
        DenseVector jumped = c.op * psi_collapse;
        jumped *= c.coefficient_at(t);
        probabilities.push_back(jumped.squaredNorm());
        jumped_states.push_back(jumped);
    }

    int index = choose_index(probabilities, distribution(generator));
    if (index < 0) {
        throw std::runtime_error("Collapse at t = " + std::to_string(t) + " but no collapse operator has a non-zero probability.");
    }

    psi = jumped_states[index] / jumped_states[index].norm();
    t_current = t;
    collapses.push_back(CollapseEvent{t, index});
    target_norm = distribution(generator);
}

DenseMatrix McJumpIntegrator::integrate(double t) {
    /*
    Advance the trajectory to time t, in steps of at most max_step, performing any jumps.

    Args:
        t (double): The target time, not earlier than the current one.

    Returns:
        DenseMatrix: The normalized state vector at time t, as a column.

    Raises:
        py::value_error: If t is earlier than the current time.
    */
    if (t < t_current) {
        throw py::value_error("Cannot integrate backwards in time.");
    }

    while (t_current < t) {
        // The last step lands exactly on t
        double t_next = (t - t_current <= max_step) ? t : t_current + max_step;
        DenseVector psi_next = rk4_step(psi, t_current, t_next - t_current);

        if (psi_next.squaredNorm() > target_norm) {
            psi = psi_next;
            t_current = t_next;
            continue;
        }

        DenseVector psi_collapse;
        double t_collapse = find_collapse_time(t_next, psi_next, psi_collapse);
        apply_collapse(t_collapse, psi_collapse);
    }

    return psi / psi.norm();
}

const std::vector<CollapseEvent>& McJumpIntegrator::get_collapses() const {
    return collapses;
}

double McJumpIntegrator::get_current_time() const {
    return t_current;
}
