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
#include <pybind11/eval.h>
#include "libs/pybind.h"
#include "test_helpers.h"
#include "utils/numpy.h"
#include "utils/parsers.h"

using namespace test_utils;

TEST(ParsersTest, SolverParamsOverrideDefaults) {
    py::dict params;
    params["num_trajectories"] = 10;
    params["seed"] = 3;
    params["completeness_atol"] = 1e-6;
    params["state_atol"] = 1e-10;
    params["store_intermediate_results"] = false;
    params["verbose"] = true;
    params["unused_key"] = "ignored";

    NMSimConfig config = parse_solver_params(params);
    EXPECT_EQ(config.get_num_trajectories(), 10);
    EXPECT_EQ(config.get_seed(), 3);
    EXPECT_DOUBLE_EQ(config.get_completeness_atol(), 1e-6);
    EXPECT_DOUBLE_EQ(config.get_state_atol(), 1e-10);
    EXPECT_FALSE(config.get_store_intermediate_results());
    EXPECT_TRUE(config.get_verbose());
    EXPECT_DOUBLE_EQ(config.get_max_step(), 0.01);
}

TEST(ParsersTest, SolverParamsFixThreadCount) {
    py::dict params;
    params["num_threads"] = 0;
    NMSimConfig config = parse_solver_params(params);
    EXPECT_EQ(config.get_num_threads(), 1);
}

TEST(ParsersTest, SolverParamsAreValidated) {
    py::dict params;
    params["max_step"] = -0.5;
    EXPECT_THROW(parse_solver_params(params), py::value_error);
}

TEST(ParsersTest, ConstantAndCallableRates) {
    RateFunction constant = parse_rate(py::float_(-0.5));
    EXPECT_DOUBLE_EQ(constant(0.0), -0.5);
    EXPECT_DOUBLE_EQ(constant(7.0), -0.5);

    py::object callable = py::eval("lambda t: 1.0 - 2.0 * t");
    RateFunction rate = parse_rate(callable);
    EXPECT_DOUBLE_EQ(rate(0.25), 0.5);
    EXPECT_DOUBLE_EQ(rate(1.0), -1.0);
}

TEST(ParsersTest, PythonRateErrorsPropagate) {
    py::object callable = py::eval("lambda t: 1.0 / (t - t)");
    RateFunction rate = parse_rate(callable);
    EXPECT_THROW(rate(1.0), py::error_already_set);
}

TEST(ParsersTest, OperatorsAndRates) {
    py::list ops_and_rates;
    ops_and_rates.append(py::make_tuple(to_numpy(DenseMatrix(sigma_minus())), 1.5));
    ops_and_rates.append(py::make_tuple(to_numpy(DenseMatrix(sigma_plus())), py::eval("lambda t: -t")));

    std::vector<OperatorRatePair> pairs = parse_ops_and_rates(ops_and_rates);
    ASSERT_EQ(pairs.size(), 2u);
    expect_matrix_near(DenseMatrix(pairs[0].op), DenseMatrix(sigma_minus()), 0.0);
    expect_matrix_near(DenseMatrix(pairs[1].op), DenseMatrix(sigma_plus()), 0.0);
    EXPECT_DOUBLE_EQ(pairs[0].rate(3.0), 1.5);
    EXPECT_DOUBLE_EQ(pairs[1].rate(3.0), -3.0);
}

TEST(ParsersTest, OperatorsAndRatesMustBePairs) {
    py::list ops_and_rates;
    ops_and_rates.append(py::make_tuple(to_numpy(DenseMatrix(sigma_minus()))));
    EXPECT_THROW(parse_ops_and_rates(ops_and_rates), py::value_error);
}

TEST(ParsersTest, HamiltonianForms) {
    py::object single = to_numpy(DenseMatrix(sigma_x()));
    std::vector<TimeDependentOperator> constant = parse_hamiltonian(single);
    ASSERT_EQ(constant.size(), 1u);
    EXPECT_DOUBLE_EQ(constant[0].coefficient_at(2.0), 1.0);

    py::list terms;
    terms.append(to_numpy(DenseMatrix(projector(1))));
    terms.append(py::make_tuple(to_numpy(DenseMatrix(sigma_x())), py::eval("lambda t: 3.0 * t")));
    std::vector<TimeDependentOperator> time_dependent = parse_hamiltonian(terms);
    ASSERT_EQ(time_dependent.size(), 2u);
    EXPECT_FALSE(bool(time_dependent[0].coefficient));
    EXPECT_DOUBLE_EQ(time_dependent[1].coefficient_at(2.0), 6.0);

    EXPECT_TRUE(parse_hamiltonian(py::none()).empty());
}

TEST(ParsersTest, InitialStatesAndTimes) {
    py::object ket_1d = py::eval("[0.0, 1.0]");
    DenseMatrix psi = parse_initial_state(ket_1d);
    ASSERT_EQ(psi.rows(), 2);
    ASSERT_EQ(psi.cols(), 1);
    EXPECT_EQ(psi(1, 0), std::complex<double>(1.0, 0.0));

    DenseMatrix rho = parse_initial_state(to_numpy(DenseMatrix(projector(0))));
    ASSERT_EQ(rho.rows(), 2);
    ASSERT_EQ(rho.cols(), 2);

    std::vector<double> times = parse_times(py::eval("[0.0, 0.5, 1.0]"));
    std::vector<double> expected = {0.0, 0.5, 1.0};
    EXPECT_EQ(times, expected);

    EXPECT_TRUE(parse_observables(py::none()).empty());
}
