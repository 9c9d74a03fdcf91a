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
#include <complex>
#include <pybind11/eval.h>
#include "libs/pybind.h"
#include "nmsim.h"
#include "test_helpers.h"
#include "utils/numpy.h"

using namespace test_utils;

class ExecuteTimeEvolutionTest : public ::testing::Test {
   protected:
    NMSimCpp simulator;
    py::list ops_and_rates;
    py::list observables;
    py::object initial_state;
    py::object times;
    py::dict solver_params;

    void SetUp() override {
        ops_and_rates.append(py::make_tuple(to_numpy(DenseMatrix(sigma_minus())), py::eval("lambda t: -0.2")));
        observables.append(to_numpy(DenseMatrix(projector(1))));
        initial_state = to_numpy(DenseMatrix(ket(1)));
        times = py::eval("[0.0, 0.5, 1.0]");
        solver_params["num_trajectories"] = 20;
        solver_params["num_threads"] = 2;
        solver_params["seed"] = 11;
    }
};

TEST_F(ExecuteTimeEvolutionTest, ReturnsTheAveragedResults) {
    solver_params["keep_runs_results"] = true;
    py::dict output = simulator.execute_time_evolution(py::none(), ops_and_rates, initial_state, times, observables, solver_params);

    EXPECT_DOUBLE_EQ(output["a_parameter"].cast<double>(), 1.0);
    EXPECT_EQ(output["num_trajectories"].cast<int>(), 20);

    py::array_t<double> out_times = output["times"].cast<py::array_t<double>>();
    ASSERT_EQ(out_times.size(), 3);
    EXPECT_DOUBLE_EQ(out_times.at(2), 1.0);

    py::array_t<double> average_trace = output["average_trace"].cast<py::array_t<double>>();
    py::array_t<double> std_trace = output["std_trace"].cast<py::array_t<double>>();
    ASSERT_EQ(average_trace.size(), 3);
    ASSERT_EQ(std_trace.size(), 3);
    EXPECT_DOUBLE_EQ(average_trace.at(0), 1.0);
    EXPECT_NEAR(std_trace.at(0), 0.0, 1e-12);

    // One observable, one value per time
    py::array_t<double> expect = output["expectation_values"].cast<py::array_t<double>>();
    ASSERT_EQ(expect.ndim(), 2);
    ASSERT_EQ(expect.shape(0), 1);
    ASSERT_EQ(expect.shape(1), 3);
    EXPECT_DOUBLE_EQ(expect.at(0, 0), 1.0);
    py::array_t<double> std_expect = output["std_expectation_values"].cast<py::array_t<double>>();
    EXPECT_EQ(std_expect.shape(1), 3);

    // The final state is not renormalized, its trace is the average weight
    py::array_t<std::complex<double>> final_state = output["final_state"].cast<py::array_t<std::complex<double>>>();
    ASSERT_EQ(final_state.shape(0), 2);
    ASSERT_EQ(final_state.shape(1), 2);
    EXPECT_NEAR(final_state.at(0, 0).real() + final_state.at(1, 1).real(), average_trace.at(2), 1e-10);

    py::list intermediate_states = output["intermediate_states"].cast<py::list>();
    ASSERT_EQ(intermediate_states.size(), 3u);
    py::array_t<std::complex<double>> first_state = intermediate_states[0].cast<py::array_t<std::complex<double>>>();
    EXPECT_NEAR(first_state.at(1, 1).real(), 1.0, 1e-12);

    py::list collapses = output["collapses"].cast<py::list>();
    ASSERT_EQ(collapses.size(), 20u);
    for (py::handle events : collapses) {
        double previous = 0.0;
        for (py::handle event : events) {
            py::tuple collapse = event.cast<py::tuple>();
            ASSERT_EQ(collapse.size(), 2u);
            double t = collapse[0].cast<double>();
            int index = collapse[1].cast<int>();
            EXPECT_GE(t, previous);
            EXPECT_LE(t, 1.0);
            EXPECT_TRUE(index == 0 || index == 1);
            previous = t;
        }
    }
    EXPECT_EQ(output["seeds"].cast<py::list>().size(), 20u);

    py::list runs_trace = output["runs_trace"].cast<py::list>();
    py::list runs_expect = output["runs_expectation_values"].cast<py::list>();
    ASSERT_EQ(runs_trace.size(), 20u);
    ASSERT_EQ(runs_expect.size(), 20u);
    double summed_trace = 0.0;
    for (py::handle run : runs_trace) {
        py::array_t<double> run_trace = run.cast<py::array_t<double>>();
        ASSERT_EQ(run_trace.size(), 3);
        EXPECT_DOUBLE_EQ(run_trace.at(0), 1.0);
        summed_trace += run_trace.at(2);
    }
    EXPECT_NEAR(summed_trace / 20.0, average_trace.at(2), 1e-10);
}

TEST_F(ExecuteTimeEvolutionTest, OptionalOutputsAreLeftOut) {
    solver_params["store_intermediate_results"] = false;
    py::dict output = simulator.execute_time_evolution(py::none(), ops_and_rates, initial_state, times, observables, solver_params);
    EXPECT_FALSE(output.contains("intermediate_states"));
    EXPECT_FALSE(output.contains("runs_trace"));
    EXPECT_FALSE(output.contains("runs_expectation_values"));
    EXPECT_TRUE(output.contains("final_state"));
}

TEST_F(ExecuteTimeEvolutionTest, ThreadCountDoesNotChangeTheResult) {
    py::dict two_threads = simulator.execute_time_evolution(py::none(), ops_and_rates, initial_state, times, observables, solver_params);
    solver_params["num_threads"] = 1;
    py::dict one_thread = simulator.execute_time_evolution(py::none(), ops_and_rates, initial_state, times, observables, solver_params);

    py::array_t<double> trace_two = two_threads["average_trace"].cast<py::array_t<double>>();
    py::array_t<double> trace_one = one_thread["average_trace"].cast<py::array_t<double>>();
    for (py::ssize_t k = 0; k < 3; ++k) {
        EXPECT_DOUBLE_EQ(trace_two.at(k), trace_one.at(k));
    }
}

TEST_F(ExecuteTimeEvolutionTest, PythonRateErrorsReachTheCaller) {
    py::list failing;
    failing.append(py::make_tuple(to_numpy(DenseMatrix(sigma_minus())), py::eval("lambda t: 1.0 / (t - t)")));
    EXPECT_THROW(simulator.execute_time_evolution(py::none(), failing, initial_state, times, observables, solver_params), py::error_already_set);
}

TEST_F(ExecuteTimeEvolutionTest, RejectsMissingInputs) {
    py::list no_ops;
    EXPECT_THROW(simulator.execute_time_evolution(py::none(), no_ops, initial_state, times, observables, solver_params), py::value_error);
    EXPECT_THROW(simulator.execute_time_evolution(py::none(), ops_and_rates, initial_state, py::eval("[]"), observables, solver_params), py::value_error);
}
