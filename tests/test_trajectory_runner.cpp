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
#include <stdexcept>
#include "libs/pybind.h"
#include "nonmarkovian/trajectory_runner.h"
#include "test_helpers.h"

using namespace test_utils;

// Jump engine with a scripted list of collapses and a fixed state
class ScriptedJumpIntegrator : public JumpIntegrator {
   private:
    std::vector<CollapseEvent> script;
    std::vector<CollapseEvent> collapses;
    DenseMatrix state;
    double t_current = 0.0;

   public:
    int set_state_calls = 0;
    std::uint64_t last_seed = 0;

    ScriptedJumpIntegrator() {}
    ScriptedJumpIntegrator(const std::vector<CollapseEvent>& script_) : script(script_) {}

    void set_state(double t, const DenseMatrix& state_, std::uint64_t seed) override {
        t_current = t;
        state = state_;
        collapses.clear();
        last_seed = seed;
        set_state_calls++;
    }

    DenseMatrix integrate(double t) override {
        if (t < t_current) {
            throw py::value_error("Cannot integrate backwards in time.");
        }
        for (const auto& event : script) {
            if (event.time > t_current && event.time <= t) {
                collapses.push_back(event);
            }
        }
        t_current = t;
        return state;
    }

    const std::vector<CollapseEvent>& get_collapses() const override { return collapses; }
    double get_current_time() const override { return t_current; }
};

class TrajectoryRunnerTest : public ::testing::Test {
   protected:
    NMSimConfig config;

    // sigma = 4, a jump on operator 1 flips the sign of the martingale
    std::vector<OperatorRatePair> ops = {{sigma_minus(), constant_rate(1.0)}, {sigma_plus(), constant_rate(-2.0)}};
    double a = 1.0;
};

TEST_F(TrajectoryRunnerTest, StepWeightsByTheMartingale) {
    std::vector<CollapseEvent> script = {{0.5, 1}};
    ScriptedJumpIntegrator integrator(script);
    TrajectoryRunner runner(integrator, ops, a, config);
    runner.start(ket(1), 0.0, 17);
    EXPECT_EQ(integrator.set_state_calls, 1);
    EXPECT_EQ(integrator.last_seed, 17u);

    DenseMatrix rho = runner.step(0.25);
    EXPECT_NEAR(real_trace(rho), std::exp(1.0), 1e-9);
    expect_matrix_near(rho, std::exp(1.0) * DenseMatrix(projector(1)), 1e-9);

    rho = runner.step(1.0);
    EXPECT_NEAR(real_trace(rho), -std::exp(4.0), 1e-8);
    EXPECT_NEAR(runner.current_martingale(), -std::exp(4.0), 1e-8);
}

TEST_F(TrajectoryRunnerTest, AcceptsDensityMatrixStates) {
    ScriptedJumpIntegrator integrator;
    TrajectoryRunner runner(integrator, ops, a, config);
    DenseMatrix rho_0 = 0.5 * DenseMatrix::Identity(2, 2);
    runner.start(rho_0, 0.0, 1);
    DenseMatrix rho = runner.step(0.5);
    expect_matrix_near(rho, std::exp(2.0) * rho_0, 1e-9);
}

TEST_F(TrajectoryRunnerTest, StepBeforeStartFails) {
    ScriptedJumpIntegrator integrator;
    TrajectoryRunner runner(integrator, ops, a, config);
    EXPECT_THROW(runner.step(1.0), std::runtime_error);
}

TEST_F(TrajectoryRunnerTest, BackwardStepFails) {
    ScriptedJumpIntegrator integrator;
    TrajectoryRunner runner(integrator, ops, a, config);
    runner.start(ket(0), 1.0, 1);
    EXPECT_THROW(runner.step(0.5), py::value_error);
}

TEST_F(TrajectoryRunnerTest, RunOneTrajectory) {
    std::vector<CollapseEvent> script = {{0.5, 1}};
    ScriptedJumpIntegrator integrator(script);
    TrajectoryRunner runner(integrator, ops, a, config);
    std::vector<double> times = {0.0, 0.5, 1.0};
    std::vector<SparseMatrix> observables = {sparse_identity(2), projector(0)};

    std::pair<std::uint64_t, TrajectoryResult> output = runner.run_one_trajectory(31, ket(1), times, observables);
    EXPECT_EQ(output.first, 31u);
    const TrajectoryResult& result = output.second;
    EXPECT_EQ(result.get_seed(), 31u);
    EXPECT_EQ(result.get_times(), times);

    // The jump at 0.5 is already included at 0.5
    std::vector<double> expected = {1.0, -std::exp(2.0), -std::exp(4.0)};
    ASSERT_EQ(result.get_trace().size(), 3u);
    ASSERT_EQ(result.get_states().size(), 3u);
    for (size_t k = 0; k < times.size(); ++k) {
        EXPECT_NEAR(result.get_trace()[k], expected[k], 1e-8);
        EXPECT_NEAR(real_trace(result.get_states()[k]), result.get_trace()[k], 1e-12);
        EXPECT_NEAR(result.get_expect()[0][k], result.get_trace()[k], 1e-12);
        EXPECT_NEAR(result.get_expect()[1][k], 0.0, 1e-12);
    }
    expect_matrix_near(result.get_final_state(), result.get_states()[2], 0.0);

    ASSERT_EQ(result.get_collapses().size(), 1u);
    EXPECT_EQ(result.get_collapses()[0].index, 1);
    EXPECT_EQ(result.get_collapses()[0].time, 0.5);
}

TEST_F(TrajectoryRunnerTest, RunPrecomputesOncePerTime) {
    ScriptedJumpIntegrator integrator;
    TrajectoryRunner runner(integrator, ops, a, config);
    std::vector<double> times = {0.0, 0.1, 0.2, 0.30000000000000004, 0.7};
    std::vector<SparseMatrix> observables;
    runner.run_one_trajectory(1, ket(0), times, observables);

    const std::map<double, double>& cache = runner.get_tracker().get_cache();
    ASSERT_EQ(cache.size(), times.size());
    for (double t : times) {
        EXPECT_EQ(cache.count(t), 1u);
    }
}

TEST_F(TrajectoryRunnerTest, RunWithoutStoredStates) {
    config.set_store_intermediate_results(false);
    ScriptedJumpIntegrator integrator;
    TrajectoryRunner runner(integrator, ops, a, config);
    std::vector<double> times = {0.0, 0.5};
    std::vector<SparseMatrix> observables = {projector(1)};
    TrajectoryResult result = runner.run_one_trajectory(1, ket(1), times, observables).second;
    EXPECT_TRUE(result.get_states().empty());
    EXPECT_NEAR(real_trace(result.get_final_state()), std::exp(2.0), 1e-9);
    EXPECT_NEAR(result.get_expect()[0][1], std::exp(2.0), 1e-9);
}

TEST_F(TrajectoryRunnerTest, RunNeedsTimes) {
    ScriptedJumpIntegrator integrator;
    TrajectoryRunner runner(integrator, ops, a, config);
    std::vector<double> times;
    std::vector<SparseMatrix> observables;
    EXPECT_THROW(runner.run_one_trajectory(1, ket(1), times, observables), py::value_error);
}
