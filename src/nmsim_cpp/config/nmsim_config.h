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

// Config file
class NMSimConfig {
   private:
    double completeness_rtol = 1e-5;
    double completeness_atol = 1e-8;
    int num_trajectories = 500;
    int num_threads = 1;
    int seed = 42;
    double max_step = 0.01;
    int norm_steps = 5;
    double norm_t_tol = 1e-6;
    double norm_tol = 1e-4;
    double quadrature_tol = 1.49e-8;
    double state_atol = 1e-8;
    int quadrature_max_depth = 15;
    bool store_intermediate_results = true;
    bool keep_runs_results = false;
    bool verbose = false;

   public:
    // Getters
    double get_completeness_rtol() const { return completeness_rtol; }
    double get_completeness_atol() const { return completeness_atol; }
    int get_num_trajectories() const { return num_trajectories; }
    int get_num_threads() const { return num_threads; }
    int get_seed() const { return seed; }
    double get_max_step() const { return max_step; }
    int get_norm_steps() const { return norm_steps; }
    double get_norm_t_tol() const { return norm_t_tol; }
    double get_norm_tol() const { return norm_tol; }
    double get_quadrature_tol() const { return quadrature_tol; }
    int get_quadrature_max_depth() const { return quadrature_max_depth; }
    double get_state_atol() const { return state_atol; }
    bool get_store_intermediate_results() const { return store_intermediate_results; }
    bool get_keep_runs_results() const { return keep_runs_results; }
    bool get_verbose() const { return verbose; }

    // Setters
    void set_completeness_rtol(double value) { completeness_rtol = value; }
    void set_completeness_atol(double value) { completeness_atol = value; }
    void set_num_trajectories(int value) { num_trajectories = value; }
    void set_num_threads(int value) { num_threads = value; }
    void set_seed(int value) { seed = value; }
    void set_max_step(double value) { max_step = value; }
    void set_norm_steps(int value) { norm_steps = value; }
    void set_norm_t_tol(double value) { norm_t_tol = value; }
    void set_norm_tol(double value) { norm_tol = value; }
    void set_quadrature_tol(double value) { quadrature_tol = value; }
    void set_quadrature_max_depth(int value) { quadrature_max_depth = value; }
    void set_state_atol(double value) { state_atol = value; }
    void set_store_intermediate_results(bool value) { store_intermediate_results = value; }
    void set_keep_runs_results(bool value) { keep_runs_results = value; }
    void set_verbose(bool value) { verbose = value; }

    // Initialize with default values
    NMSimConfig() = default;

    // Can be called to validate the config and throw a py error if not
    void validate() const;
};
