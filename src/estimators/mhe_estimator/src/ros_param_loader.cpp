// Copyright 2023 Haoru Xue
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Lesser General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include <memory>
#include <string>
#include <vector>

#include <mhe_utils/ros_param_helper.hpp>

#include "mhe_estimator/ros_param_loader.hpp"

namespace mhe
{
namespace estimator
{
namespace mhe_estimator
{
MHEEstimatorConfig::SharedPtr load_parameters(rclcpp::Node * node)
{
  auto declare_double = [&](const char * name) {
      return mhe::utils::declare_parameter<double>(node, name);
    };
  auto declare_int = [&](const char * name) {
      return mhe::utils::declare_parameter<int64_t>(node, name);
    };
  auto declare_bool = [&](const char * name) {
      return mhe::utils::declare_parameter<bool>(node, name);
    };

  auto config = std::make_shared<MHEEstimatorConfig>();
  config->n_horizon = declare_int("mhe.n_horizon");
  config->t_step = declare_double("mhe.t_step");
  config->meas_from_data = mhe::utils::declare_parameter<bool>(
    node, "mhe.meas_from_data", config->meas_from_data);

  config->state_discretization = mhe::utils::declare_parameter<std::string>(
    node, "mhe.state_discretization", config->state_discretization);
  config->collocation_type = mhe::utils::declare_parameter<std::string>(
    node, "mhe.collocation_type", config->collocation_type);
  config->collocation_deg = mhe::utils::declare_parameter<int64_t>(
    node, "mhe.collocation_deg", config->collocation_deg);
  config->collocation_ni = mhe::utils::declare_parameter<int64_t>(
    node, "mhe.collocation_ni", config->collocation_ni);

  config->store_full_solution = mhe::utils::declare_parameter<bool>(
    node, "mhe.store_full_solution", config->store_full_solution);
  config->store_lagr_multiplier = mhe::utils::declare_parameter<bool>(
    node, "mhe.store_lagr_multiplier", config->store_lagr_multiplier);
  config->store_solver_stats = mhe::utils::declare_parameter<std::vector<std::string>>(
    node, "mhe.store_solver_stats", config->store_solver_stats);

  // optimizer settings
  const auto verbose = declare_bool("mhe.verbose");
  config->nlpsol_opts = casadi::Dict{
    {"ipopt.max_iter", static_cast<casadi_int>(declare_int("mhe.max_iter"))},
    {"ipopt.tol", declare_double("mhe.tol")},
    {"ipopt.max_cpu_time", declare_double("mhe.max_cpu_time")},
    {"ipopt.print_level", verbose ? 5 : 0},
    {"print_time", verbose}
  };
  return config;
}
}  // namespace mhe_estimator
}  // namespace estimator
}  // namespace mhe
