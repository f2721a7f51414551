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

#ifndef MHE_ESTIMATOR__MHE_ESTIMATOR_CONFIG_HPP_
#define MHE_ESTIMATOR__MHE_ESTIMATOR_CONFIG_HPP_

#include <memory>
#include <string>
#include <vector>

#include <casadi/casadi.hpp>

namespace mhe
{
namespace estimator
{
namespace mhe_estimator
{
struct MHEEstimatorConfig
{
  typedef std::shared_ptr<MHEEstimatorConfig> SharedPtr;

  // horizon settings
  casadi_int n_horizon = 0;  // number of steps in the window, required
  double t_step = 0.0;  // sampling time (s), required
  bool meas_from_data = false;  // use the stored measurements as the measurement trajectory

  // discretization settings
  std::string state_discretization = "collocation";
  std::string collocation_type = "radau";  // "radau" or "legendre"
  casadi_int collocation_deg = 2;  // degree of the collocation polynomial
  casadi_int collocation_ni = 1;  // finite elements per step

  // recording
  bool store_full_solution = false;
  bool store_lagr_multiplier = true;
  std::vector<std::string> store_solver_stats = {"success", "t_wall_total"};

  // optimizer settings, merged over the default IPOPT options
  casadi::Dict nlpsol_opts = {};
};
}  // namespace mhe_estimator
}  // namespace estimator
}  // namespace mhe
#endif  // MHE_ESTIMATOR__MHE_ESTIMATOR_CONFIG_HPP_
