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

#ifndef MHE_ESTIMATOR__ROS_PARAM_LOADER_HPP_
#define MHE_ESTIMATOR__ROS_PARAM_LOADER_HPP_

#include <memory>
#include <string>

#include <rclcpp/rclcpp.hpp>

#include "mhe_estimator/mhe_estimator_config.hpp"

namespace mhe
{
namespace estimator
{
namespace mhe_estimator
{
/**
 * @brief Read the `mhe.*` parameters of a node.
 *  `mhe.n_horizon`, `mhe.t_step`, `mhe.max_iter`, `mhe.tol`, `mhe.max_cpu_time`
 *  and `mhe.verbose` are required. The optimizer settings are folded into `nlpsol_opts`.
 */
MHEEstimatorConfig::SharedPtr load_parameters(rclcpp::Node * node);
}  // namespace mhe_estimator
}  // namespace estimator
}  // namespace mhe
#endif  // MHE_ESTIMATOR__ROS_PARAM_LOADER_HPP_
