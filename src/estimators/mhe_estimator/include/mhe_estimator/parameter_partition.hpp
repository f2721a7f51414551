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

#ifndef MHE_ESTIMATOR__PARAMETER_PARTITION_HPP_
#define MHE_ESTIMATOR__PARAMETER_PARTITION_HPP_

#include <memory>
#include <string>
#include <vector>

#include <casadi/casadi.hpp>

#include <base_process_model/variable_struct.hpp>

namespace mhe
{
namespace estimator
{
namespace mhe_estimator
{
using mhe::process_model::base_process_model::VariableStruct;

/**
 * @brief Splits the model parameters into an estimated and a fixed subset.
 * Both subsets keep the relative order of the model parameters.
 */
class ParameterPartition
{
public:
  typedef std::shared_ptr<ParameterPartition> SharedPtr;

  /**
   * @param p_struct layout of the full model parameter vector.
   * @param p_est_names names of the estimated parameters.
   *
   * @throws ConfigurationException if an estimated parameter is not a model parameter.
   */
  ParameterPartition(const VariableStruct & p_struct, const std::vector<std::string> & p_est_names);

  const VariableStruct & get_p_struct() const;
  const VariableStruct & get_p_est_struct() const;
  const VariableStruct & get_p_fix_struct() const;
  bool is_estimated(const std::string & name) const;

  casadi_int n_est() const;
  casadi_int n_fix() const;

  /**
   * @brief Function (p_est, p_fix) -> (p) in the model parameter order.
   */
  const casadi::Function & recombine_function() const;
  casadi::SX recombine(const casadi::SX & p_est, const casadi::SX & p_fix) const;
  casadi::DM recombine(const casadi::DM & p_est, const casadi::DM & p_fix) const;

protected:
  VariableStruct p_struct_;
  VariableStruct p_est_struct_;
  VariableStruct p_fix_struct_;
  casadi::Function recombine_;
};
}  // namespace mhe_estimator
}  // namespace estimator
}  // namespace mhe
#endif  // MHE_ESTIMATOR__PARAMETER_PARTITION_HPP_
