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

#ifndef MHE_ESTIMATOR__MHE_PROBLEM_HPP_
#define MHE_ESTIMATOR__MHE_PROBLEM_HPP_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <casadi/casadi.hpp>

#include <base_process_model/base_process_model.hpp>
#include <base_process_model/variable_struct.hpp>
#include "mhe_estimator/mhe_estimator_config.hpp"
#include "mhe_estimator/parameter_partition.hpp"

namespace mhe
{
namespace estimator
{
namespace mhe_estimator
{
using mhe::process_model::base_process_model::BaseProcessModel;
using mhe::process_model::base_process_model::Block;
using mhe::process_model::base_process_model::StructValue;
using mhe::process_model::base_process_model::VariableType;

enum ConstraintKind : uint8_t
{
  DEFECT,
  CONTINUITY,
  PATH
};

/**
 * @brief A group of rows of the constraint vector created for one horizon step.
 */
struct ConstraintBlock
{
  ConstraintKind kind;
  casadi_int step;
  casadi_int offset;
  casadi_int size;
};

/**
 * @brief Bounds and scaling of one variable category in physical units.
 */
struct VariableBounds
{
  StructValue lb;
  StructValue ub;
  StructValue scaling;

  VariableBounds();
  explicit VariableBounds(const VariableStruct & layout);

  /**
   * @brief Labels of the components whose lower bound exceeds the upper bound.
   */
  std::vector<std::string> violations(const std::string & prefix) const;
};

/**
 * @brief The assembled estimation problem.
 *
 * Decision variables `opt_x` (scaled):
 * - `_x` the state at the start of the window followed by, for every step,
 *   the collocation points and the state at the end of the step.
 * - `_z` algebraic variables, one per point of every step.
 * - `_u` one input per step.
 * - `_p_est` the estimated parameters.
 *
 * Parameters `opt_p`: `_x_prev`, `_p_prev`, `_p_set`, `_tvp` (per step), `_y_meas` (per step).
 */
struct MHEProblem
{
  typedef std::shared_ptr<MHEProblem> SharedPtr;

  casadi_int n_horizon;
  casadi_int n_coll_points;  // intermediate points of one step, 0 for discrete models

  VariableStruct opt_x_struct;
  VariableStruct opt_p_struct;
  VariableStruct opt_aux_struct;

  casadi::SX opt_x;
  casadi::SX opt_x_unscaled;
  casadi::SX opt_p;
  casadi::SX opt_aux;
  casadi::SX objective;
  casadi::SX g;

  casadi::DM opt_x_scaling;
  casadi::DM lb_opt_x;
  casadi::DM ub_opt_x;
  casadi::DM lb_g;
  casadi::DM ub_g;

  std::vector<ConstraintBlock> constraint_blocks;
  casadi_int n_stage_costs;

  casadi::Function solver;
  casadi::Function opt_aux_expression_fun;  // (opt_x, opt_p) -> (opt_aux)

  /**
   * @brief Points of the state trajectory in one step, the end of the step included.
   */
  casadi_int points_per_step() const;

  /**
   * @brief Block of the state at step k, point c of that step. c = -1 is the end of step k.
   *  Step 0 only holds the state at the start of the window.
   */
  Block x_block(const casadi_int & k, const casadi_int & c = -1) const;
  Block z_block(const casadi_int & k, const casadi_int & c = -1) const;
  Block u_block(const casadi_int & k) const;
  Block p_est_block() const;

  casadi_int count_constraints(const ConstraintKind & kind) const;
};

/**
 * @brief Builds an MHEProblem from a model, an objective and the declared bounds.
 */
class MHEProblemAssembler
{
public:
  MHEProblemAssembler(
    const BaseProcessModel & model, const ParameterPartition & partition,
    const MHEEstimatorConfig & config);

  /**
   * @brief Bounds for STATE, INPUT, ALGEBRAIC or, with PARAMETER, the estimated parameters.
   */
  void set_bounds(const VariableType & type, const VariableBounds & bounds);

  /**
   * @param stage_cost inputs `x`, `u`, `z`, `tvp`, `p`, `y_meas`, output `cost`.
   * @param arrival_cost inputs `x`, `x_prev`, `p_est`, `p_prev`, output `cost`.
   */
  void set_objective(const casadi::Function & stage_cost, const casadi::Function & arrival_cost);

  /**
   * @param nl_cons inputs `x`, `u`, `z`, `tvp`, `p`, output `nl_cons`, constrained to `<= ub`.
   */
  void set_nl_cons(const casadi::Function & nl_cons, const casadi::DM & ub);

  /**
   * @brief Build the problem and its solver.
   *
   * @throws ConfigurationException if the discretization settings are not supported.
   */
  MHEProblem::SharedPtr assemble() const;

  /**
   * @brief Merge user options over the default solver options.
   */
  static casadi::Dict solver_options(const casadi::Dict & user_opts);

protected:
  const BaseProcessModel & model_;
  const ParameterPartition & partition_;
  const MHEEstimatorConfig & config_;

  std::map<VariableType, VariableBounds> bounds_;
  casadi::Function stage_cost_;
  casadi::Function arrival_cost_;
  casadi::Function nl_cons_;
  casadi::DM nl_cons_ub_;

  casadi::Function transition_function(casadi_int & n_coll_points) const;
};
}  // namespace mhe_estimator
}  // namespace estimator
}  // namespace mhe
#endif  // MHE_ESTIMATOR__MHE_PROBLEM_HPP_
