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

#ifndef MHE_ESTIMATOR__MHE_ESTIMATOR_HPP_
#define MHE_ESTIMATOR__MHE_ESTIMATOR_HPP_

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <casadi/casadi.hpp>

#include <base_process_model/base_process_model.hpp>
#include <base_process_model/variable_struct.hpp>
#include <mhe_utils/cycle_profiler.hpp>
#include <mhe_utils/logging.hpp>
#include "mhe_estimator/mhe_estimator_config.hpp"
#include "mhe_estimator/mhe_exceptions.hpp"
#include "mhe_estimator/mhe_history.hpp"
#include "mhe_estimator/mhe_problem.hpp"
#include "mhe_estimator/parameter_partition.hpp"

namespace mhe
{
namespace estimator
{
namespace mhe_estimator
{
enum MHEStage : uint8_t
{
  UNCONFIGURED,
  READY_FOR_ASSEMBLY,
  ASSEMBLED
};

enum MHEVariable : uint8_t
{
  X,  // states
  U,  // inputs
  Z,  // algebraic variables
  P,  // all model parameters
  TVP,  // time-varying parameters
  Y_MEAS,  // measured values
  Y_CALC,  // measurement expressions of the model
  AUX,  // auxiliary expressions of the model
  X_PREV,  // state estimate of the previous window
  P_EST,  // estimated parameters
  P_PREV  // parameter estimate of the previous window
};

class MHEEstimator
{
public:
  typedef std::shared_ptr<MHEEstimator> SharedPtr;
  typedef std::unique_ptr<MHEEstimator> UniquePtr;
  typedef std::function<StructValue(const double &)> TemplateFunction;

  /**
   * @brief Create an estimator.
   *
   * @param mhe_config estimator settings. The estimator keeps its own copy.
   * @param model a model that is already set up.
   * @param p_est_list names of the model parameters to estimate. all others are fixed.
   *
   * @throws ConfigurationException if the model is not set up
   *  or an estimated parameter does not exist.
   */
  MHEEstimator(
    MHEEstimatorConfig::SharedPtr mhe_config,
    BaseProcessModel::SharedPtr model,
    const std::vector<std::string> & p_est_list = {});
  MHEEstimator(const MHEEstimator &) = delete;
  MHEEstimator & operator=(const MHEEstimator &) = delete;

  const MHEEstimatorConfig & get_config() const;
  const BaseProcessModel & get_model() const;
  const ParameterPartition & get_partition() const;
  const MHEStage & get_stage() const;

  /**
   * @brief Overwrite settings. Recognized keys are the fields of MHEEstimatorConfig.
   *  Unknown keys are ignored with a warning.
   *
   * @throws StateException if the estimator is already set up.
   */
  void set_param(const casadi::Dict & params);

  /**
   * @brief Symbols to build the objective and constraints with.
   */
  casadi::SX get_variable(const MHEVariable & variable) const;

  /**
   * @brief Set the objective of the estimation problem.
   *
   * @param stage_cost scalar cost of one step. may depend on `X`, `U`, `Z`, `TVP`, `P`
   *  and `Y_MEAS` (and therefore `Y_CALC`).
   * @param arrival_cost scalar cost of the start of the window. may depend on `X`, `X_PREV`,
   *  `P_EST` and `P_PREV`.
   *
   * @throws ShapeMismatchException if a cost is not scalar.
   * @throws DomainException if a cost depends on symbols outside of its domain.
   * @throws StateException if the estimator is already set up.
   */
  void set_objective(const casadi::SX & stage_cost, const casadi::SX & arrival_cost);

  /**
   * @brief Weighted least squares objective.
   *  stage cost (y_meas - y_calc)' P_v (y_meas - y_calc),
   *  arrival cost (x - x_prev)' P_x (x - x_prev) + (p_est - p_prev)' P_p (p_est - p_prev).
   */
  void set_default_objective(
    const casadi::DM & P_x, const casadi::DM & P_v,
    const casadi::DM & P_p = casadi::DM());

  /**
   * @brief Add the path constraint `expr <= ub` on every step of the window.
   *
   * @param expr column expression of `X`, `U`, `Z`, `TVP` and `P`.
   */
  void set_nl_cons(const std::string & name, const casadi::SX & expr, const casadi::DM & ub);

  /**
   * @brief Bounds and scaling in physical units. `PARAMETER` refers to the estimated parameters.
   *  A scalar value applies to every element of the variable.
   *
   * @throws ConfigurationException if the variable does not exist or can not be bounded.
   * @throws BoundsException if a scaling factor is not positive.
   */
  void set_lower_bound(const VariableType & type, const std::string & name, const casadi::DM & lb);
  void set_upper_bound(const VariableType & type, const std::string & name, const casadi::DM & ub);
  void set_scaling(const VariableType & type, const std::string & name, const casadi::DM & scaling);
  const VariableBounds & get_bounds(const VariableType & type) const;

  /**
   * @brief Time-varying parameters of the whole window, entry `_tvp` repeated n_horizon times.
   */
  StructValue get_tvp_template() const;
  void set_tvp_fun(const TemplateFunction & tvp_fun);

  /**
   * @brief Values of the fixed parameters.
   */
  StructValue get_p_template() const;
  void set_p_fun(const TemplateFunction & p_fun);

  /**
   * @brief Measurements of the whole window, entry `y_meas` repeated n_horizon times.
   *  The last repetition is the most recent measurement.
   */
  StructValue get_y_template() const;
  void set_y_fun(const TemplateFunction & y_fun);

  /**
   * @brief Check that the estimator can be assembled and inject the default callbacks.
   *
   * @throws ConfigurationException if a mandatory registration is missing.
   * @throws BoundsException if a lower bound exceeds its upper bound.
   */
  void check_validity();

  /**
   * @brief Assemble the estimation problem. Irreversible.
   *
   * @throws StateException if the estimator is already set up.
   */
  void setup();

  /**
   * @brief Set the current state estimate, which is the previous state of the next window.
   */
  void set_initial_state(const casadi::DM & x0, const bool & reset_history = false);
  void set_initial_parameter_estimate(const casadi::DM & p_est0);
  void set_initial_input(const casadi::DM & u0);
  void set_initial_algebraic(const casadi::DM & z0);

  /**
   * @brief Fill the initial guess of every point of the window with the current values.
   *
   * @throws StateException if the estimator is not set up.
   */
  void set_initial_guess();

  /**
   * @brief Clear the history. Estimates and time are kept.
   */
  void reset_history();

  /**
   * @brief Run one estimation step.
   *
   * @param y0 newest measurement, ny x 1.
   * @return casadi::DM state estimate at the end of the window.
   *
   * @throws StateException if the estimator is not set up.
   * @throws ShapeMismatchException if the measurement or a callback output is malformed.
   */
  casadi::DM make_step(const casadi::DM & y0);

  const casadi::DM & get_x0() const;
  const casadi::DM & get_p_est0() const;
  const casadi::DM & get_u0() const;
  const casadi::DM & get_z0() const;
  const double & get_t0() const;

  const MHEHistory & get_history() const;
  const MHEProblem & get_problem() const;
  const casadi::DM & get_opt_x_num() const;
  const casadi::DM & get_opt_p_num() const;
  const casadi::DM & get_opt_aux_num() const;
  const casadi::DM & get_lam_g_num() const;
  const casadi::Dict & get_solver_stats() const;

  /**
   * @brief Solver wall time (ms) and iteration count of the recent steps.
   */
  utils::Profile<double> get_solve_time_profile();
  utils::Profile<double> get_iteration_profile();

  /**
   * @brief Get access to the estimator logger to listen to callbacks.
   *
   * @return utils::Logger& internal logger object.
   */
  utils::Logger & get_logger();

protected:
  MHEEstimatorConfig config_;
  BaseProcessModel::SharedPtr model_ {};
  ParameterPartition partition_;
  utils::Logger logger_;
  MHEStage stage_;

  // symbols of the arrival cost
  casadi::SX x_prev_;
  casadi::SX p_est_;
  casadi::SX p_prev_;

  std::optional<casadi::Function> stage_cost_fun_;
  std::optional<casadi::Function> arrival_cost_fun_;
  VariableStruct nl_cons_struct_;
  std::vector<casadi::SX> nl_cons_;
  std::vector<casadi::DM> nl_cons_ub_;
  std::map<VariableType, VariableBounds> bounds_;

  std::optional<TemplateFunction> tvp_fun_;
  std::optional<TemplateFunction> p_fun_;
  std::optional<TemplateFunction> y_fun_;
  bool tvp_fun_injected_;
  bool p_fun_injected_;
  bool y_fun_injected_;

  MHEProblem::SharedPtr problem_ {};
  casadi::DM opt_x_num_;
  casadi::DM opt_p_num_;
  casadi::DM opt_aux_num_;
  casadi::DM lam_g_num_;
  casadi::Dict solver_stats_;

  casadi::DM x0_;
  casadi::DM p_est0_;
  casadi::DM u0_;
  casadi::DM z0_;
  double t0_;

  MHEHistory history_;
  utils::CycleProfiler<double> solve_time_profiler_;
  utils::CycleProfiler<double> iteration_profiler_;

  /**
   * @brief Guarded lifecycle transition.
   *
   * @throws StateException if the transition is not allowed.
   */
  void transition(const MHEStage & next);

  /**
   * @brief Called by every call that changes the problem structure.
   *  Falls back to UNCONFIGURED if the estimator was validated already.
   */
  void on_structure_change(const std::string & what);

  VariableBounds & bounds_of(const VariableType & type, const std::string & name);
  void check_shape(const std::string & what, const casadi::DM & value, const size_t & n) const;
  void check_template(
    const std::string & what, const StructValue & value,
    const StructValue & tmpl) const;
  StructValue default_y_fun(const double & t) const;
  casadi::Dict config_to_dict() const;
};
}  // namespace mhe_estimator
}  // namespace estimator
}  // namespace mhe
#endif  // MHE_ESTIMATOR__MHE_ESTIMATOR_HPP_
