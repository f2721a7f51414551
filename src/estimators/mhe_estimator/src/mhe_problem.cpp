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

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <mhe_utils/utils.hpp>

#include "mhe_estimator/mhe_exceptions.hpp"
#include "mhe_estimator/mhe_problem.hpp"

namespace mhe
{
namespace estimator
{
namespace mhe_estimator
{
using mhe::process_model::base_process_model::ModelType;
using mhe::process_model::base_process_model::get_block;
using mhe::process_model::base_process_model::set_block;

VariableBounds::VariableBounds()
{
}

VariableBounds::VariableBounds(const VariableStruct & layout)
: lb(layout, -casadi::inf), ub(layout, casadi::inf), scaling(layout, 1.0)
{
}

std::vector<std::string> VariableBounds::violations(const std::string & prefix) const
{
  std::vector<std::string> offending;
  const auto labels = lb.labels();
  const auto lb_v = lb.cat().get_elements();
  const auto ub_v = ub.cat().get_elements();
  for (size_t i = 0; i < labels.size(); i++) {
    if (lb_v[i] > ub_v[i]) {
      offending.push_back(prefix + labels[i]);
    }
  }
  return offending;
}

casadi_int MHEProblem::points_per_step() const
{
  return n_coll_points + 1;
}

Block MHEProblem::x_block(const casadi_int & k, const casadi_int & c) const
{
  const auto n = points_per_step();
  if (k < 0 || k > n_horizon) {
    throw std::out_of_range("State step " + std::to_string(k) + " is outside of the horizon.");
  }
  if (k == 0) {
    if (c != 0 && c != -1) {
      throw std::out_of_range("Step 0 only holds the initial state of the window.");
    }
    return opt_x_struct.block("_x", 0);
  }
  const auto cn = c < 0 ? c + n : c;
  if (cn < 0 || cn >= n) {
    throw std::out_of_range("State point " + std::to_string(c) + " is out of range.");
  }
  return opt_x_struct.block("_x", 1 + (k - 1) * n + cn);
}

Block MHEProblem::z_block(const casadi_int & k, const casadi_int & c) const
{
  const auto n = points_per_step();
  if (k < 0 || k >= n_horizon) {
    throw std::out_of_range("Algebraic step " + std::to_string(k) + " is outside of the horizon.");
  }
  const auto cn = c < 0 ? c + n : c;
  if (cn < 0 || cn >= n) {
    throw std::out_of_range("Algebraic point " + std::to_string(c) + " is out of range.");
  }
  return opt_x_struct.block("_z", k * n + cn);
}

Block MHEProblem::u_block(const casadi_int & k) const
{
  return opt_x_struct.block("_u", k);
}

Block MHEProblem::p_est_block() const
{
  return opt_x_struct.block("_p_est");
}

casadi_int MHEProblem::count_constraints(const ConstraintKind & kind) const
{
  casadi_int count = 0;
  for (const auto & block : constraint_blocks) {
    if (block.kind == kind) {
      count++;
    }
  }
  return count;
}

MHEProblemAssembler::MHEProblemAssembler(
  const BaseProcessModel & model,
  const ParameterPartition & partition,
  const MHEEstimatorConfig & config)
: model_(model), partition_(partition), config_(config)
{
  bounds_[VariableType::STATE] = VariableBounds(model_.get_struct(VariableType::STATE));
  bounds_[VariableType::INPUT] = VariableBounds(model_.get_struct(VariableType::INPUT));
  bounds_[VariableType::ALGEBRAIC] = VariableBounds(model_.get_struct(VariableType::ALGEBRAIC));
  bounds_[VariableType::PARAMETER] = VariableBounds(partition_.get_p_est_struct());
}

void MHEProblemAssembler::set_bounds(const VariableType & type, const VariableBounds & bounds)
{
  if (bounds_.count(type) == 0) {
    throw ConfigurationException("Bounds can not be set for this variable type.");
  }
  if (bounds.lb.layout() != bounds_.at(type).lb.layout()) {
    throw ShapeMismatchException("Bounds do not match the layout of the variables.");
  }
  bounds_[type] = bounds;
}

void MHEProblemAssembler::set_objective(
  const casadi::Function & stage_cost,
  const casadi::Function & arrival_cost)
{
  stage_cost_ = stage_cost;
  arrival_cost_ = arrival_cost;
}

void MHEProblemAssembler::set_nl_cons(const casadi::Function & nl_cons, const casadi::DM & ub)
{
  nl_cons_ = nl_cons;
  nl_cons_ub_ = ub;
}

casadi::Dict MHEProblemAssembler::solver_options(const casadi::Dict & user_opts)
{
  auto opts = casadi::Dict{
    {"ipopt.linear_solver", "mumps"},
    {"ipopt.print_level", 0},
    {"ipopt.sb", "yes"},
    {"print_time", false},
    {"error_on_fail", false}
  };
  for (const auto & kv : user_opts) {
    opts[kv.first] = kv.second;
  }
  return opts;
}

casadi::Function MHEProblemAssembler::transition_function(casadi_int & n_coll_points) const
{
  const std::map<std::string, casadi_int> n{
    {"x", static_cast<casadi_int>(model_.nx())},
    {"u", static_cast<casadi_int>(model_.nu())},
    {"z", static_cast<casadi_int>(model_.nz())},
    {"tvp", static_cast<casadi_int>(model_.ntvp())},
    {"p", static_cast<casadi_int>(model_.np())}
  };
  if (model_.get_model_type() == ModelType::DISCRETE) {
    n_coll_points = 0;
    return utils::discrete_transition_function(n, model_.rhs_function(), model_.alg_function());
  }

  if (config_.state_discretization != "collocation") {
    throw ConfigurationException(
            "State discretization \"" + config_.state_discretization +
            "\" is not supported for continuous models.");
  }
  if (config_.collocation_type != "radau" && config_.collocation_type != "legendre") {
    throw ConfigurationException(
            "Collocation type \"" + config_.collocation_type + "\" is not supported.");
  }
  if (config_.collocation_deg < 1 || config_.collocation_deg > 9) {
    throw ConfigurationException("Collocation degree must be between 1 and 9.");
  }
  if (config_.collocation_ni < 1) {
    throw ConfigurationException("At least one finite element per step is required.");
  }
  n_coll_points = config_.collocation_ni * (config_.collocation_deg + 1);
  return utils::collocation_function(
    n, config_.t_step, config_.collocation_deg, config_.collocation_ni,
    config_.collocation_type, model_.rhs_function(), model_.alg_function());
}

MHEProblem::SharedPtr MHEProblemAssembler::assemble() const
{
  using casadi::DM;
  using casadi::SX;
  using casadi::SXDict;

  auto problem = std::make_shared<MHEProblem>();
  const auto N = config_.n_horizon;
  problem->n_horizon = N;
  problem->n_stage_costs = 0;
  const auto ifcn = transition_function(problem->n_coll_points);
  const auto n_pts = problem->points_per_step();

  // decision variables, parameters and auxiliary expressions
  const auto & x_struct = model_.get_struct(VariableType::STATE);
  const auto & z_struct = model_.get_struct(VariableType::ALGEBRAIC);
  const auto & u_struct = model_.get_struct(VariableType::INPUT);
  auto & ox_struct = problem->opt_x_struct;
  ox_struct.add_repeated_struct_entry("_x", 1 + N * n_pts, x_struct);
  ox_struct.add_repeated_struct_entry("_z", N * n_pts, z_struct);
  ox_struct.add_repeated_struct_entry("_u", N, u_struct);
  ox_struct.add_struct_entry("_p_est", partition_.get_p_est_struct());

  auto & op_struct = problem->opt_p_struct;
  op_struct.add_struct_entry("_x_prev", x_struct);
  op_struct.add_struct_entry("_p_prev", partition_.get_p_est_struct());
  op_struct.add_struct_entry("_p_set", partition_.get_p_fix_struct());
  op_struct.add_repeated_struct_entry(
    "_tvp", N, model_.get_struct(VariableType::TIME_VARYING_PARAMETER));
  op_struct.add_repeated_struct_entry("_y_meas", N, model_.get_y_struct());

  problem->opt_aux_struct.add_repeated_struct_entry("_aux", N, model_.get_aux_struct());

  // scaling and bounds, the solver works on opt_x = physical / scaling
  const auto n_opt_x = ox_struct.size();
  problem->opt_x_scaling = DM::ones(n_opt_x, 1);
  problem->lb_opt_x = -casadi::inf * DM::ones(n_opt_x, 1);
  problem->ub_opt_x = casadi::inf * DM::ones(n_opt_x, 1);
  auto apply_bounds = [&problem](const VariableBounds & bounds, const Block & block) {
      set_block(problem->opt_x_scaling, block, bounds.scaling.cat());
      set_block(problem->lb_opt_x, block, bounds.lb.cat() / bounds.scaling.cat());
      set_block(problem->ub_opt_x, block, bounds.ub.cat() / bounds.scaling.cat());
    };
  for (casadi_int i = 0; i < 1 + N * n_pts; i++) {
    apply_bounds(bounds_.at(VariableType::STATE), ox_struct.block("_x", i));
  }
  for (casadi_int i = 0; i < N * n_pts; i++) {
    apply_bounds(bounds_.at(VariableType::ALGEBRAIC), ox_struct.block("_z", i));
  }
  for (casadi_int k = 0; k < N; k++) {
    apply_bounds(bounds_.at(VariableType::INPUT), problem->u_block(k));
  }
  apply_bounds(bounds_.at(VariableType::PARAMETER), problem->p_est_block());

  problem->opt_x = SX::sym("opt_x", n_opt_x, 1);
  problem->opt_p = SX::sym("opt_p", op_struct.size(), 1);
  problem->opt_x_unscaled = problem->opt_x * SX(problem->opt_x_scaling);

  const auto & ox = problem->opt_x_unscaled;
  const auto & op = problem->opt_p;
  auto xu = [&](const casadi_int & k, const casadi_int & c) {
      return get_block(ox, problem->x_block(k, c));
    };
  auto zu = [&](const casadi_int & k, const casadi_int & c) {
      return get_block(ox, problem->z_block(k, c));
    };
  auto uu = [&](const casadi_int & k) {
      return get_block(ox, problem->u_block(k));
    };
  const auto p_est = get_block(ox, problem->p_est_block());
  const auto x_prev = get_block(op, op_struct.block("_x_prev"));
  const auto p_prev = get_block(op, op_struct.block("_p_prev"));
  const auto p_set = get_block(op, op_struct.block("_p_set"));
  const auto p = partition_.recombine(p_est, p_set);

  // arrival cost, in solver units
  const auto x_scaling = SX(bounds_.at(VariableType::STATE).scaling.cat());
  const auto p_est_scaling = SX(bounds_.at(VariableType::PARAMETER).scaling.cat());
  SX obj = arrival_cost_(
    SXDict{{"x", get_block(problem->opt_x, problem->x_block(0, -1))},
      {"x_prev", x_prev / x_scaling},
      {"p_est", get_block(problem->opt_x, problem->p_est_block())},
      {"p_prev", p_prev / p_est_scaling}}).at("cost");

  std::vector<SX> g;
  std::vector<DM> lb_g;
  std::vector<DM> ub_g;
  casadi_int offset = 0;
  auto add_constraint = [&](
    const ConstraintKind & kind, const casadi_int & k, const SX & expr,
    const DM & lb, const DM & ub) {
      problem->constraint_blocks.push_back(ConstraintBlock{kind, k, offset, expr.size1()});
      g.push_back(expr);
      lb_g.push_back(lb);
      ub_g.push_back(ub);
      offset += expr.size1();
    };

  std::vector<SX> aux;
  for (casadi_int k = 0; k < N; k++) {
    const auto tvp_k = get_block(op, op_struct.block("_tvp", k));
    const auto y_meas_k = get_block(op, op_struct.block("_y_meas", k));

    std::vector<SX> x_coll;
    for (casadi_int c = 0; c < n_pts - 1; c++) {
      x_coll.push_back(xu(k + 1, c));
    }
    std::vector<SX> z_k;
    for (casadi_int c = 0; c < n_pts; c++) {
      z_k.push_back(zu(k, c));
    }
    const auto step = ifcn(
      SXDict{{"x0", xu(k, -1)}, {"x_coll", utils::vertcat_column(x_coll)}, {"u", uu(k)},
        {"z", utils::vertcat_column(z_k)}, {"tvp", tvp_k}, {"p", p}});

    const auto & defect = step.at("g");
    add_constraint(
      ConstraintKind::DEFECT, k, defect, DM::zeros(defect.size1(), 1),
      DM::zeros(defect.size1(), 1));

    const auto continuity = step.at("xf") - xu(k + 1, -1);
    add_constraint(
      ConstraintKind::CONTINUITY, k, continuity, DM::zeros(continuity.size1(), 1),
      DM::zeros(continuity.size1(), 1));

    if (!nl_cons_.is_null()) {
      const auto nl_cons_k = nl_cons_(
        SXDict{{"x", xu(k, -1)}, {"u", uu(k)}, {"z", zu(k, -1)}, {"tvp", tvp_k}, {"p", p}}).at(
        "nl_cons");
      add_constraint(
        ConstraintKind::PATH, k, nl_cons_k, -casadi::inf * DM::ones(nl_cons_k.size1(), 1),
        nl_cons_ub_);
    }

    obj += stage_cost_(
      SXDict{{"x", xu(k + 1, -1)}, {"u", uu(k)}, {"z", zu(k, -1)}, {"tvp", tvp_k}, {"p", p},
        {"y_meas", y_meas_k}}).at("cost");
    problem->n_stage_costs++;

    aux.push_back(
      model_.aux_function()(
        SXDict{{"x", xu(k, -1)}, {"u", uu(k)}, {"z", zu(k, -1)}, {"tvp", tvp_k}, {"p", p}}).at(
        "aux"));
  }

  problem->objective = obj;
  problem->g = utils::vertcat_column(g);
  problem->lb_g = utils::vertcat_column(lb_g);
  problem->ub_g = utils::vertcat_column(ub_g);
  problem->opt_aux = utils::vertcat_column(aux);

  const auto nlp = SXDict{
    {"x", problem->opt_x}, {"f", problem->objective}, {"g", problem->g}, {"p", problem->opt_p}};
  problem->solver = casadi::nlpsol("S", "ipopt", nlp, solver_options(config_.nlpsol_opts));
  problem->opt_aux_expression_fun = casadi::Function(
    "opt_aux_expression_fun", {problem->opt_x, problem->opt_p}, {problem->opt_aux},
    {"opt_x", "opt_p"}, {"opt_aux"});
  return problem;
}
}  // namespace mhe_estimator
}  // namespace estimator
}  // namespace mhe
