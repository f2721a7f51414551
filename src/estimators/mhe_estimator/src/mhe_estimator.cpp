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

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <mhe_utils/utils.hpp>

#include "mhe_estimator/mhe_estimator.hpp"

namespace mhe
{
namespace estimator
{
namespace mhe_estimator
{
using mhe::process_model::base_process_model::get_block;
using mhe::process_model::base_process_model::set_block;

namespace
{
const BaseProcessModel & checked_model(const BaseProcessModel::SharedPtr & model)
{
  if (!model) {
    throw ConfigurationException("No process model is given.");
  }
  if (!model->is_setup()) {
    throw ConfigurationException("The process model must be set up before creating an estimator.");
  }
  return *model;
}

const MHEEstimatorConfig & checked_config(const MHEEstimatorConfig::SharedPtr & mhe_config)
{
  if (!mhe_config) {
    throw ConfigurationException("No estimator configuration is given.");
  }
  return *mhe_config;
}

std::string category_name(const VariableType & type)
{
  switch (type) {
    case VariableType::STATE:
      return "_x";
    case VariableType::INPUT:
      return "_u";
    case VariableType::ALGEBRAIC:
      return "_z";
    case VariableType::PARAMETER:
      return "_p_est";
    default:
      return "_tvp";
  }
}

std::string stage_name(const MHEStage & stage)
{
  switch (stage) {
    case MHEStage::UNCONFIGURED:
      return "UNCONFIGURED";
    case MHEStage::READY_FOR_ASSEMBLY:
      return "READY_FOR_ASSEMBLY";
    default:
      return "ASSEMBLED";
  }
}
}  // namespace

MHEEstimator::MHEEstimator(
  MHEEstimatorConfig::SharedPtr mhe_config,
  BaseProcessModel::SharedPtr model,
  const std::vector<std::string> & p_est_list)
: config_(checked_config(mhe_config)), model_(model),
  partition_(checked_model(model).get_struct(VariableType::PARAMETER), p_est_list),
  logger_(), stage_(MHEStage::UNCONFIGURED),
  x_prev_(casadi::SX::sym("x_prev", model->nx(), 1)),
  p_est_(casadi::SX::sym("p_est", partition_.n_est(), 1)),
  p_prev_(casadi::SX::sym("p_prev", partition_.n_est(), 1)),
  tvp_fun_injected_(false), p_fun_injected_(false), y_fun_injected_(false),
  x0_(casadi::DM::zeros(model->nx(), 1)),
  p_est0_(casadi::DM::zeros(partition_.n_est(), 1)),
  u0_(casadi::DM::zeros(model->nu(), 1)),
  z0_(casadi::DM::zeros(model->nz(), 1)),
  t0_(0.0),
  history_(),
  solve_time_profiler_(100),  // last 100 steps
  iteration_profiler_(100)
{
  bounds_[VariableType::STATE] = VariableBounds(model_->get_struct(VariableType::STATE));
  bounds_[VariableType::INPUT] = VariableBounds(model_->get_struct(VariableType::INPUT));
  bounds_[VariableType::ALGEBRAIC] = VariableBounds(model_->get_struct(VariableType::ALGEBRAIC));
  bounds_[VariableType::PARAMETER] = VariableBounds(partition_.get_p_est_struct());
}

const MHEEstimatorConfig & MHEEstimator::get_config() const
{
  return config_;
}

const BaseProcessModel & MHEEstimator::get_model() const
{
  return *model_;
}

const ParameterPartition & MHEEstimator::get_partition() const
{
  return partition_;
}

const MHEStage & MHEEstimator::get_stage() const
{
  return stage_;
}

void MHEEstimator::set_param(const casadi::Dict & params)
{
  on_structure_change("set_param");
  for (const auto & kv : params) {
    const auto & key = kv.first;
    const auto & value = kv.second;
    if (key == "n_horizon") {
      config_.n_horizon = value.to_int();
    } else if (key == "t_step") {
      config_.t_step = value.to_double();
    } else if (key == "meas_from_data") {
      config_.meas_from_data = value.to_bool();
    } else if (key == "state_discretization") {
      config_.state_discretization = value.to_string();
    } else if (key == "collocation_type") {
      config_.collocation_type = value.to_string();
    } else if (key == "collocation_deg") {
      config_.collocation_deg = value.to_int();
    } else if (key == "collocation_ni") {
      config_.collocation_ni = value.to_int();
    } else if (key == "store_full_solution") {
      config_.store_full_solution = value.to_bool();
    } else if (key == "store_lagr_multiplier") {
      config_.store_lagr_multiplier = value.to_bool();
    } else if (key == "store_solver_stats") {
      config_.store_solver_stats = value.to_string_vector();
    } else if (key == "nlpsol_opts") {
      config_.nlpsol_opts = value.to_dict();
    } else {
      logger_.send_log(
        utils::LogLevel::WARN, "Unknown parameter \"" + key + "\" is ignored.");
    }
  }
}

casadi::SX MHEEstimator::get_variable(const MHEVariable & variable) const
{
  switch (variable) {
    case MHEVariable::X:
      return model_->x();
    case MHEVariable::U:
      return model_->u();
    case MHEVariable::Z:
      return model_->z();
    case MHEVariable::P:
      return model_->p();
    case MHEVariable::TVP:
      return model_->tvp();
    case MHEVariable::Y_MEAS:
      return model_->y();
    case MHEVariable::Y_CALC:
      return model_->y_expression();
    case MHEVariable::AUX:
      return model_->aux_expression();
    case MHEVariable::X_PREV:
      return x_prev_;
    case MHEVariable::P_EST:
      return p_est_;
    case MHEVariable::P_PREV:
      return p_prev_;
    default:
      throw ConfigurationException("Unknown estimator variable.");
  }
}

void MHEEstimator::set_objective(const casadi::SX & stage_cost, const casadi::SX & arrival_cost)
{
  on_structure_change("set_objective");
  if (!stage_cost.is_scalar()) {
    throw ShapeMismatchException("The stage cost must be scalar, got " + stage_cost.dim() + ".");
  }
  if (!arrival_cost.is_scalar()) {
    throw ShapeMismatchException(
            "The arrival cost must be scalar, got " + arrival_cost.dim() + ".");
  }

  const auto & m = *model_;
  std::vector<std::string> offending;
  if (!utils::depends_only_on(
      stage_cost, {m.x(), m.u(), m.z(), m.tvp(), m.p(), m.y()}, offending))
  {
    throw DomainException("The stage cost", offending);
  }
  if (!utils::depends_only_on(arrival_cost, {m.x(), x_prev_, p_est_, p_prev_}, offending)) {
    throw DomainException("The arrival cost", offending);
  }

  stage_cost_fun_ = casadi::Function(
    "stage_cost", {m.x(), m.u(), m.z(), m.tvp(), m.p(), m.y()}, {stage_cost},
    {"x", "u", "z", "tvp", "p", "y_meas"}, {"cost"});
  arrival_cost_fun_ = casadi::Function(
    "arrival_cost", {m.x(), x_prev_, p_est_, p_prev_}, {arrival_cost},
    {"x", "x_prev", "p_est", "p_prev"}, {"cost"});
}

void MHEEstimator::set_default_objective(
  const casadi::DM & P_x, const casadi::DM & P_v,
  const casadi::DM & P_p)
{
  using casadi::SX;
  auto check_weight = [](const std::string & name, const casadi::DM & W, const casadi_int & n) {
      if (W.size1() != n || W.size2() != n) {
        throw ShapeMismatchException(
                name + " must be " + std::to_string(n) + "x" + std::to_string(n) + ", got " +
                W.dim() + ".");
      }
    };
  check_weight("P_x", P_x, static_cast<casadi_int>(model_->nx()));
  check_weight("P_v", P_v, static_cast<casadi_int>(model_->ny()));
  check_weight("P_p", P_p, partition_.n_est());

  const auto dy = model_->y() - model_->y_expression();
  const auto dx = model_->x() - x_prev_;
  const auto dp = p_est_ - p_prev_;
  set_objective(
    SX::mtimes({dy.T(), SX(P_v), dy}),
    SX::mtimes({dx.T(), SX(P_x), dx}) + SX::mtimes({dp.T(), SX(P_p), dp}));
}

void MHEEstimator::set_nl_cons(
  const std::string & name, const casadi::SX & expr,
  const casadi::DM & ub)
{
  on_structure_change("set_nl_cons");
  if (!expr.is_column() || expr.is_empty()) {
    throw ShapeMismatchException("Constraint \"" + name + "\" must be a non-empty column.");
  }
  if (nl_cons_struct_.has_entry(name)) {
    throw ConfigurationException("Constraint \"" + name + "\" already exists.");
  }
  const auto & m = *model_;
  std::vector<std::string> offending;
  if (!utils::depends_only_on(expr, {m.x(), m.u(), m.z(), m.tvp(), m.p()}, offending)) {
    throw DomainException("Constraint \"" + name + "\"", offending);
  }
  const auto n = expr.size1();
  if (!ub.is_scalar() && ub.numel() != n) {
    throw ShapeMismatchException(
            "Upper bound of constraint \"" + name + "\" must be scalar or have " +
            std::to_string(n) + " elements.");
  }
  nl_cons_struct_.add_entry(name, n);
  nl_cons_.push_back(expr);
  nl_cons_ub_.push_back(
    ub.is_scalar() ? casadi::DM::ones(n, 1) * ub : casadi::DM::reshape(ub, n, 1));
}

VariableBounds & MHEEstimator::bounds_of(const VariableType & type, const std::string & name)
{
  if (bounds_.count(type) == 0) {
    throw ConfigurationException("Time-varying parameters can not be bounded or scaled.");
  }
  auto & bounds = bounds_.at(type);
  if (!bounds.lb.layout().has_entry(name)) {
    if (type == VariableType::PARAMETER && partition_.get_p_struct().has_entry(name)) {
      throw ConfigurationException(
              "Parameter \"" + name + "\" is not estimated and can not be bounded or scaled.");
    }
    throw ConfigurationException(
            "\"" + name + "\" is not a variable of " + category_name(type) + ".");
  }
  return bounds;
}

void MHEEstimator::set_lower_bound(
  const VariableType & type, const std::string & name,
  const casadi::DM & lb)
{
  on_structure_change("set_lower_bound");
  auto & bounds = bounds_of(type, name);
  const auto n = bounds.lb.layout().get_entry(name).size;
  if (!lb.is_scalar()) {
    check_shape("Lower bound of \"" + name + "\"", lb, static_cast<size_t>(n));
  }
  bounds.lb.set(name, lb);
}

void MHEEstimator::set_upper_bound(
  const VariableType & type, const std::string & name,
  const casadi::DM & ub)
{
  on_structure_change("set_upper_bound");
  auto & bounds = bounds_of(type, name);
  const auto n = bounds.ub.layout().get_entry(name).size;
  if (!ub.is_scalar()) {
    check_shape("Upper bound of \"" + name + "\"", ub, static_cast<size_t>(n));
  }
  bounds.ub.set(name, ub);
}

void MHEEstimator::set_scaling(
  const VariableType & type, const std::string & name,
  const casadi::DM & scaling)
{
  on_structure_change("set_scaling");
  auto & bounds = bounds_of(type, name);
  const auto block = bounds.scaling.layout().block(name);
  if (!scaling.is_scalar()) {
    check_shape("Scaling of \"" + name + "\"", scaling, static_cast<size_t>(block.size));
  }

  const auto values = scaling.get_elements();
  const auto labels = bounds.scaling.labels();
  std::vector<std::string> offending;
  for (casadi_int i = 0; i < block.size; i++) {
    const auto value = scaling.is_scalar() ? values[0] : values[i];
    if (value <= 0.0) {
      offending.push_back(category_name(type) + labels[block.offset + i]);
    }
  }
  if (!offending.empty()) {
    throw BoundsException("Scaling factors must be positive:", offending);
  }
  bounds.scaling.set(name, scaling);
}

const VariableBounds & MHEEstimator::get_bounds(const VariableType & type) const
{
  if (bounds_.count(type) == 0) {
    throw ConfigurationException("Time-varying parameters have no bounds.");
  }
  return bounds_.at(type);
}

StructValue MHEEstimator::get_tvp_template() const
{
  VariableStruct layout;
  layout.add_repeated_struct_entry(
    "_tvp", config_.n_horizon, model_->get_struct(VariableType::TIME_VARYING_PARAMETER));
  return StructValue(layout);
}

void MHEEstimator::set_tvp_fun(const TemplateFunction & tvp_fun)
{
  on_structure_change("set_tvp_fun");
  check_template("The output of the tvp function", tvp_fun(0.0), get_tvp_template());
  tvp_fun_ = tvp_fun;
  tvp_fun_injected_ = false;
}

StructValue MHEEstimator::get_p_template() const
{
  return StructValue(partition_.get_p_fix_struct());
}

void MHEEstimator::set_p_fun(const TemplateFunction & p_fun)
{
  on_structure_change("set_p_fun");
  check_template("The output of the p function", p_fun(0.0), get_p_template());
  p_fun_ = p_fun;
  p_fun_injected_ = false;
}

StructValue MHEEstimator::get_y_template() const
{
  VariableStruct layout;
  layout.add_repeated_struct_entry("y_meas", config_.n_horizon, model_->get_y_struct());
  return StructValue(layout);
}

void MHEEstimator::set_y_fun(const TemplateFunction & y_fun)
{
  on_structure_change("set_y_fun");
  check_template("The output of the y function", y_fun(0.0), get_y_template());
  y_fun_ = y_fun;
  y_fun_injected_ = false;
}

void MHEEstimator::check_validity()
{
  if (stage_ == MHEStage::ASSEMBLED) {
    throw StateException("check_validity() is not allowed after setup().");
  }
  if (stage_ == MHEStage::READY_FOR_ASSEMBLY) {
    return;
  }
  if (config_.n_horizon <= 0) {
    throw ConfigurationException("n_horizon must be positive.");
  }
  if (config_.t_step <= 0.0) {
    throw ConfigurationException("t_step must be positive.");
  }
  if (!stage_cost_fun_ || !arrival_cost_fun_) {
    throw ConfigurationException("The objective is not set. Call set_objective() first.");
  }

  if (!tvp_fun_) {
    if (model_->ntvp() > 0) {
      throw ConfigurationException(
              "The model has time-varying parameters but no tvp function is set.");
    }
    const auto tvp_template = get_tvp_template();
    tvp_fun_ = [tvp_template](const double &) {return tvp_template;};
    tvp_fun_injected_ = true;
    logger_.send_log(
      utils::LogLevel::INFO, "No time-varying parameters. Using the default tvp function.");
  }
  if (!p_fun_) {
    if (partition_.n_fix() > 0) {
      throw ConfigurationException("The model has fixed parameters but no p function is set.");
    }
    const auto p_template = get_p_template();
    p_fun_ = [p_template](const double &) {return p_template;};
    p_fun_injected_ = true;
    logger_.send_log(utils::LogLevel::INFO, "No fixed parameters. Using the default p function.");
  }
  if (y_fun_) {
    if (config_.meas_from_data && !y_fun_injected_) {
      logger_.send_log(
        utils::LogLevel::INFO,
        "Both a y function and meas_from_data are set. The y function is used.");
    }
  } else if (config_.meas_from_data) {
    y_fun_ = [this](const double & t) {return default_y_fun(t);};
    y_fun_injected_ = true;
    logger_.send_log(
      utils::LogLevel::INFO, "Using the stored measurements as the measurement trajectory.");
  } else {
    throw ConfigurationException(
            "No y function is set. Call set_y_fun() or set meas_from_data to true.");
  }

  // registered callbacks must still match the templates of the current horizon
  if (!tvp_fun_injected_) {
    check_template("The output of the tvp function", (*tvp_fun_)(0.0), get_tvp_template());
  }
  if (!p_fun_injected_) {
    check_template("The output of the p function", (*p_fun_)(0.0), get_p_template());
  }
  if (!y_fun_injected_) {
    check_template("The output of the y function", (*y_fun_)(0.0), get_y_template());
  }

  std::vector<std::string> offending;
  for (const auto & kv : bounds_) {
    const auto violations = kv.second.violations(category_name(kv.first));
    offending.insert(offending.end(), violations.begin(), violations.end());
  }
  if (!offending.empty()) {
    throw BoundsException("Lower bound exceeds upper bound for:", offending);
  }

  transition(MHEStage::READY_FOR_ASSEMBLY);
}

void MHEEstimator::setup()
{
  using casadi::DM;
  using casadi::SX;
  if (stage_ == MHEStage::ASSEMBLED) {
    throw StateException("setup() can only be called once.");
  }
  if (stage_ == MHEStage::UNCONFIGURED) {
    check_validity();
  }

  const auto & m = *model_;
  MHEProblemAssembler assembler(m, partition_, config_);
  for (const auto & kv : bounds_) {
    assembler.set_bounds(kv.first, kv.second);
  }
  assembler.set_objective(*stage_cost_fun_, *arrival_cost_fun_);
  if (!nl_cons_.empty()) {
    assembler.set_nl_cons(
      casadi::Function(
        "nl_cons", {m.x(), m.u(), m.z(), m.tvp(), m.p()}, {SX::vertcat(nl_cons_)},
        {"x", "u", "z", "tvp", "p"}, {"nl_cons"}),
      DM::vertcat(nl_cons_ub_));
  }
  problem_ = assembler.assemble();

  opt_x_num_ = DM::zeros(problem_->opt_x_struct.size(), 1);
  opt_p_num_ = DM::zeros(problem_->opt_p_struct.size(), 1);
  opt_aux_num_ = DM::zeros(problem_->opt_aux_struct.size(), 1);
  lam_g_num_ = DM::zeros(problem_->g.size1(), 1);
  solver_stats_.clear();

  transition(MHEStage::ASSEMBLED);
  set_initial_guess();
  history_.set_meta(config_to_dict());
  logger_.send_log(
    utils::LogLevel::INFO,
    "MHE is set up with " + std::to_string(problem_->opt_x.size1()) + " variables, " +
    std::to_string(problem_->g.size1()) + " constraints and " +
    std::to_string(problem_->opt_p.size1()) + " parameters.");
}

void MHEEstimator::set_initial_state(const casadi::DM & x0, const bool & reset_history)
{
  check_shape("Initial state", x0, model_->nx());
  x0_ = casadi::DM::reshape(x0, x0.numel(), 1);
  if (reset_history) {
    this->reset_history();
  }
}

void MHEEstimator::set_initial_parameter_estimate(const casadi::DM & p_est0)
{
  check_shape("Initial parameter estimate", p_est0, static_cast<size_t>(partition_.n_est()));
  p_est0_ = casadi::DM::reshape(p_est0, p_est0.numel(), 1);
}

void MHEEstimator::set_initial_input(const casadi::DM & u0)
{
  check_shape("Initial input", u0, model_->nu());
  u0_ = casadi::DM::reshape(u0, u0.numel(), 1);
}

void MHEEstimator::set_initial_algebraic(const casadi::DM & z0)
{
  check_shape("Initial algebraic state", z0, model_->nz());
  z0_ = casadi::DM::reshape(z0, z0.numel(), 1);
}

void MHEEstimator::set_initial_guess()
{
  if (stage_ != MHEStage::ASSEMBLED) {
    throw StateException("set_initial_guess() requires setup() to be called first.");
  }
  const auto & ox_struct = problem_->opt_x_struct;
  const auto N = problem_->n_horizon;
  const auto n_pts = problem_->points_per_step();
  const auto x_guess = x0_ / bounds_.at(VariableType::STATE).scaling.cat();
  const auto z_guess = z0_ / bounds_.at(VariableType::ALGEBRAIC).scaling.cat();
  const auto u_guess = u0_ / bounds_.at(VariableType::INPUT).scaling.cat();
  for (casadi_int i = 0; i < 1 + N * n_pts; i++) {
    set_block(opt_x_num_, ox_struct.block("_x", i), x_guess);
  }
  for (casadi_int i = 0; i < N * n_pts; i++) {
    set_block(opt_x_num_, ox_struct.block("_z", i), z_guess);
  }
  for (casadi_int k = 0; k < N; k++) {
    set_block(opt_x_num_, problem_->u_block(k), u_guess);
  }
  set_block(
    opt_x_num_, problem_->p_est_block(),
    casadi::DM(p_est0_ / bounds_.at(VariableType::PARAMETER).scaling.cat()));
}

void MHEEstimator::reset_history()
{
  history_.init_storage();
  if (stage_ == MHEStage::ASSEMBLED) {
    history_.set_meta(config_to_dict());
  }
}

casadi::DM MHEEstimator::make_step(const casadi::DM & y0)
{
  using casadi::DM;
  if (stage_ != MHEStage::ASSEMBLED) {
    throw StateException("make_step() requires setup() to be called first.");
  }
  check_shape("Measurement", y0, model_->ny());

  // solver parameters of this window, checked before anything is recorded
  const auto tvp = (*tvp_fun_)(t0_);
  check_template("The output of the tvp function", tvp, get_tvp_template());
  const auto p_set = (*p_fun_)(t0_);
  check_template("The output of the p function", p_set, get_p_template());
  StructValue y_meas;
  if (!y_fun_injected_) {
    y_meas = (*y_fun_)(t0_);
    check_template("The output of the y function", y_meas, get_y_template());
  }
  history_.update({{"_y", y0}});
  if (y_fun_injected_) {
    // the stored measurements already include y0
    y_meas = (*y_fun_)(t0_);
  }

  StructValue opt_p(problem_->opt_p_struct);
  opt_p.set("_x_prev", x0_);
  opt_p.set("_p_prev", p_est0_);
  opt_p.set("_p_set", p_set.cat());
  opt_p.set("_tvp", tvp.cat());
  opt_p.set("_y_meas", y_meas.cat());
  opt_p_num_ = opt_p.cat();

  bool solver_raised = false;
  try {
    const auto sol = problem_->solver(
      casadi::DMDict{
            {"x0", opt_x_num_},
            {"lbx", problem_->lb_opt_x},
            {"ubx", problem_->ub_opt_x},
            {"lbg", problem_->lb_g},
            {"ubg", problem_->ub_g},
            {"p", opt_p_num_},
            {"lam_g0", lam_g_num_}
          });
    opt_x_num_ = sol.at("x");
    lam_g_num_ = sol.at("lam_g");
    solver_stats_ = problem_->solver.stats();
  } catch (const std::exception & e) {
    // the previous solution is kept as the estimate of this step
    solver_raised = true;
    logger_.send_log(utils::LogLevel::ERROR, std::string("MHE solver failed: ") + e.what());
    solver_stats_ = casadi::Dict{{"success", false}, {"return_status", std::string(e.what())}};
  }

  const bool success = solver_stats_.count("success") > 0 &&
    solver_stats_.at("success").to_bool();
  if (!success && !solver_raised) {
    const auto status = solver_stats_.count("return_status") > 0 ?
      solver_stats_.at("return_status").to_string() : std::string("unknown");
    logger_.send_log(utils::LogLevel::WARN, "MHE solver did not converge: " + status);
  }
  if (solver_stats_.count("t_wall_total") > 0) {
    solve_time_profiler_.add_cycle_stats(solver_stats_.at("t_wall_total").to_double() * 1000.0);
  }
  if (solver_stats_.count("iter_count") > 0) {
    iteration_profiler_.add_cycle_stats(
      static_cast<double>(solver_stats_.at("iter_count").to_int()));
  }
  logger_.send_log(
    utils::LogLevel::DEBUG, solve_time_profiler_.profile().to_string("MHE solve time (ms)"));

  opt_aux_num_ = problem_->opt_aux_expression_fun(
    casadi::DMDict{{"opt_x", opt_x_num_}, {"opt_p", opt_p_num_}}).at("opt_aux");

  // newest estimates, in physical units
  const auto N = problem_->n_horizon;
  const DM opt_x_unscaled = opt_x_num_ * problem_->opt_x_scaling;
  const auto x_next = get_block(opt_x_unscaled, problem_->x_block(N, -1));
  const auto p_est_next = get_block(opt_x_unscaled, problem_->p_est_block());
  const auto u_next = get_block(opt_x_unscaled, problem_->u_block(N - 1));
  const auto z_next = get_block(opt_x_unscaled, problem_->z_block(N - 1, -1));
  const auto aux_next = get_block(opt_aux_num_, problem_->opt_aux_struct.block("_aux", -1));
  const auto p_next = partition_.recombine(p_est_next, p_set.cat());

  casadi::DMDict record{
    {"_x", x_next},
    {"_u", u_next},
    {"_z", z_next},
    {"_p", p_next},
    {"_time", DM(t0_)},
    {"_aux", aux_next}
  };
  for (const auto & name : config_.store_solver_stats) {
    if (solver_stats_.count(name) == 0) {
      continue;
    }
    const auto & value = solver_stats_.at(name);
    if (value.is_bool()) {
      record[name] = DM(value.to_bool() ? 1.0 : 0.0);
    } else if (value.is_int()) {
      record[name] = DM(static_cast<double>(value.to_int()));
    } else if (value.is_double()) {
      record[name] = DM(value.to_double());
    }
  }
  if (config_.store_full_solution) {
    record["_opt_x_num"] = opt_x_num_;
  }
  if (config_.store_lagr_multiplier) {
    record["_lam_g_num"] = lam_g_num_;
  }
  history_.update(record);

  t0_ += config_.t_step;
  x0_ = x_next;
  p_est0_ = p_est_next;
  u0_ = u_next;
  z0_ = z_next;
  return x_next;
}

const casadi::DM & MHEEstimator::get_x0() const
{
  return x0_;
}

const casadi::DM & MHEEstimator::get_p_est0() const
{
  return p_est0_;
}

const casadi::DM & MHEEstimator::get_u0() const
{
  return u0_;
}

const casadi::DM & MHEEstimator::get_z0() const
{
  return z0_;
}

const double & MHEEstimator::get_t0() const
{
  return t0_;
}

const MHEHistory & MHEEstimator::get_history() const
{
  return history_;
}

const MHEProblem & MHEEstimator::get_problem() const
{
  if (!problem_) {
    throw StateException("The estimation problem is only available after setup().");
  }
  return *problem_;
}

const casadi::DM & MHEEstimator::get_opt_x_num() const
{
  return opt_x_num_;
}

const casadi::DM & MHEEstimator::get_opt_p_num() const
{
  return opt_p_num_;
}

const casadi::DM & MHEEstimator::get_opt_aux_num() const
{
  return opt_aux_num_;
}

const casadi::DM & MHEEstimator::get_lam_g_num() const
{
  return lam_g_num_;
}

const casadi::Dict & MHEEstimator::get_solver_stats() const
{
  return solver_stats_;
}

utils::Profile<double> MHEEstimator::get_solve_time_profile()
{
  return solve_time_profiler_.profile();
}

utils::Profile<double> MHEEstimator::get_iteration_profile()
{
  return iteration_profiler_.profile();
}

utils::Logger & MHEEstimator::get_logger()
{
  return logger_;
}

void MHEEstimator::transition(const MHEStage & next)
{
  const bool allowed =
    (stage_ == MHEStage::UNCONFIGURED && next == MHEStage::READY_FOR_ASSEMBLY) ||
    (stage_ == MHEStage::READY_FOR_ASSEMBLY &&
    (next == MHEStage::ASSEMBLED || next == MHEStage::UNCONFIGURED));
  if (!allowed) {
    throw StateException(
            "Transition from " + stage_name(stage_) + " to " + stage_name(next) +
            " is not allowed.");
  }
  stage_ = next;
}

void MHEEstimator::on_structure_change(const std::string & what)
{
  if (stage_ == MHEStage::ASSEMBLED) {
    throw StateException(what + "() is not allowed after setup().");
  }
  if (stage_ == MHEStage::READY_FOR_ASSEMBLY) {
    transition(MHEStage::UNCONFIGURED);
  }
  // defaults are resolved again by the next check_validity()
  if (tvp_fun_injected_) {
    tvp_fun_.reset();
    tvp_fun_injected_ = false;
  }
  if (p_fun_injected_) {
    p_fun_.reset();
    p_fun_injected_ = false;
  }
  if (y_fun_injected_) {
    y_fun_.reset();
    y_fun_injected_ = false;
  }
}

void MHEEstimator::check_shape(
  const std::string & what, const casadi::DM & value,
  const size_t & n) const
{
  if (static_cast<size_t>(value.numel()) != n) {
    throw ShapeMismatchException(
            what + " must have " + std::to_string(n) + " elements, got " +
            std::to_string(value.numel()) + ".");
  }
}

void MHEEstimator::check_template(
  const std::string & what, const StructValue & value,
  const StructValue & tmpl) const
{
  if (value.labels() != tmpl.labels()) {
    throw ShapeMismatchException(what + " does not match its template.");
  }
}

StructValue MHEEstimator::default_y_fun(const double &) const
{
  auto y = get_y_template();
  if (!history_.has_field("_y")) {
    return y;
  }
  // the window ends with the newest measurement, missing ones repeat the oldest
  const auto & data = history_.get("_y");
  const auto n_records = data.size1();
  for (casadi_int k = 0; k < config_.n_horizon; k++) {
    const auto row = std::max<casadi_int>(n_records - config_.n_horizon + k, 0);
    y.set("y_meas", k, casadi::DM(data(casadi::Slice(row), casadi::Slice()).T()));
  }
  return y;
}

casadi::Dict MHEEstimator::config_to_dict() const
{
  return casadi::Dict{
    {"n_horizon", config_.n_horizon},
    {"t_step", config_.t_step},
    {"meas_from_data", config_.meas_from_data},
    {"state_discretization", config_.state_discretization},
    {"collocation_type", config_.collocation_type},
    {"collocation_deg", config_.collocation_deg},
    {"collocation_ni", config_.collocation_ni},
    {"store_full_solution", config_.store_full_solution},
    {"store_lagr_multiplier", config_.store_lagr_multiplier},
    {"store_solver_stats", config_.store_solver_stats},
    {"nlpsol_opts", config_.nlpsol_opts},
    {"p_est_list", partition_.get_p_est_struct().keys()}
  };
}
}  // namespace mhe_estimator
}  // namespace estimator
}  // namespace mhe
