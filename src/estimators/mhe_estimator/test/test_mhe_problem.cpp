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

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "mhe_estimator/mhe_exceptions.hpp"
#include "mhe_estimator/mhe_history.hpp"
#include "mhe_estimator/mhe_problem.hpp"
#include "mhe_estimator/parameter_partition.hpp"

using casadi::DM;
using casadi::SX;
using mhe::estimator::mhe_estimator::ConfigurationException;
using mhe::estimator::mhe_estimator::ConstraintKind;
using mhe::estimator::mhe_estimator::MHEEstimatorConfig;
using mhe::estimator::mhe_estimator::MHEHistory;
using mhe::estimator::mhe_estimator::MHEProblemAssembler;
using mhe::estimator::mhe_estimator::ParameterPartition;
using mhe::estimator::mhe_estimator::ShapeMismatchException;
using mhe::estimator::mhe_estimator::VariableBounds;
using mhe::process_model::base_process_model::BaseProcessModel;
using mhe::process_model::base_process_model::ModelType;
using mhe::process_model::base_process_model::VariableStruct;
using mhe::process_model::base_process_model::VariableType;

// x' = -x + z, 0 = z - u
BaseProcessModel get_dae_model()
{
  BaseProcessModel model(ModelType::CONTINUOUS);
  const auto x = model.set_variable(VariableType::STATE, "x");
  const auto u = model.set_variable(VariableType::INPUT, "u");
  const auto z = model.set_variable(VariableType::ALGEBRAIC, "z");
  model.set_measurement("y_x", x);
  model.set_expression("x_sq", x * x);
  model.set_rhs("x", -x + z);
  model.set_alg("z_def", z - u);
  model.setup();
  return model;
}

void set_least_squares(MHEProblemAssembler & assembler, const BaseProcessModel & model)
{
  const auto x_prev = SX::sym("x_prev");
  const auto p_est = SX::sym("p_est", 0, 1);
  const auto p_prev = SX::sym("p_prev", 0, 1);
  assembler.set_objective(
    casadi::Function(
      "stage_cost", {model.x(), model.u(), model.z(), model.tvp(), model.p(), model.y()},
      {SX::sumsqr(model.y() - model.y_expression())},
      {"x", "u", "z", "tvp", "p", "y_meas"}, {"cost"}),
    casadi::Function(
      "arrival_cost", {model.x(), x_prev, p_est, p_prev}, {SX::sumsqr(model.x() - x_prev)},
      {"x", "x_prev", "p_est", "p_prev"}, {"cost"}));
}

TEST(MHEProblemTest, CollocationLayoutTest) {
  const auto model = get_dae_model();
  const ParameterPartition partition(model.get_struct(VariableType::PARAMETER), {});
  MHEEstimatorConfig config;
  config.n_horizon = 2;
  config.t_step = 0.1;

  MHEProblemAssembler assembler(model, partition, config);
  set_least_squares(assembler, model);
  const auto problem = assembler.assemble();

  EXPECT_EQ(problem->n_coll_points, 3);
  EXPECT_EQ(problem->points_per_step(), 4);
  // x at 1 + 2 * 4 points, z at 2 * 4 points, u at 2 steps
  EXPECT_EQ(problem->opt_x.size1(), 9 + 8 + 2);
  EXPECT_EQ(problem->opt_p.size1(), 1 + 2);
  EXPECT_EQ(problem->opt_aux.size1(), 2);

  EXPECT_EQ(problem->x_block(0).offset, 0);
  EXPECT_EQ(problem->x_block(1, 0).offset, 1);
  EXPECT_EQ(problem->x_block(1, -1).offset, 4);
  EXPECT_EQ(problem->x_block(2).offset, 8);
  EXPECT_EQ(problem->z_block(1, 0).offset, 13);
  EXPECT_EQ(problem->u_block(1).offset, 18);
  EXPECT_EQ(problem->p_est_block().size, 0);
  EXPECT_THROW(problem->x_block(0, 1), std::out_of_range);
  EXPECT_THROW(problem->x_block(3), std::out_of_range);
  EXPECT_THROW(problem->z_block(2), std::out_of_range);

  // per step: 2 collocation equations, 1 element end, 4 algebraic residuals
  EXPECT_EQ(problem->count_constraints(ConstraintKind::DEFECT), 2);
  EXPECT_EQ(problem->count_constraints(ConstraintKind::CONTINUITY), 2);
  ASSERT_EQ(problem->constraint_blocks.size(), 4u);
  EXPECT_EQ(problem->constraint_blocks[0].size, 7);
  EXPECT_EQ(problem->constraint_blocks[1].kind, ConstraintKind::CONTINUITY);
  EXPECT_EQ(problem->constraint_blocks[1].offset, 7);
  EXPECT_EQ(problem->constraint_blocks[2].step, 1);
  EXPECT_EQ(problem->g.size1(), 16);
  EXPECT_DOUBLE_EQ(static_cast<double>(DM::norm_inf(problem->ub_g)), 0.0);
  EXPECT_EQ(problem->n_stage_costs, 2);
  EXPECT_FALSE(problem->solver.is_null());
}

TEST(MHEProblemTest, MultiElementLayoutTest) {
  const auto model = get_dae_model();
  const ParameterPartition partition(model.get_struct(VariableType::PARAMETER), {});
  MHEEstimatorConfig config;
  config.n_horizon = 3;
  config.t_step = 0.1;
  config.collocation_deg = 2;
  config.collocation_ni = 2;

  MHEProblemAssembler assembler(model, partition, config);
  set_least_squares(assembler, model);
  const auto problem = assembler.assemble();

  // ni * (deg + 1) points inside a step, plus its end point
  const casadi_int n_pts = 2 * (2 + 1) + 1;
  EXPECT_EQ(problem->n_coll_points, n_pts - 1);
  EXPECT_EQ(problem->points_per_step(), n_pts);
  // only the start of the window is stored before the first step
  EXPECT_EQ(problem->opt_x_struct.size(), (1 + 3 * n_pts) + 3 * n_pts + 3);
  EXPECT_EQ(problem->x_block(3, -1).offset, 3 * n_pts);
  EXPECT_EQ(problem->z_block(0, 0).offset, 1 + 3 * n_pts);
  EXPECT_EQ(problem->count_constraints(ConstraintKind::CONTINUITY), 3);
  EXPECT_EQ(problem->n_stage_costs, 3);
}

TEST(MHEProblemTest, ScaledBoundsTest) {
  const auto model = get_dae_model();
  const ParameterPartition partition(model.get_struct(VariableType::PARAMETER), {});
  MHEEstimatorConfig config;
  config.n_horizon = 1;
  config.t_step = 0.1;
  config.collocation_deg = 1;

  MHEProblemAssembler assembler(model, partition, config);
  set_least_squares(assembler, model);
  VariableBounds x_bounds(model.get_struct(VariableType::STATE));
  x_bounds.lb.set("x", DM(1.0));
  x_bounds.ub.set("x", DM(4.0));
  x_bounds.scaling.set("x", DM(2.0));
  assembler.set_bounds(VariableType::STATE, x_bounds);
  EXPECT_THROW(
    assembler.set_bounds(VariableType::INPUT, x_bounds),
    ShapeMismatchException);

  const auto problem = assembler.assemble();
  const auto last = problem->x_block(1, -1).offset;
  EXPECT_DOUBLE_EQ(static_cast<double>(problem->lb_opt_x(0)), 0.5);
  EXPECT_DOUBLE_EQ(static_cast<double>(problem->ub_opt_x(last)), 2.0);
  EXPECT_DOUBLE_EQ(static_cast<double>(problem->opt_x_scaling(last)), 2.0);
  EXPECT_TRUE(std::isinf(static_cast<double>(problem->ub_opt_x(problem->u_block(0).offset))));
}

TEST(MHEProblemTest, DiscretizationSettingsTest) {
  const auto model = get_dae_model();
  const ParameterPartition partition(model.get_struct(VariableType::PARAMETER), {});
  MHEEstimatorConfig config;
  config.n_horizon = 1;
  config.t_step = 0.1;

  config.collocation_type = "chebyshev";
  MHEProblemAssembler bad_type(model, partition, config);
  set_least_squares(bad_type, model);
  EXPECT_THROW(bad_type.assemble(), ConfigurationException);

  config.collocation_type = "legendre";
  config.collocation_deg = 0;
  MHEProblemAssembler bad_deg(model, partition, config);
  set_least_squares(bad_deg, model);
  EXPECT_THROW(bad_deg.assemble(), ConfigurationException);

  config.collocation_deg = 3;
  config.state_discretization = "discrete";
  MHEProblemAssembler bad_scheme(model, partition, config);
  set_least_squares(bad_scheme, model);
  EXPECT_THROW(bad_scheme.assemble(), ConfigurationException);

  config.state_discretization = "collocation";
  config.collocation_ni = 2;
  MHEProblemAssembler good(model, partition, config);
  set_least_squares(good, model);
  EXPECT_EQ(good.assemble()->n_coll_points, 8);
}

TEST(MHEProblemTest, SolverOptionsTest) {
  const auto opts = MHEProblemAssembler::solver_options(
    casadi::Dict{{"ipopt.print_level", 5}, {"ipopt.max_iter", 50}});
  EXPECT_EQ(opts.at("ipopt.print_level").to_int(), 5);
  EXPECT_EQ(opts.at("ipopt.max_iter").to_int(), 50);
  EXPECT_EQ(opts.at("ipopt.linear_solver").to_string(), "mumps");
  EXPECT_FALSE(opts.at("error_on_fail").to_bool());
}

TEST(MHEProblemTest, ParameterPartitionTest) {
  VariableStruct p_struct;
  p_struct.add_entry("a", 1);
  p_struct.add_entry("b", 2);
  p_struct.add_entry("c", 1);

  const ParameterPartition partition(p_struct, {"c", "a"});
  EXPECT_EQ(partition.n_est(), 2);
  EXPECT_EQ(partition.n_fix(), 2);
  EXPECT_TRUE(partition.is_estimated("a"));
  EXPECT_FALSE(partition.is_estimated("b"));
  // the model order is kept, not the order of the list
  EXPECT_EQ(partition.get_p_est_struct().keys()[0], "a");
  EXPECT_EQ(partition.get_p_est_struct().keys()[1], "c");

  const auto p = partition.recombine(
    DM(std::vector<double>{1.0, 4.0}), DM(std::vector<double>{2.0, 3.0}));
  ASSERT_EQ(p.size1(), 4);
  for (casadi_int i = 0; i < 4; i++) {
    EXPECT_DOUBLE_EQ(static_cast<double>(p(i)), static_cast<double>(i + 1));
  }

  EXPECT_THROW(ParameterPartition(p_struct, {"d"}), ConfigurationException);
  const ParameterPartition all_fixed(p_struct, {});
  EXPECT_EQ(all_fixed.n_est(), 0);
  EXPECT_EQ(all_fixed.get_p_fix_struct(), p_struct);
}

TEST(MHEProblemTest, HistoryTest) {
  MHEHistory history;
  history.update(
    casadi::DMDict{{"_x", DM(std::vector<double>{1.0, 2.0})}, {"_z", DM::zeros(0, 1)}});
  history.update(casadi::DMDict{{"_x", DM(std::vector<double>{3.0, 4.0})}});
  EXPECT_EQ(history.records("_x"), 2);
  EXPECT_EQ(history.size("_x"), 2);
  EXPECT_FALSE(history.has_field("_z"));
  EXPECT_DOUBLE_EQ(static_cast<double>(history.get("_x")(1, 0)), 3.0);

  // a malformed record is rejected as a whole
  EXPECT_THROW(
    history.update(casadi::DMDict{{"_t", DM(1.0)}, {"_x", DM(1.0)}}),
    std::length_error);
  EXPECT_FALSE(history.has_field("_t"));
  EXPECT_THROW(history.get("_t"), std::invalid_argument);

  history.set_meta(casadi::Dict{{"n_horizon", 3}});
  history.set_meta(casadi::Dict{{"n_horizon", 5}, {"t_step", 0.1}});
  EXPECT_EQ(history.get_meta().at("n_horizon").to_int(), 5);
  EXPECT_EQ(history.get_meta().size(), 2u);

  const auto prefix = testing::TempDir() + "mhe_history_";
  history.save(prefix);
  const auto x = DM::from_file(prefix + "_x.txt", "txt");
  EXPECT_EQ(x.size1(), 2);
  EXPECT_DOUBLE_EQ(static_cast<double>(x(1, 1)), 4.0);

  history.init_storage();
  EXPECT_TRUE(history.fields().empty());
  EXPECT_TRUE(history.get_meta().empty());
}
