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

#include <string>
#include <vector>

#include "base_process_model/base_process_model.hpp"
#include "base_process_model/variable_struct.hpp"

using mhe::process_model::base_process_model::BaseProcessModel;
using mhe::process_model::base_process_model::StructValue;
using mhe::process_model::base_process_model::VariableStruct;
using mhe::process_model::base_process_model::VariableType;
using mhe::process_model::base_process_model::ModelType;

TEST(BaseProcessModelTest, VariableStructLabelTest) {
  VariableStruct tvp;
  tvp.add_entry("T_in", 1);
  tvp.add_entry("d", 2);

  VariableStruct layout;
  layout.add_entry("x", 2);
  layout.add_repeated_entry("u", 2, 1);
  layout.add_repeated_struct_entry("_tvp", 2, tvp);
  EXPECT_EQ(layout.size(), 2 + 2 + 2 * 3);

  const auto labels = layout.labels();
  ASSERT_EQ(labels.size(), 10u);
  EXPECT_EQ(labels[0], "[x,0]");
  EXPECT_EQ(labels[1], "[x,1]");
  EXPECT_EQ(labels[2], "[u,0,0]");
  EXPECT_EQ(labels[3], "[u,1,0]");
  EXPECT_EQ(labels[4], "[_tvp,0,T_in,0]");
  EXPECT_EQ(labels[9], "[_tvp,1,d,1]");

  EXPECT_THROW(layout.add_entry("x", 1), std::invalid_argument);

  VariableStruct other;
  other.add_entry("x", 2);
  EXPECT_NE(layout, other);
  other.add_repeated_entry("u", 2, 1);
  other.add_repeated_struct_entry("_tvp", 2, tvp);
  EXPECT_EQ(layout, other);
}

TEST(BaseProcessModelTest, VariableStructBlockTest) {
  VariableStruct child;
  child.add_entry("a", 1);
  child.add_entry("b", 3);

  VariableStruct layout;
  layout.add_entry("first", 2);
  layout.add_repeated_struct_entry("rep", 3, child);

  EXPECT_EQ(layout.block("first").offset, 0);
  EXPECT_EQ(layout.block("rep").size, 12);
  EXPECT_EQ(layout.block("rep", 1).offset, 6);
  EXPECT_EQ(layout.block("rep", -1).offset, 10);
  EXPECT_EQ(layout.block("rep", 2, "b").offset, 11);
  EXPECT_EQ(layout.block("rep", 2, "b").size, 3);

  EXPECT_THROW(layout.block("rep", 3), std::out_of_range);
  EXPECT_THROW(layout.block("rep", -4), std::out_of_range);
  EXPECT_THROW(layout.block("first", 0), std::invalid_argument);
  EXPECT_THROW(layout.block("missing"), std::invalid_argument);
}

TEST(BaseProcessModelTest, StructValueTest) {
  VariableStruct layout;
  layout.add_entry("x", 2);
  layout.add_repeated_entry("u", 3, 1);

  StructValue value(layout);
  EXPECT_EQ(value.cat().size1(), 5);
  EXPECT_DOUBLE_EQ(static_cast<double>(casadi::DM::norm_inf(value.cat())), 0.0);

  value.set("x", casadi::DM(std::vector<double>{1.0, 2.0}));
  value.set("u", -1, casadi::DM(7.0));
  EXPECT_DOUBLE_EQ(static_cast<double>(value.get("x")(1)), 2.0);
  EXPECT_DOUBLE_EQ(static_cast<double>(value.cat()(4)), 7.0);

  // a scalar is broadcast over the entry
  value.set("u", casadi::DM(3.0));
  EXPECT_DOUBLE_EQ(static_cast<double>(value.get("u", 0)), 3.0);
  EXPECT_DOUBLE_EQ(static_cast<double>(value.get("u", 2)), 3.0);

  EXPECT_THROW(value.set("x", casadi::DM::zeros(3, 1)), std::length_error);
  EXPECT_THROW(value.set_cat(casadi::DM::zeros(4, 1)), std::length_error);

  const StructValue filled(layout, 2.0);
  EXPECT_DOUBLE_EQ(static_cast<double>(casadi::DM::sum1(filled.cat())), 10.0);
}

TEST(BaseProcessModelTest, ModelSetupTest) {
  using casadi::DM;
  using casadi::SX;
  BaseProcessModel model(ModelType::CONTINUOUS);
  const auto x = model.set_variable(VariableType::STATE, "x", 2);
  const auto u = model.set_variable(VariableType::INPUT, "u");
  const auto z = model.set_variable(VariableType::ALGEBRAIC, "z");
  const auto p = model.set_variable(VariableType::PARAMETER, "k");
  const auto tvp = model.set_variable(VariableType::TIME_VARYING_PARAMETER, "d");
  model.set_measurement("y_x", x(0));
  model.set_measurement("y_u", u);
  model.set_expression("energy", SX::sumsqr(x));
  model.set_rhs("x", SX::vertcat({x(1), -p * x(0) + u + tvp}));
  model.set_alg("z_def", z - x(0) * x(1));

  EXPECT_THROW(model.set_variable(VariableType::INPUT, "x"), std::invalid_argument);
  EXPECT_THROW(model.set_variable(VariableType::INPUT, "w", 0), std::invalid_argument);
  EXPECT_THROW(model.set_rhs("u", u), std::invalid_argument);
  EXPECT_THROW(model.set_rhs("x", x(0)), std::length_error);

  model.setup();
  EXPECT_TRUE(model.is_setup());
  EXPECT_EQ(model.nx(), 2u);
  EXPECT_EQ(model.nu(), 1u);
  EXPECT_EQ(model.nz(), 1u);
  EXPECT_EQ(model.np(), 1u);
  EXPECT_EQ(model.ntvp(), 1u);
  EXPECT_EQ(model.ny(), 2u);
  EXPECT_EQ(model.naux(), 1u);
  EXPECT_EQ(model.get_y_struct().labels()[1], "[y_u,0]");

  const auto in = casadi::DMDict{
    {"x", DM(std::vector<double>{1.0, 2.0})}, {"u", DM(0.5)}, {"z", DM(4.0)},
    {"tvp", DM(0.25)}, {"p", DM(3.0)}};
  const auto rhs = model.rhs_function()(in).at("rhs");
  EXPECT_DOUBLE_EQ(static_cast<double>(rhs(0)), 2.0);
  EXPECT_DOUBLE_EQ(static_cast<double>(rhs(1)), -3.0 + 0.5 + 0.25);
  EXPECT_DOUBLE_EQ(static_cast<double>(model.alg_function()(in).at("alg")), 2.0);
  EXPECT_DOUBLE_EQ(static_cast<double>(model.meas_function()(in).at("y")(1)), 0.5);
  EXPECT_DOUBLE_EQ(static_cast<double>(model.aux_function()(in).at("aux")), 5.0);

  EXPECT_THROW(model.set_variable(VariableType::STATE, "x2"), std::logic_error);
  EXPECT_THROW(model.setup(), std::logic_error);
}

TEST(BaseProcessModelTest, ModelIncompleteTest) {
  BaseProcessModel no_rhs(ModelType::DISCRETE);
  no_rhs.set_variable(VariableType::STATE, "a");
  no_rhs.set_variable(VariableType::STATE, "b");
  no_rhs.set_rhs("a", no_rhs.x()(0));
  EXPECT_THROW(no_rhs.setup(), std::invalid_argument);

  BaseProcessModel no_alg(ModelType::DISCRETE);
  const auto x = no_alg.set_variable(VariableType::STATE, "x");
  no_alg.set_variable(VariableType::ALGEBRAIC, "z");
  no_alg.set_rhs("x", x);
  EXPECT_THROW(no_alg.setup(), std::invalid_argument);
  EXPECT_FALSE(no_alg.is_setup());
}
