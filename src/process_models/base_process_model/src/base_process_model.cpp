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

#include <stdexcept>
#include <string>
#include <vector>

#include "base_process_model/base_process_model.hpp"
#include "mhe_utils/utils.hpp"

namespace mhe
{
namespace process_model
{
namespace base_process_model
{
BaseProcessModel::BaseProcessModel(const ModelType & model_type)
: model_type_(model_type), setup_(false),
  y_(casadi::SX::zeros(0, 1)), y_expression_(casadi::SX::zeros(0, 1)),
  aux_expression_(casadi::SX::zeros(0, 1))
{
  for (const auto & type : {STATE, INPUT, ALGEBRAIC, PARAMETER, TIME_VARYING_PARAMETER}) {
    structs_[type] = VariableStruct();
    symbols_[type] = {};
    symbols_cat_[type] = casadi::SX::zeros(0, 1);
  }
}

const ModelType & BaseProcessModel::get_model_type() const
{
  return model_type_;
}

casadi::SX BaseProcessModel::set_variable(
  const VariableType & type, const std::string & name,
  const casadi_int & size)
{
  check_not_setup("set_variable");
  if (size <= 0) {
    throw std::invalid_argument("Variable \"" + name + "\" must have a positive size.");
  }
  if (name_taken(name)) {
    throw std::invalid_argument("Variable name \"" + name + "\" is already taken.");
  }
  const auto sym = casadi::SX::sym(name, size, 1);
  structs_.at(type).add_entry(name, size);
  symbols_.at(type).push_back(sym);
  symbols_cat_[type] = utils::vertcat_column(symbols_.at(type));
  return sym;
}

casadi::SX BaseProcessModel::set_measurement(const std::string & name, const casadi::SX & expr)
{
  check_not_setup("set_measurement");
  if (!expr.is_column()) {
    throw std::invalid_argument("Measurement \"" + name + "\" must be a column vector.");
  }
  y_struct_.add_entry(name, expr.size1());
  y_symbols_.push_back(casadi::SX::sym(name, expr.size1(), 1));
  y_expressions_.push_back(expr);
  y_ = utils::vertcat_column(y_symbols_);
  y_expression_ = utils::vertcat_column(y_expressions_);
  return expr;
}

casadi::SX BaseProcessModel::set_expression(const std::string & name, const casadi::SX & expr)
{
  check_not_setup("set_expression");
  if (!expr.is_column()) {
    throw std::invalid_argument("Expression \"" + name + "\" must be a column vector.");
  }
  aux_struct_.add_entry(name, expr.size1());
  aux_expressions_.push_back(expr);
  aux_expression_ = utils::vertcat_column(aux_expressions_);
  return expr;
}

void BaseProcessModel::set_rhs(const std::string & state_name, const casadi::SX & expr)
{
  check_not_setup("set_rhs");
  const auto & x_struct = structs_.at(STATE);
  if (!x_struct.has_entry(state_name)) {
    throw std::invalid_argument("\"" + state_name + "\" is not a state of the model.");
  }
  if (expr.size1() != x_struct.get_entry(state_name).size || !expr.is_column()) {
    throw std::length_error(
            "Right hand side of \"" + state_name + "\" does not match the state dimension.");
  }
  rhs_[state_name] = expr;
}

void BaseProcessModel::set_alg(const std::string & name, const casadi::SX & expr)
{
  check_not_setup("set_alg");
  if (!expr.is_column()) {
    throw std::invalid_argument("Algebraic equation \"" + name + "\" must be a column vector.");
  }
  alg_struct_.add_entry(name, expr.size1());
  alg_expressions_.push_back(expr);
}

void BaseProcessModel::setup()
{
  check_not_setup("setup");
  if (nx() == 0) {
    throw std::invalid_argument("The model has no state.");
  }

  std::vector<casadi::SX> rhs;
  for (const auto & entry : structs_.at(STATE).entries()) {
    if (rhs_.count(entry.name) == 0) {
      throw std::invalid_argument("No right hand side given for state \"" + entry.name + "\".");
    }
    rhs.push_back(rhs_.at(entry.name));
  }
  if (alg_struct_.size() != structs_.at(ALGEBRAIC).size()) {
    throw std::invalid_argument(
            "The model has " + std::to_string(nz()) + " algebraic variables but " +
            std::to_string(alg_struct_.size()) + " algebraic equations.");
  }

  const std::vector<casadi::SX> in = {x(), u(), z(), tvp(), p()};
  const std::vector<std::string> in_names = {"x", "u", "z", "tvp", "p"};
  rhs_function_ = casadi::Function(
    "rhs", in, {utils::vertcat_column(rhs)}, in_names, {"rhs"});
  alg_function_ = casadi::Function(
    "alg", in, {utils::vertcat_column(alg_expressions_)}, in_names, {"alg"});
  meas_function_ = casadi::Function("meas", in, {y_expression_}, in_names, {"y"});
  aux_function_ = casadi::Function("aux", in, {aux_expression_}, in_names, {"aux"});

  setup_ = true;
}

const bool & BaseProcessModel::is_setup() const
{
  return setup_;
}

size_t BaseProcessModel::nx() const
{
  return static_cast<size_t>(structs_.at(STATE).size());
}

size_t BaseProcessModel::nu() const
{
  return static_cast<size_t>(structs_.at(INPUT).size());
}

size_t BaseProcessModel::nz() const
{
  return static_cast<size_t>(structs_.at(ALGEBRAIC).size());
}

size_t BaseProcessModel::np() const
{
  return static_cast<size_t>(structs_.at(PARAMETER).size());
}

size_t BaseProcessModel::ntvp() const
{
  return static_cast<size_t>(structs_.at(TIME_VARYING_PARAMETER).size());
}

size_t BaseProcessModel::ny() const
{
  return static_cast<size_t>(y_struct_.size());
}

size_t BaseProcessModel::naux() const
{
  return static_cast<size_t>(aux_struct_.size());
}

const VariableStruct & BaseProcessModel::get_struct(const VariableType & type) const
{
  return structs_.at(type);
}

const VariableStruct & BaseProcessModel::get_y_struct() const
{
  return y_struct_;
}

const VariableStruct & BaseProcessModel::get_aux_struct() const
{
  return aux_struct_;
}

const casadi::SX & BaseProcessModel::get_sym(const VariableType & type) const
{
  return symbols_cat_.at(type);
}

const casadi::SX & BaseProcessModel::x() const
{
  return get_sym(STATE);
}

const casadi::SX & BaseProcessModel::u() const
{
  return get_sym(INPUT);
}

const casadi::SX & BaseProcessModel::z() const
{
  return get_sym(ALGEBRAIC);
}

const casadi::SX & BaseProcessModel::p() const
{
  return get_sym(PARAMETER);
}

const casadi::SX & BaseProcessModel::tvp() const
{
  return get_sym(TIME_VARYING_PARAMETER);
}

const casadi::SX & BaseProcessModel::y() const
{
  return y_;
}

const casadi::SX & BaseProcessModel::y_expression() const
{
  return y_expression_;
}

const casadi::SX & BaseProcessModel::aux_expression() const
{
  return aux_expression_;
}

const casadi::Function & BaseProcessModel::rhs_function() const
{
  return rhs_function_;
}

const casadi::Function & BaseProcessModel::alg_function() const
{
  return alg_function_;
}

const casadi::Function & BaseProcessModel::meas_function() const
{
  return meas_function_;
}

const casadi::Function & BaseProcessModel::aux_function() const
{
  return aux_function_;
}

void BaseProcessModel::check_not_setup(const std::string & what) const
{
  if (setup_) {
    throw std::logic_error("Calling " + what + "() is not allowed after the model is set up.");
  }
}

bool BaseProcessModel::name_taken(const std::string & name) const
{
  for (const auto & s : structs_) {
    if (s.second.has_entry(name)) {
      return true;
    }
  }
  return false;
}
}  // namespace base_process_model
}  // namespace process_model
}  // namespace mhe
