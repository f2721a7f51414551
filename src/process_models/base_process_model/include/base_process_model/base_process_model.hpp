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

#ifndef BASE_PROCESS_MODEL__BASE_PROCESS_MODEL_HPP_
#define BASE_PROCESS_MODEL__BASE_PROCESS_MODEL_HPP_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <casadi/casadi.hpp>

#include "base_process_model/variable_struct.hpp"

namespace mhe
{
namespace process_model
{
namespace base_process_model
{
enum ModelType : uint8_t
{
  CONTINUOUS,
  DISCRETE
};

enum VariableType : uint8_t
{
  STATE,
  INPUT,
  ALGEBRAIC,
  PARAMETER,
  TIME_VARYING_PARAMETER
};

/**
 * @brief Symbolic process model.
 *  Variables, measurements, auxiliary expressions and dynamics are declared first,
 *  then `setup()` freezes the model and compiles its functions.
 */
class BaseProcessModel
{
public:
  typedef std::shared_ptr<BaseProcessModel> SharedPtr;
  typedef std::unique_ptr<BaseProcessModel> UniquePtr;

  explicit BaseProcessModel(const ModelType & model_type);

  const ModelType & get_model_type() const;

  /**
   * @brief Declare a new model variable.
   *
   * @param type variable type.
   * @param name unique name among all variables of the model.
   * @param size number of elements.
   * @return casadi::SX the symbol of this variable, to be used in the model expressions.
   *
   * @throws std::logic_error if the model is already set up.
   * @throws std::invalid_argument if the name is taken or the size is not positive.
   */
  casadi::SX set_variable(
    const VariableType & type, const std::string & name,
    const casadi_int & size = 1);

  /**
   * @brief Declare a measured quantity.
   *  A measurement symbol of the same size is created for the measured value.
   *
   * @param name unique measurement name.
   * @param expr model prediction of the measurement.
   * @return casadi::SX the measurement expression.
   */
  casadi::SX set_measurement(const std::string & name, const casadi::SX & expr);

  /**
   * @brief Declare an auxiliary expression. Only used for reporting.
   */
  casadi::SX set_expression(const std::string & name, const casadi::SX & expr);

  /**
   * @brief Set the right hand side of a state.
   *  derivative of the state for continuous models, next state for discrete models.
   */
  void set_rhs(const std::string & state_name, const casadi::SX & expr);

  /**
   * @brief Add algebraic residuals, which are constrained to zero.
   */
  void set_alg(const std::string & name, const casadi::SX & expr);

  /**
   * @brief Freeze the model and compile its functions.
   *
   * @throws std::logic_error if the model is already set up.
   * @throws std::invalid_argument if a state has no right hand side,
   *  or the number of algebraic residuals does not match the algebraic variables.
   */
  void setup();

  const bool & is_setup() const;

  size_t nx() const;
  size_t nu() const;
  size_t nz() const;
  size_t np() const;
  size_t ntvp() const;
  size_t ny() const;
  size_t naux() const;

  /**
   * @brief Layout of a variable type.
   */
  const VariableStruct & get_struct(const VariableType & type) const;
  const VariableStruct & get_y_struct() const;
  const VariableStruct & get_aux_struct() const;

  /**
   * @brief Concatenated symbols of a variable type, in declaration order.
   */
  const casadi::SX & get_sym(const VariableType & type) const;
  const casadi::SX & x() const;
  const casadi::SX & u() const;
  const casadi::SX & z() const;
  const casadi::SX & p() const;
  const casadi::SX & tvp() const;

  /**
   * @brief Concatenated measurement symbols (measured values).
   */
  const casadi::SX & y() const;

  /**
   * @brief Concatenated measurement expressions (model predictions).
   */
  const casadi::SX & y_expression() const;
  const casadi::SX & aux_expression() const;

  /**
   * @brief All functions take "x", "u", "z", "tvp" and "p".
   * Outputs are "rhs", "alg", "y" and "aux" respectively.
   */
  const casadi::Function & rhs_function() const;
  const casadi::Function & alg_function() const;
  const casadi::Function & meas_function() const;
  const casadi::Function & aux_function() const;

protected:
  typedef std::map<VariableType, VariableStruct> StructDict;
  typedef std::map<VariableType, std::vector<casadi::SX>> SymbolDict;
  typedef std::map<VariableType, casadi::SX> SymbolCatDict;

  ModelType model_type_;
  bool setup_;

  StructDict structs_;
  SymbolDict symbols_;
  SymbolCatDict symbols_cat_;

  VariableStruct y_struct_;
  std::vector<casadi::SX> y_symbols_;
  std::vector<casadi::SX> y_expressions_;
  casadi::SX y_;
  casadi::SX y_expression_;

  VariableStruct aux_struct_;
  std::vector<casadi::SX> aux_expressions_;
  casadi::SX aux_expression_;

  std::map<std::string, casadi::SX> rhs_;
  VariableStruct alg_struct_;
  std::vector<casadi::SX> alg_expressions_;

  casadi::Function rhs_function_ {};
  casadi::Function alg_function_ {};
  casadi::Function meas_function_ {};
  casadi::Function aux_function_ {};

  void check_not_setup(const std::string & what) const;
  bool name_taken(const std::string & name) const;
};
}  // namespace base_process_model
}  // namespace process_model
}  // namespace mhe
#endif  // BASE_PROCESS_MODEL__BASE_PROCESS_MODEL_HPP_
