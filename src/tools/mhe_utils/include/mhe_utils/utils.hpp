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

#ifndef MHE_UTILS__UTILS_HPP_
#define MHE_UTILS__UTILS_HPP_

#include <map>
#include <string>
#include <vector>

#include "casadi/casadi.hpp"

namespace mhe
{
namespace utils
{
/**
 * @brief vertcat that always returns a column, also for an empty list.
 */
template<typename T>
T vertcat_column(const std::vector<T> & v)
{
  if (v.empty()) {
    return T::zeros(0, 1);
  }
  return T::vertcat(v);
}

/**
 * @brief Check if the free symbols of an expression are all contained in a set of symbols.
 *
 * @param expr expression to check.
 * @param allowed symbolic vectors the expression is allowed to depend on.
 * @param offending output. names of the symbols outside of `allowed`.
 * @return true if `expr` only depends on `allowed`.
 */
bool depends_only_on(
  const casadi::SX & expr, const std::vector<casadi::SX> & allowed,
  std::vector<std::string> & offending);

/**
 * @brief Lagrange polynomial coefficients on the roots [0, tau_1, ..., tau_d].
 *
 * @param tau_root collocation roots including the leading 0.
 * @param C C[r][j] is the derivative of the r-th basis polynomial at tau_j.
 * @param D D[r] is the r-th basis polynomial evaluated at 1.
 */
void collocation_coefficients(
  const std::vector<double> & tau_root,
  std::vector<std::vector<double>> & C,
  std::vector<double> & D);

/**
 * @brief Create the per-step transition of an orthogonal collocation scheme.
 *
 * @param n dimensions "x", "u", "z", "tvp", "p".
 * @param dt length of one step.
 * @param deg degree of the collocation polynomial.
 * @param ni number of finite elements per step.
 * @param collocation_type "radau" or "legendre".
 * @param rhs continuous dynamics with inputs `x`, `u`, `z`, `tvp`, `p` and output `rhs`.
 * @param alg algebraic residuals with the same inputs and output `alg`.
 * @return casadi::Function with inputs `x0`, `x_coll`, `u`, `z`, `tvp`, `p`
 *  and outputs `g` (defect) and `xf` (predicted state at the end of the step).
 *  `x_coll` holds ni * (deg + 1) states: every collocation point of the step
 *  except `x0`, the last one being the end of the step. `z` holds ni * (deg + 1) + 1
 *  algebraic vectors, one for `x0` and one for each point of `x_coll`.
 */
casadi::Function collocation_function(
  const std::map<std::string, casadi_int> & n, const double & dt,
  const casadi_int & deg, const casadi_int & ni,
  const std::string & collocation_type,
  const casadi::Function & rhs, const casadi::Function & alg);

/**
 * @brief Create the per-step transition of a discrete time model.
 *
 * @return casadi::Function with the same signature as `collocation_function`.
 *  `x_coll` is empty, `g` holds the algebraic residuals and `xf` the next state.
 */
casadi::Function discrete_transition_function(
  const std::map<std::string, casadi_int> & n,
  const casadi::Function & rhs, const casadi::Function & alg);
}  // namespace utils
}  // namespace mhe

#endif  // MHE_UTILS__UTILS_HPP_
