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
#include <string>
#include <vector>

#include <mhe_utils/utils.hpp>

#include "mhe_estimator/mhe_exceptions.hpp"
#include "mhe_estimator/parameter_partition.hpp"

namespace mhe
{
namespace estimator
{
namespace mhe_estimator
{
using mhe::process_model::base_process_model::get_block;

ParameterPartition::ParameterPartition(
  const VariableStruct & p_struct,
  const std::vector<std::string> & p_est_names)
: p_struct_(p_struct)
{
  using casadi::SX;
  for (const auto & name : p_est_names) {
    if (!p_struct_.has_entry(name)) {
      throw ConfigurationException(
              "\"" + name + "\" is not a parameter of the model and cannot be estimated.");
    }
  }
  for (const auto & entry : p_struct_.entries()) {
    if (std::find(p_est_names.begin(), p_est_names.end(), entry.name) != p_est_names.end()) {
      p_est_struct_.add_entry(entry.name, entry.size);
    } else {
      p_fix_struct_.add_entry(entry.name, entry.size);
    }
  }

  const auto p_est = SX::sym("p_est", p_est_struct_.size(), 1);
  const auto p_fix = SX::sym("p_fix", p_fix_struct_.size(), 1);
  std::vector<SX> p;
  for (const auto & entry : p_struct_.entries()) {
    if (p_est_struct_.has_entry(entry.name)) {
      p.push_back(get_block(p_est, p_est_struct_.block(entry.name)));
    } else {
      p.push_back(get_block(p_fix, p_fix_struct_.block(entry.name)));
    }
  }
  recombine_ = casadi::Function(
    "p_cat_fun", {p_est, p_fix}, {utils::vertcat_column(p)}, {"p_est", "p_fix"}, {"p"});
}

const VariableStruct & ParameterPartition::get_p_struct() const
{
  return p_struct_;
}

const VariableStruct & ParameterPartition::get_p_est_struct() const
{
  return p_est_struct_;
}

const VariableStruct & ParameterPartition::get_p_fix_struct() const
{
  return p_fix_struct_;
}

bool ParameterPartition::is_estimated(const std::string & name) const
{
  return p_est_struct_.has_entry(name);
}

casadi_int ParameterPartition::n_est() const
{
  return p_est_struct_.size();
}

casadi_int ParameterPartition::n_fix() const
{
  return p_fix_struct_.size();
}

const casadi::Function & ParameterPartition::recombine_function() const
{
  return recombine_;
}

casadi::SX ParameterPartition::recombine(const casadi::SX & p_est, const casadi::SX & p_fix) const
{
  return recombine_(casadi::SXDict{{"p_est", p_est}, {"p_fix", p_fix}}).at("p");
}

casadi::DM ParameterPartition::recombine(const casadi::DM & p_est, const casadi::DM & p_fix) const
{
  return recombine_(casadi::DMDict{{"p_est", p_est}, {"p_fix", p_fix}}).at("p");
}
}  // namespace mhe_estimator
}  // namespace estimator
}  // namespace mhe
