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

#ifndef MHE_ESTIMATOR__MHE_HISTORY_HPP_
#define MHE_ESTIMATOR__MHE_HISTORY_HPP_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <casadi/casadi.hpp>

namespace mhe
{
namespace estimator
{
namespace mhe_estimator
{
/**
 * @brief Append-only record of the estimator steps.
 * Every field is a matrix with one row per record.
 */
class MHEHistory
{
public:
  typedef std::shared_ptr<MHEHistory> SharedPtr;

  MHEHistory();

  /**
   * @brief Drop all records and metadata.
   */
  void init_storage();

  /**
   * @brief Merge entries into the metadata. Existing keys are overwritten.
   */
  void set_meta(const casadi::Dict & meta);
  const casadi::Dict & get_meta() const;

  /**
   * @brief Append one row to each field. Values are flattened column-major.
   *  Empty values are not recorded.
   *
   * @throws std::length_error if a value does not match the width of its field.
   */
  void update(const casadi::DMDict & values);

  bool has_field(const std::string & field) const;
  std::vector<std::string> fields() const;

  /**
   * @brief All records of a field, n_records x width.
   *
   * @throws std::invalid_argument if the field was never written.
   */
  const casadi::DM & get(const std::string & field) const;

  /**
   * @brief Width of a field, 0 if it was never written.
   */
  casadi_int size(const std::string & field) const;

  /**
   * @brief Number of records of a field, 0 if it was never written.
   */
  casadi_int records(const std::string & field) const;

  /**
   * @brief Save every field to `<path_prefix><field>.txt`.
   */
  void save(const std::string & path_prefix) const;

protected:
  std::map<std::string, casadi::DM> data_;
  casadi::Dict meta_;
};
}  // namespace mhe_estimator
}  // namespace estimator
}  // namespace mhe
#endif  // MHE_ESTIMATOR__MHE_HISTORY_HPP_
