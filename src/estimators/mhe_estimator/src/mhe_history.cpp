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

#include "mhe_estimator/mhe_history.hpp"

namespace mhe
{
namespace estimator
{
namespace mhe_estimator
{
MHEHistory::MHEHistory()
: data_(), meta_()
{
}

void MHEHistory::init_storage()
{
  data_.clear();
  meta_.clear();
}

void MHEHistory::set_meta(const casadi::Dict & meta)
{
  for (const auto & kv : meta) {
    meta_[kv.first] = kv.second;
  }
}

const casadi::Dict & MHEHistory::get_meta() const
{
  return meta_;
}

void MHEHistory::update(const casadi::DMDict & values)
{
  // a failed update leaves the record untouched
  for (const auto & kv : values) {
    if (has_field(kv.first) && data_.at(kv.first).size2() != kv.second.numel()) {
      throw std::length_error(
              "Cannot append " + std::to_string(kv.second.numel()) + " values to field \"" +
              kv.first + "\" of width " + std::to_string(data_.at(kv.first).size2()) + ".");
    }
  }
  for (const auto & kv : values) {
    if (kv.second.numel() == 0) {
      continue;
    }
    const auto row = casadi::DM::reshape(kv.second, 1, kv.second.numel());
    if (has_field(kv.first)) {
      data_[kv.first] = casadi::DM::vertcat({data_.at(kv.first), row});
    } else {
      data_[kv.first] = row;
    }
  }
}

bool MHEHistory::has_field(const std::string & field) const
{
  return data_.count(field) > 0;
}

std::vector<std::string> MHEHistory::fields() const
{
  std::vector<std::string> fields;
  for (const auto & kv : data_) {
    fields.push_back(kv.first);
  }
  return fields;
}

const casadi::DM & MHEHistory::get(const std::string & field) const
{
  if (!has_field(field)) {
    throw std::invalid_argument("Field \"" + field + "\" has no records.");
  }
  return data_.at(field);
}

casadi_int MHEHistory::size(const std::string & field) const
{
  return has_field(field) ? data_.at(field).size2() : 0;
}

casadi_int MHEHistory::records(const std::string & field) const
{
  return has_field(field) ? data_.at(field).size1() : 0;
}

void MHEHistory::save(const std::string & path_prefix) const
{
  for (const auto & kv : data_) {
    kv.second.to_file(path_prefix + kv.first + ".txt", "txt");
  }
}
}  // namespace mhe_estimator
}  // namespace estimator
}  // namespace mhe
