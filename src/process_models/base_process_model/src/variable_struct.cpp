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

#include <memory>
#include <string>
#include <vector>

#include "base_process_model/variable_struct.hpp"

namespace mhe
{
namespace process_model
{
namespace base_process_model
{
VariableStruct::VariableStruct()
: entries_(), size_(0)
{
}

void VariableStruct::add_entry(const std::string & name, const casadi_int & size)
{
  add(Entry{name, size, 1, false, nullptr});
}

void VariableStruct::add_repeated_entry(
  const std::string & name, const casadi_int & repeat,
  const casadi_int & size)
{
  add(Entry{name, size, repeat, true, nullptr});
}

void VariableStruct::add_struct_entry(const std::string & name, const VariableStruct & child)
{
  add(Entry{name, child.size(), 1, false, std::make_shared<const VariableStruct>(child)});
}

void VariableStruct::add_repeated_struct_entry(
  const std::string & name, const casadi_int & repeat,
  const VariableStruct & child)
{
  add(Entry{name, child.size(), repeat, true, std::make_shared<const VariableStruct>(child)});
}

void VariableStruct::add(const Entry & entry)
{
  if (has_entry(entry.name)) {
    throw std::invalid_argument("Entry \"" + entry.name + "\" already exists.");
  }
  if (entry.size < 0 || entry.repeat < 0) {
    throw std::invalid_argument("Entry \"" + entry.name + "\" has a negative dimension.");
  }
  entries_.push_back(entry);
  size_ += entry.size * entry.repeat;
}

casadi_int VariableStruct::size() const
{
  return size_;
}

bool VariableStruct::has_entry(const std::string & name) const
{
  for (const auto & entry : entries_) {
    if (entry.name == name) {
      return true;
    }
  }
  return false;
}

const VariableStruct::Entry & VariableStruct::get_entry(const std::string & name) const
{
  for (const auto & entry : entries_) {
    if (entry.name == name) {
      return entry;
    }
  }
  throw std::invalid_argument("Entry \"" + name + "\" does not exist.");
}

const std::vector<VariableStruct::Entry> & VariableStruct::entries() const
{
  return entries_;
}

std::vector<std::string> VariableStruct::keys() const
{
  std::vector<std::string> keys;
  for (const auto & entry : entries_) {
    keys.push_back(entry.name);
  }
  return keys;
}

std::vector<std::string> VariableStruct::labels() const
{
  std::vector<std::string> labels;
  labels.reserve(size_);
  append_labels("", labels);
  return labels;
}

void VariableStruct::append_labels(
  const std::string & prefix,
  std::vector<std::string> & labels) const
{
  for (const auto & entry : entries_) {
    const auto entry_prefix = prefix + entry.name + ",";
    for (casadi_int k = 0; k < entry.repeat; k++) {
      const auto rep_prefix =
        entry.repeated ? entry_prefix + std::to_string(k) + "," : entry_prefix;
      if (entry.child) {
        entry.child->append_labels(rep_prefix, labels);
      } else {
        for (casadi_int i = 0; i < entry.size; i++) {
          labels.push_back("[" + rep_prefix + std::to_string(i) + "]");
        }
      }
    }
  }
}

casadi_int VariableStruct::offset(const std::string & name) const
{
  casadi_int offset = 0;
  for (const auto & entry : entries_) {
    if (entry.name == name) {
      return offset;
    }
    offset += entry.size * entry.repeat;
  }
  throw std::invalid_argument("Entry \"" + name + "\" does not exist.");
}

Block VariableStruct::block(const std::string & name) const
{
  const auto & entry = get_entry(name);
  return Block{offset(name), entry.size * entry.repeat};
}

Block VariableStruct::block(const std::string & name, const casadi_int & index) const
{
  const auto & entry = get_entry(name);
  if (!entry.repeated) {
    throw std::invalid_argument("Entry \"" + name + "\" is not repeated.");
  }
  const auto i = index < 0 ? index + entry.repeat : index;
  if (i < 0 || i >= entry.repeat) {
    throw std::out_of_range(
            "Index " + std::to_string(index) + " is out of range for entry \"" + name +
            "\" with " + std::to_string(entry.repeat) + " repetitions.");
  }
  return Block{offset(name) + i * entry.size, entry.size};
}

Block VariableStruct::block(
  const std::string & name, const casadi_int & index,
  const std::string & child_name) const
{
  const auto & entry = get_entry(name);
  if (!entry.child) {
    throw std::invalid_argument("Entry \"" + name + "\" has no nested structure.");
  }
  const auto outer = block(name, index);
  const auto inner = entry.child->block(child_name);
  return Block{outer.offset + inner.offset, inner.size};
}

bool VariableStruct::operator==(const VariableStruct & other) const
{
  return size_ == other.size_ && labels() == other.labels();
}

bool VariableStruct::operator!=(const VariableStruct & other) const
{
  return !(*this == other);
}

StructValue::StructValue()
: layout_(), value_(casadi::DM::zeros(0, 1))
{
}

StructValue::StructValue(const VariableStruct & layout, const double & fill)
: layout_(layout), value_(casadi::DM::ones(layout.size(), 1) * fill)
{
}

StructValue::StructValue(const VariableStruct & layout, const casadi::DM & value)
: layout_(layout), value_(casadi::DM::zeros(layout.size(), 1))
{
  set_cat(value);
}

const VariableStruct & StructValue::layout() const
{
  return layout_;
}

std::vector<std::string> StructValue::labels() const
{
  return layout_.labels();
}

const casadi::DM & StructValue::cat() const
{
  return value_;
}

void StructValue::set_cat(const casadi::DM & value)
{
  set_block(value_, Block{0, layout_.size()}, value);
}

casadi::DM StructValue::get(const std::string & name) const
{
  return get_block(value_, layout_.block(name));
}

casadi::DM StructValue::get(const std::string & name, const casadi_int & index) const
{
  return get_block(value_, layout_.block(name, index));
}

casadi::DM StructValue::get(
  const std::string & name, const casadi_int & index,
  const std::string & child_name) const
{
  return get_block(value_, layout_.block(name, index, child_name));
}

void StructValue::set(const std::string & name, const casadi::DM & value)
{
  const auto block = layout_.block(name);
  // a single value fills the whole entry
  if (value.is_scalar() && block.size != 1) {
    set_block(value_, block, casadi::DM::ones(block.size, 1) * value);
  } else {
    set_block(value_, block, value);
  }
}

void StructValue::set(
  const std::string & name, const casadi_int & index,
  const casadi::DM & value)
{
  set_block(value_, layout_.block(name, index), value);
}

void StructValue::set(
  const std::string & name, const casadi_int & index, const std::string & child_name,
  const casadi::DM & value)
{
  set_block(value_, layout_.block(name, index, child_name), value);
}
}  // namespace base_process_model
}  // namespace process_model
}  // namespace mhe
