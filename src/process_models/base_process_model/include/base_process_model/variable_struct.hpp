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

#ifndef BASE_PROCESS_MODEL__VARIABLE_STRUCT_HPP_
#define BASE_PROCESS_MODEL__VARIABLE_STRUCT_HPP_

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <casadi/casadi.hpp>

namespace mhe
{
namespace process_model
{
namespace base_process_model
{
/**
 * @brief A contiguous range of a flattened structure.
 */
struct Block
{
  casadi_int offset;
  casadi_int size;
};

/**
 * @brief Ordered layout of named entries over a flat column vector.
 * An entry is either a leaf of fixed size or a nested structure,
 * and may be repeated a fixed number of times.
 */
class VariableStruct
{
public:
  struct Entry
  {
    std::string name;
    casadi_int size;  // size of one repetition
    casadi_int repeat;  // number of repetitions, 1 if not repeated
    bool repeated;
    std::shared_ptr<const VariableStruct> child;  // nullptr for leaves
  };

  VariableStruct();

  void add_entry(const std::string & name, const casadi_int & size);
  void add_repeated_entry(
    const std::string & name, const casadi_int & repeat,
    const casadi_int & size);
  void add_struct_entry(const std::string & name, const VariableStruct & child);
  void add_repeated_struct_entry(
    const std::string & name, const casadi_int & repeat,
    const VariableStruct & child);

  casadi_int size() const;
  bool has_entry(const std::string & name) const;
  const Entry & get_entry(const std::string & name) const;
  const std::vector<Entry> & entries() const;
  std::vector<std::string> keys() const;

  /**
   * @brief Flattened labels, one per element, e.g. `[x,0]` or `[_tvp,3,T_in,0]`.
   */
  std::vector<std::string> labels() const;

  /**
   * @brief Whole entry, all repetitions included.
   * @throws std::invalid_argument if the entry does not exist.
   */
  Block block(const std::string & name) const;

  /**
   * @brief One repetition of an entry. Negative indices count from the end.
   * @throws std::out_of_range if the index is out of range.
   */
  Block block(const std::string & name, const casadi_int & index) const;

  /**
   * @brief A child entry inside one repetition of a nested entry.
   */
  Block block(
    const std::string & name, const casadi_int & index,
    const std::string & child_name) const;

  bool operator==(const VariableStruct & other) const;
  bool operator!=(const VariableStruct & other) const;

protected:
  std::vector<Entry> entries_;
  casadi_int size_;

  void add(const Entry & entry);
  void append_labels(const std::string & prefix, std::vector<std::string> & labels) const;
  casadi_int offset(const std::string & name) const;
};

template<typename T>
T get_block(const T & v, const Block & block)
{
  if (block.size == 0) {
    return T::zeros(0, 1);
  }
  return v(casadi::Slice(block.offset, block.offset + block.size));
}

template<typename T>
void set_block(T & v, const Block & block, const T & value)
{
  if (value.numel() != block.size) {
    throw std::length_error(
            "Cannot assign " + std::to_string(value.numel()) + " elements to a block of size " +
            std::to_string(block.size) + ".");
  }
  if (block.size == 0) {
    return;
  }
  v(casadi::Slice(block.offset, block.offset + block.size)) =
    T::reshape(value, block.size, 1);
}

/**
 * @brief Numerical instance of a VariableStruct.
 */
class StructValue
{
public:
  StructValue();
  explicit StructValue(const VariableStruct & layout, const double & fill = 0.0);
  StructValue(const VariableStruct & layout, const casadi::DM & value);

  const VariableStruct & layout() const;
  std::vector<std::string> labels() const;

  const casadi::DM & cat() const;
  void set_cat(const casadi::DM & value);

  casadi::DM get(const std::string & name) const;
  casadi::DM get(const std::string & name, const casadi_int & index) const;
  casadi::DM get(
    const std::string & name, const casadi_int & index,
    const std::string & child_name) const;

  void set(const std::string & name, const casadi::DM & value);
  void set(const std::string & name, const casadi_int & index, const casadi::DM & value);
  void set(
    const std::string & name, const casadi_int & index, const std::string & child_name,
    const casadi::DM & value);

protected:
  VariableStruct layout_;
  casadi::DM value_;
};
}  // namespace base_process_model
}  // namespace process_model
}  // namespace mhe
#endif  // BASE_PROCESS_MODEL__VARIABLE_STRUCT_HPP_
