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

#ifndef MHE_ESTIMATOR__MHE_EXCEPTIONS_HPP_
#define MHE_ESTIMATOR__MHE_EXCEPTIONS_HPP_

#include <exception>
#include <string>
#include <vector>

namespace mhe
{
namespace estimator
{
namespace mhe_estimator
{
class MHEException : public std::exception
{
public:
  explicit MHEException(const std::string & msg)
  : msg_(msg)
  {
  }

  const char * what() const noexcept override
  {
    return msg_.c_str();
  }

protected:
  std::string msg_;
};

/**
 * @brief A mandatory registration or setting is missing or invalid.
 */
class ConfigurationException : public MHEException
{
public:
  explicit ConfigurationException(const std::string & msg)
  : MHEException("Configuration error: " + msg)
  {
  }
};

/**
 * @brief A user supplied value does not match its structural template.
 */
class ShapeMismatchException : public MHEException
{
public:
  explicit ShapeMismatchException(const std::string & msg)
  : MHEException("Shape mismatch: " + msg)
  {
  }
};

/**
 * @brief An expression depends on symbols it is not allowed to use.
 */
class DomainException : public MHEException
{
public:
  DomainException(const std::string & what, const std::vector<std::string> & symbols)
  : MHEException(what + " depends on symbols outside of its domain:")
  {
    for (const auto & s : symbols) {
      msg_ += " " + s;
    }
    msg_ += ".";
  }
};

class BoundsException : public MHEException
{
public:
  /**
   * @param offending labels of every component that violates its bounds.
   */
  BoundsException(const std::string & what, const std::vector<std::string> & offending)
  : MHEException(what), offending_(offending)
  {
    for (const auto & label : offending_) {
      msg_ += " " + label;
    }
  }

  const std::vector<std::string> & get_offending() const
  {
    return offending_;
  }

protected:
  std::vector<std::string> offending_;
};

/**
 * @brief The call is not permitted in the current lifecycle stage of the estimator.
 */
class StateException : public MHEException
{
public:
  explicit StateException(const std::string & msg)
  : MHEException(msg)
  {
  }
};
}  // namespace mhe_estimator
}  // namespace estimator
}  // namespace mhe
#endif  // MHE_ESTIMATOR__MHE_EXCEPTIONS_HPP_
