// Copyright 2022 AI Racing Tech
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

#ifndef MHE_UTILS__CYCLE_PROFILER_HPP_
#define MHE_UTILS__CYCLE_PROFILER_HPP_

#include <mutex>
#include <memory>
#include <sstream>
#include <string>
#include <algorithm>

#include <boost/circular_buffer.hpp>

namespace mhe
{
namespace utils
{
template<typename T = double>
struct Profile
{
  T mean;
  T max;
  T min;

  std::string to_string(const std::string & name) const
  {
    std::stringstream ss;
    ss << name << ": mean " << mean << ", max " << max << ", min " << min;
    return ss.str();
  }
};

/**
 * @brief Keeps the last `window` samples of a per-cycle quantity
 * (solve time, iteration count, ...) and summarizes them.
 */
template<typename T = double>
class CycleProfiler
{
public:
  typedef T Duration;
  typedef std::shared_ptr<CycleProfiler> SharedPtr;
  typedef std::unique_ptr<CycleProfiler> UniquePtr;

  CycleProfiler()
  {
  }

  explicit CycleProfiler(const size_t & window)
  : durations_(window)
  {
  }

  void set_window(const size_t & window)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    durations_.set_capacity(window);
  }

  void add_cycle_stats(const Duration & duration)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    durations_.push_back(duration);
  }

  size_t capacity()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return durations_.capacity();
  }

  size_t size()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return durations_.size();
  }

  void clear()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    durations_.clear();
  }

  Profile<Duration> profile()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Profile<Duration> result{Duration(0), Duration(0), Duration(0)};
    const auto size = durations_.size();
    if (size == 0) {
      return result;
    } else {
      result.max = durations_[0];
      result.min = durations_[0];
    }
    for (const auto & duration : durations_) {
      result.max = std::max(result.max, duration);
      result.min = std::min(result.min, duration);
      result.mean += duration;
    }
    result.mean /= size;
    return result;
  }

protected:
  typedef boost::circular_buffer<Duration> DurationBuffer;

  DurationBuffer durations_;
  std::mutex mutex_;
};
}  // namespace utils
}  // namespace mhe
#endif  // MHE_UTILS__CYCLE_PROFILER_HPP_
