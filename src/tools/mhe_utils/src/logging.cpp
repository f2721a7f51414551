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

#include "mhe_utils/logging.hpp"

namespace mhe
{
namespace utils
{
Logger::Logger()
: callbacks_()
{
}

void Logger::register_callback(
  const LoggerCallbackKey & name,
  const LoggerCallback & callback,
  const LogLevel & min_level)
{
  if (!callback) {
    return;
  }
  callbacks_[name] = std::make_pair(callback, min_level);
}

bool Logger::unregister_callback(const LoggerCallbackKey & name)
{
  return callbacks_.erase(name) > 0;
}

bool Logger::has_callback(const LoggerCallbackKey & name) const
{
  return callbacks_.count(name) > 0;
}

void Logger::send_log(const LogLevel & level, const std::string & what)
{
  for (const auto & kv : callbacks_) {
    const auto & callback = kv.second.first;
    const auto & min_level = kv.second.second;
    if (level >= min_level) {
      callback(level, what);
    }
  }
}

const char * Logger::level_name(const LogLevel & level)
{
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    default:
      return "FATAL";
  }
}

Logger::LoggerCallback Logger::log_to_rclcpp(const rclcpp::Logger & logger)
{
  return [logger](const LogLevel & level, const std::string & what)
         {
           if (level == LogLevel::DEBUG) {
             RCLCPP_DEBUG(logger, "%s", what.c_str());
           } else if (level == LogLevel::INFO) {
             RCLCPP_INFO(logger, "%s", what.c_str());
           } else if (level == LogLevel::WARN) {
             RCLCPP_WARN(logger, "%s", what.c_str());
           } else if (level == LogLevel::ERROR) {
             RCLCPP_ERROR(logger, "%s", what.c_str());
           } else {
             RCLCPP_FATAL(logger, "%s", what.c_str());
           }
         };
}

Logger::LoggerCallback Logger::log_to_stream(std::ostream & os)
{
  return [&os](const LogLevel & level, const std::string & what)
         {
           os << "[" << level_name(level) << "] " << what << std::endl;
         };
}
}  // namespace utils
}  // namespace mhe
