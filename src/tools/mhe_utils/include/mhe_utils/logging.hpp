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

#ifndef MHE_UTILS__LOGGING_HPP_
#define MHE_UTILS__LOGGING_HPP_

#include <stdint.h>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <utility>

#include <rclcpp/rclcpp.hpp>

namespace mhe
{
namespace utils
{
enum LogLevel : uint8_t
{
  DEBUG = 0,
  INFO = 1,
  WARN = 2,
  ERROR = 3,
  FATAL = 4
};

class Logger
{
public:
  typedef std::string LoggerCallbackKey;
  typedef std::function<void (const LogLevel &, const std::string &)> LoggerCallback;

  Logger();

  /**
   * @brief Register a new callback function for this logger.
   *
   * @param name key of this callback. used to unregister it later.
   * @param callback a callback function taking a LogLevel and a std::string message.
   * @param min_level minimum log level to trigger this callback. Default to debug.
   *
   * @note re-registration under the same key overwrites the previous callback and level.
   */
  void register_callback(
    const LoggerCallbackKey & name,
    const LoggerCallback & callback,
    const LogLevel & min_level = LogLevel::DEBUG);

  /**
   * @brief Unregister a callback from the logger.
   *
   * @param name the key the callback was registered with.
   *
   * @returns True if the callback exists and is unregistered.
   * @returns False if the callback was never registered.
   */
  bool unregister_callback(const LoggerCallbackKey & name);

  /**
   * @brief Send a log to the callbacks.
   *
   * @param level log level.
   * @param what message.
   */
  void send_log(const LogLevel & level, const std::string & what);

  bool has_callback(const LoggerCallbackKey & name) const;

  static const char * level_name(const LogLevel & level);

  /**
   * @brief Create a callback that forwards the logs to a ROS 2 logger.
   */
  static LoggerCallback log_to_rclcpp(const rclcpp::Logger & logger);

  /**
   * @brief Create a callback that writes `[LEVEL] message` lines to a stream.
   *
   * @param os output stream. must outlive the callback.
   */
  static LoggerCallback log_to_stream(std::ostream & os);

protected:
  typedef std::map<LoggerCallbackKey, std::pair<LoggerCallback, LogLevel>> LoggerCallbackDict;

  LoggerCallbackDict callbacks_;
};
}  // namespace utils
}  // namespace mhe

#endif  // MHE_UTILS__LOGGING_HPP_
