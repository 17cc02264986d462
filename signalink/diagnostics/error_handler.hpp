/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "signalink/base/visibility.hpp"
#include "signalink/diagnostics/error_types.hpp"

namespace signalink {
namespace diagnostics {

/**
 * @brief Centralized error handling system
 *
 * Collects transport-internal failures that are absorbed by the channel
 * (poll send failures, malformed lines, failover triggers) so they remain
 * observable without crossing the channel boundary as exceptions.
 */
class SIGNALINK_API ErrorHandler {
 public:
  using ErrorCallback = std::function<void(const ErrorInfo&)>;

  static ErrorHandler& instance();

  ErrorHandler();
  ~ErrorHandler();

  /**
   * @brief Report an error
   * @param error Error information to report
   */
  void report_error(const ErrorInfo& error);

  void register_callback(ErrorCallback callback);
  void clear_callbacks();

  /**
   * @brief Set minimum error level to report
   * @param level Minimum level (errors below this level are ignored)
   */
  void set_min_error_level(ErrorLevel level);
  ErrorLevel get_min_error_level() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  ErrorStats get_error_stats() const;

  /**
   * @brief Reset statistics and the recorded error history
   */
  void reset_stats();

  /**
   * @brief Newest recorded errors, oldest first
   * @param count Maximum number of errors to return
   * @param component Only errors from this component; empty means any
   */
  std::vector<ErrorInfo> get_recent_errors(size_t count = 10, const std::string& component = "") const;

  // True once the component reported anything since the last reset
  bool has_errors(const std::string& component) const;

 private:
  ErrorHandler(const ErrorHandler&) = delete;
  ErrorHandler& operator=(const ErrorHandler&) = delete;

  void record(const ErrorInfo& error);

  mutable std::mutex mutex_;
  std::vector<ErrorCallback> callbacks_;
  std::atomic<ErrorLevel> min_level_{ErrorLevel::INFO};
  std::atomic<bool> enabled_{true};

  ErrorStats stats_;
  std::deque<ErrorInfo> history_;
  std::map<std::string, size_t> reports_by_component_;
};

/**
 * @brief Convenience functions for common error reporting scenarios
 */
namespace error_reporting {

/**
 * @brief Report connection-related error (connect failure, disconnect, failover)
 */
SIGNALINK_API void report_connection_error(const std::string& component, const std::string& operation,
                                           const boost::system::error_code& ec, bool retryable = true);

/**
 * @brief Report communication-related error (request send, read, write)
 */
SIGNALINK_API void report_communication_error(const std::string& component, const std::string& operation,
                                              const std::string& message, bool retryable = false);

/**
 * @brief Report protocol error (malformed server line, invalid outbound message)
 */
SIGNALINK_API void report_protocol_error(const std::string& component, const std::string& operation,
                                         const std::string& message);

SIGNALINK_API void report_configuration_error(const std::string& component, const std::string& operation,
                                              const std::string& message);

SIGNALINK_API void report_system_error(const std::string& component, const std::string& operation,
                                       const std::string& message,
                                       const boost::system::error_code& ec = boost::system::error_code{});

SIGNALINK_API void report_warning(const std::string& component, const std::string& operation,
                                  const std::string& message);

SIGNALINK_API void report_info(const std::string& component, const std::string& operation,
                               const std::string& message);

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace signalink
