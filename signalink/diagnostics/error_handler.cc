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

#include "signalink/diagnostics/error_handler.hpp"

#include <exception>

#include "signalink/base/constants.hpp"
#include "signalink/diagnostics/logger.hpp"

namespace signalink {
namespace diagnostics {

ErrorHandler::ErrorHandler() = default;
ErrorHandler::~ErrorHandler() = default;

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler instance;
  return instance;
}

void ErrorHandler::report_error(const ErrorInfo& error) {
  if (!enabled_.load() || error.level < min_level_.load()) return;

  std::vector<ErrorCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    record(error);
    callbacks = callbacks_;
  }

  // Outside the lock so a callback may query the handler
  for (const auto& callback : callbacks) {
    try {
      callback(error);
    } catch (const std::exception& e) {
      SIGNALINK_LOG_ERROR("error_handler", "callback", "Error in error callback: " + std::string(e.what()));
    }
  }
}

void ErrorHandler::register_callback(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ErrorHandler::clear_callbacks() {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.clear();
}

void ErrorHandler::set_min_error_level(ErrorLevel level) { min_level_.store(level); }

ErrorLevel ErrorHandler::get_min_error_level() const { return min_level_.load(); }

void ErrorHandler::set_enabled(bool enabled) { enabled_.store(enabled); }

bool ErrorHandler::is_enabled() const { return enabled_.load(); }

ErrorStats ErrorHandler::get_error_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void ErrorHandler::reset_stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_.reset();
  history_.clear();
  reports_by_component_.clear();
}

std::vector<ErrorInfo> ErrorHandler::get_recent_errors(size_t count, const std::string& component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ErrorInfo> newest_first;
  for (auto it = history_.rbegin(); it != history_.rend() && newest_first.size() < count; ++it) {
    if (component.empty() || it->component == component) newest_first.push_back(*it);
  }
  return std::vector<ErrorInfo>(newest_first.rbegin(), newest_first.rend());
}

bool ErrorHandler::has_errors(const std::string& component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reports_by_component_.count(component) > 0;
}

void ErrorHandler::record(const ErrorInfo& error) {
  ++stats_.total_errors;
  ++stats_.errors_by_level[static_cast<size_t>(error.level)];
  ++stats_.errors_by_category[static_cast<size_t>(error.category)];
  if (error.retryable) ++stats_.retryable_errors;
  if (stats_.total_errors == 1) stats_.first_error = error.timestamp;
  stats_.last_error = error.timestamp;

  ++reports_by_component_[error.component];

  history_.push_back(error);
  while (history_.size() > base::constants::DEFAULT_MAX_RECENT_ERRORS) history_.pop_front();
}

namespace error_reporting {

namespace {

void report(ErrorLevel level, ErrorCategory category, const std::string& component, const std::string& operation,
            const std::string& message, const boost::system::error_code& ec = {}, bool retryable = false) {
  ErrorHandler::instance().report_error(ErrorInfo(level, category, component, operation, message, ec, retryable));
}

}  // namespace

void report_connection_error(const std::string& component, const std::string& operation,
                             const boost::system::error_code& ec, bool retryable) {
  report(ErrorLevel::ERROR, ErrorCategory::CONNECTION, component, operation, ec.message(), ec, retryable);
}

void report_communication_error(const std::string& component, const std::string& operation, const std::string& message,
                                bool retryable) {
  report(ErrorLevel::ERROR, ErrorCategory::COMMUNICATION, component, operation, message, {}, retryable);
}

void report_protocol_error(const std::string& component, const std::string& operation, const std::string& message) {
  report(ErrorLevel::WARNING, ErrorCategory::PROTOCOL, component, operation, message);
}

void report_configuration_error(const std::string& component, const std::string& operation,
                                const std::string& message) {
  report(ErrorLevel::ERROR, ErrorCategory::CONFIGURATION, component, operation, message);
}

void report_system_error(const std::string& component, const std::string& operation, const std::string& message,
                         const boost::system::error_code& ec) {
  report(ErrorLevel::ERROR, ErrorCategory::SYSTEM, component, operation, message, ec);
}

void report_warning(const std::string& component, const std::string& operation, const std::string& message) {
  report(ErrorLevel::WARNING, ErrorCategory::UNKNOWN, component, operation, message);
}

void report_info(const std::string& component, const std::string& operation, const std::string& message) {
  report(ErrorLevel::INFO, ErrorCategory::UNKNOWN, component, operation, message);
}

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace signalink
