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

#include <stdexcept>
#include <string>

namespace signalink {

/**
 * @brief Base exception class for all signalink exceptions
 *
 * Only thrown while a channel is being assembled. Once a channel runs,
 * failures are reported through events and the ErrorHandler.
 */
class SignalinkException : public std::runtime_error {
 public:
  explicit SignalinkException(const std::string& message, const std::string& component = "",
                              const std::string& operation = "")
      : std::runtime_error(message), component_(component), operation_(operation) {}

  const std::string& get_component() const noexcept { return component_; }
  const std::string& get_operation() const noexcept { return operation_; }

  std::string get_full_message() const {
    std::string full_msg = what();
    if (!component_.empty()) {
      full_msg = "[" + component_ + "] " + full_msg;
    }
    if (!operation_.empty()) {
      full_msg += " (operation: " + operation_ + ")";
    }
    return full_msg;
  }

 private:
  std::string component_;
  std::string operation_;
};

/**
 * @brief Exception thrown when a channel configuration is rejected
 */
class ConfigurationException : public SignalinkException {
 public:
  explicit ConfigurationException(const std::string& message, const std::string& parameter = "")
      : SignalinkException(message, "config", "validate"), parameter_(parameter) {}

  const std::string& get_parameter() const noexcept { return parameter_; }

  std::string get_full_message() const {
    std::string full_msg = SignalinkException::get_full_message();
    if (!parameter_.empty()) {
      full_msg += " (parameter: " + parameter_ + ")";
    }
    return full_msg;
  }

 private:
  std::string parameter_;
};

}  // namespace signalink
