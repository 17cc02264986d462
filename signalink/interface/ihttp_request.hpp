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

#include <boost/system/error_code.hpp>
#include <functional>
#include <memory>
#include <string>

namespace signalink {
namespace interface {

/**
 * @brief Progress of a streaming HTTP request, ordered so that states can be
 * compared with < and >.
 */
enum class RequestState { Unsent = 0, Opened = 1, HeadersReceived = 2, Loading = 3, Done = 4 };

inline const char* to_cstr(RequestState s) {
  switch (s) {
    case RequestState::Unsent:
      return "Unsent";
    case RequestState::Opened:
      return "Opened";
    case RequestState::HeadersReceived:
      return "HeadersReceived";
    case RequestState::Loading:
      return "Loading";
    case RequestState::Done:
      return "Done";
  }
  return "?";
}

/**
 * @brief One HTTP exchange whose response body is observed as it grows.
 *
 * response_text() always returns the whole body received so far, so every
 * ready-state change delivers a snapshot that extends the previous one.
 * After abort() no callback is invoked.
 */
class HttpRequestInterface {
 public:
  using OnReadyStateChange = std::function<void()>;
  using OnError = std::function<void(const boost::system::error_code&)>;

  virtual ~HttpRequestInterface() = default;

  // Throws std::invalid_argument for a URL that cannot be parsed
  virtual void open(const std::string& method, const std::string& url) = 0;
  virtual void set_request_header(const std::string& name, const std::string& value) = 0;
  virtual void send(const std::string& body) = 0;
  virtual void abort() = 0;

  virtual RequestState ready_state() const = 0;
  virtual unsigned status() const = 0;
  virtual const std::string& response_text() const = 0;

  virtual void on_ready_state_change(OnReadyStateChange cb) = 0;
  virtual void on_error(OnError cb) = 0;
};

using HttpRequestFactory = std::function<std::unique_ptr<HttpRequestInterface>()>;

}  // namespace interface
}  // namespace signalink
