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

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <memory>
#include <string>

#include "signalink/base/visibility.hpp"
#include "signalink/interface/ihttp_request.hpp"

namespace signalink {
namespace transport {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

struct UrlParts {
  bool secure = false;
  std::string host;
  std::string port;
  std::string target;  // path and query, never empty
};

/**
 * @brief Split an http:// or https:// URL.
 * @throws std::invalid_argument for any other scheme or a missing host
 */
SIGNALINK_API UrlParts parse_http_url(const std::string& url);

/**
 * @brief Boost.Beast implementation of HttpRequestInterface.
 *
 * The response is read with a Beast parser one read at a time. A
 * ready-state change is signalled once the header is complete, after every
 * read that grew the body, and when the message is complete.
 *
 * The I/O state lives in a shared exchange object, so destroying the request
 * while operations are pending is safe; it behaves like abort().
 */
class SIGNALINK_API BeastHttpRequest : public interface::HttpRequestInterface {
 public:
  BeastHttpRequest(net::io_context& ioc, std::shared_ptr<ssl::context> ssl_ctx);
  ~BeastHttpRequest() override;

  BeastHttpRequest(const BeastHttpRequest&) = delete;
  BeastHttpRequest& operator=(const BeastHttpRequest&) = delete;

  void open(const std::string& method, const std::string& url) override;
  void set_request_header(const std::string& name, const std::string& value) override;
  // Throws std::logic_error unless open() succeeded and nothing was sent yet
  void send(const std::string& body) override;
  void abort() override;

  interface::RequestState ready_state() const override;
  unsigned status() const override;
  const std::string& response_text() const override;

  void on_ready_state_change(OnReadyStateChange cb) override;
  void on_error(OnError cb) override;

  // TLS client context verifying peers against the system trust store
  static std::shared_ptr<ssl::context> make_client_ssl_context();

  static interface::HttpRequestFactory factory(net::io_context& ioc);
  static interface::HttpRequestFactory factory(net::io_context& ioc, std::shared_ptr<ssl::context> ssl_ctx);

 private:
  class Exchange;
  std::shared_ptr<Exchange> exchange_;
};

}  // namespace transport
}  // namespace signalink
