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

#include "signalink/transport/http/beast_http_request.hpp"

#include <openssl/err.h>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "signalink/base/constants.hpp"
#include "signalink/diagnostics/error_handler.hpp"
#include "signalink/diagnostics/logger.hpp"

namespace signalink {
namespace transport {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

using interface::RequestState;
using namespace diagnostics;  // For error_reporting namespace

UrlParts parse_http_url(const std::string& url) {
  UrlParts parts;

  std::string rest;
  if (url.compare(0, 7, "http://") == 0) {
    rest = url.substr(7);
  } else if (url.compare(0, 8, "https://") == 0) {
    parts.secure = true;
    rest = url.substr(8);
  } else {
    throw std::invalid_argument("Unsupported URL scheme: " + url);
  }

  const size_t target_pos = rest.find_first_of("/?");
  std::string authority = rest.substr(0, target_pos);
  parts.target = target_pos == std::string::npos ? "/" : rest.substr(target_pos);
  if (parts.target.front() == '?') {
    parts.target.insert(parts.target.begin(), '/');
  }

  if (!authority.empty() && authority.front() == '[') {
    const size_t close = authority.find(']');
    if (close == std::string::npos) {
      throw std::invalid_argument("Malformed IPv6 host in URL: " + url);
    }
    parts.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        throw std::invalid_argument("Malformed authority in URL: " + url);
      }
      parts.port = authority.substr(close + 2);
    }
  } else {
    const size_t colon = authority.rfind(':');
    parts.host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      parts.port = authority.substr(colon + 1);
    }
  }

  if (parts.host.empty()) {
    throw std::invalid_argument("Missing host in URL: " + url);
  }
  if (parts.port.empty()) {
    parts.port = parts.secure ? "443" : "80";
  }
  if (parts.port.find_first_not_of("0123456789") != std::string::npos || parts.port.size() > 5) {
    throw std::invalid_argument("Invalid port in URL: " + url);
  }
  return parts;
}

class BeastHttpRequest::Exchange : public std::enable_shared_from_this<Exchange> {
 public:
  Exchange(net::io_context& ioc, std::shared_ptr<ssl::context> ssl_ctx)
      : ioc_(ioc), ssl_ctx_(std::move(ssl_ctx)), resolver_(ioc) {}

  void open(const std::string& method, const std::string& url) {
    const http::verb verb = http::string_to_verb(to_upper(method));
    if (verb == http::verb::unknown) {
      throw std::invalid_argument("Unsupported HTTP method: " + method);
    }
    if (state_ != RequestState::Unsent) {
      throw std::logic_error("HTTP request already opened");
    }
    url_ = parse_http_url(url);
    if (url_.secure && !ssl_ctx_) {
      throw std::invalid_argument("No TLS context for " + url);
    }

    request_ = http::request<http::string_body>{};
    request_.method(verb);
    request_.target(url_.target);
    request_.version(11);
    request_.set(http::field::host, url_.host + ":" + url_.port);
    request_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    state_ = RequestState::Opened;
  }

  void set_request_header(const std::string& name, const std::string& value) {
    if (state_ != RequestState::Opened || sent_) {
      throw std::logic_error("Request headers can only be set between open() and send()");
    }
    request_.set(name, value);
  }

  void send(const std::string& body) {
    if (state_ != RequestState::Opened || sent_) {
      throw std::logic_error("HTTP request is not open");
    }
    sent_ = true;

    request_.body() = body;
    request_.prepare_payload();

    parser_.emplace();
    parser_->body_limit(base::constants::MAX_RESPONSE_BODY_SIZE);

    if (url_.secure) {
      tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc_, *ssl_ctx_);
    } else {
      plain_ = std::make_unique<beast::tcp_stream>(ioc_);
    }

    auto self = shared_from_this();
    resolver_.async_resolve(url_.host, url_.port,
                            [self](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                              self->on_resolve(ec, std::move(results));
                            });
  }

  void abort() {
    if (aborted_) return;
    aborted_ = true;
    resolver_.cancel();
    close_stream();
    if (state_ != RequestState::Done) {
      state_ = RequestState::Unsent;
    }
  }

  void clear_callbacks() {
    on_change_ = nullptr;
    on_error_ = nullptr;
  }

  RequestState state_ = RequestState::Unsent;
  unsigned status_ = 0;
  std::string response_text_;
  OnReadyStateChange on_change_;
  OnError on_error_;

 private:
  static std::string to_upper(std::string value) {
    for (auto& c : value) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return value;
  }

  void on_resolve(const boost::system::error_code& ec, tcp::resolver::results_type results) {
    if (aborted_) return;
    if (ec) {
      fail("resolve", ec);
      return;
    }

    auto self = shared_from_this();
    auto handler = [self](const boost::system::error_code& ec, const tcp::endpoint&) { self->on_connect(ec); };
    if (tls_) {
      beast::get_lowest_layer(*tls_).async_connect(results, std::move(handler));
    } else {
      plain_->async_connect(results, std::move(handler));
    }
  }

  void on_connect(const boost::system::error_code& ec) {
    if (aborted_) return;
    if (ec) {
      fail("connect", ec);
      return;
    }

    if (!tls_) {
      do_write(*plain_);
      return;
    }

    if (!SSL_set_tlsext_host_name(tls_->native_handle(), url_.host.c_str())) {
      const boost::system::error_code sni_ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
      fail("handshake", sni_ec);
      return;
    }

    auto self = shared_from_this();
    tls_->async_handshake(ssl::stream_base::client, [self](const boost::system::error_code& ec) {
      if (self->aborted_) return;
      if (ec) {
        self->fail("handshake", ec);
        return;
      }
      self->do_write(*self->tls_);
    });
  }

  template <typename Stream>
  void do_write(Stream& stream) {
    auto self = shared_from_this();
    http::async_write(stream, request_, [self, &stream](const boost::system::error_code& ec, std::size_t) {
      if (self->aborted_) return;
      if (ec) {
        self->fail("write", ec);
        return;
      }
      self->do_read(stream);
    });
  }

  template <typename Stream>
  void do_read(Stream& stream) {
    auto self = shared_from_this();
    http::async_read_some(stream, read_buffer_, *parser_,
                          [self, &stream](const boost::system::error_code& ec, std::size_t) {
                            self->on_read(stream, ec);
                          });
  }

  template <typename Stream>
  void on_read(Stream& stream, const boost::system::error_code& ec) {
    if (aborted_) return;
    if (ec) {
      fail("read", ec);
      return;
    }

    if (parser_->is_header_done() && state_ < RequestState::HeadersReceived) {
      status_ = parser_->get().result_int();
      change_state(RequestState::HeadersReceived);
      if (aborted_) return;
    }

    const std::string& body = parser_->get().body();
    if (body.size() != response_text_.size()) {
      response_text_ = body;
      change_state(RequestState::Loading);
      if (aborted_) return;
    }

    if (parser_->is_done()) {
      close_stream();
      change_state(RequestState::Done);
      return;
    }

    do_read(stream);
  }

  void change_state(RequestState state) {
    state_ = state;
    if (on_change_) {
      auto callback = on_change_;
      callback();
    }
  }

  void fail(const char* operation, const boost::system::error_code& ec) {
    SIGNALINK_LOG_DEBUG("http_request", operation, url_.host + url_.target + ": " + ec.message());
    close_stream();
    state_ = RequestState::Done;
    if (on_error_) {
      auto callback = on_error_;
      callback(ec);
    }
  }

  void close_stream() {
    boost::system::error_code ec;
    if (tls_) {
      beast::get_lowest_layer(*tls_).socket().close(ec);
    } else if (plain_) {
      plain_->socket().close(ec);
    }
    if (ec) {
      SIGNALINK_LOG_DEBUG("http_request", "close", "Socket close failed: " + ec.message());
    }
  }

  net::io_context& ioc_;
  std::shared_ptr<ssl::context> ssl_ctx_;
  tcp::resolver resolver_;
  std::unique_ptr<beast::tcp_stream> plain_;
  std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;

  UrlParts url_;
  http::request<http::string_body> request_;
  std::optional<http::response_parser<http::string_body>> parser_;
  beast::flat_buffer read_buffer_{base::constants::DEFAULT_READ_CHUNK_SIZE};
  bool sent_ = false;
  bool aborted_ = false;
};

BeastHttpRequest::BeastHttpRequest(net::io_context& ioc, std::shared_ptr<ssl::context> ssl_ctx)
    : exchange_(std::make_shared<Exchange>(ioc, std::move(ssl_ctx))) {}

BeastHttpRequest::~BeastHttpRequest() {
  exchange_->clear_callbacks();
  exchange_->abort();
}

void BeastHttpRequest::open(const std::string& method, const std::string& url) { exchange_->open(method, url); }

void BeastHttpRequest::set_request_header(const std::string& name, const std::string& value) {
  exchange_->set_request_header(name, value);
}

void BeastHttpRequest::send(const std::string& body) { exchange_->send(body); }

void BeastHttpRequest::abort() { exchange_->abort(); }

RequestState BeastHttpRequest::ready_state() const { return exchange_->state_; }

unsigned BeastHttpRequest::status() const { return exchange_->status_; }

const std::string& BeastHttpRequest::response_text() const { return exchange_->response_text_; }

void BeastHttpRequest::on_ready_state_change(OnReadyStateChange cb) { exchange_->on_change_ = std::move(cb); }

void BeastHttpRequest::on_error(OnError cb) { exchange_->on_error_ = std::move(cb); }

std::shared_ptr<ssl::context> BeastHttpRequest::make_client_ssl_context() {
  auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
  boost::system::error_code ec;
  ctx->set_default_verify_paths(ec);
  if (ec) {
    SIGNALINK_LOG_WARNING("http_request", "ssl_context", "Could not load system trust store: " + ec.message());
    error_reporting::report_system_error("http_request", "ssl_context", "Could not load system trust store", ec);
  }
  ctx->set_verify_mode(ssl::verify_peer);
  return ctx;
}

interface::HttpRequestFactory BeastHttpRequest::factory(net::io_context& ioc) {
  return factory(ioc, make_client_ssl_context());
}

interface::HttpRequestFactory BeastHttpRequest::factory(net::io_context& ioc, std::shared_ptr<ssl::context> ssl_ctx) {
  return [&ioc, ssl_ctx]() -> std::unique_ptr<interface::HttpRequestInterface> {
    return std::make_unique<BeastHttpRequest>(ioc, ssl_ctx);
  };
}

}  // namespace transport
}  // namespace signalink
