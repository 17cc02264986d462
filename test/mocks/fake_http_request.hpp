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
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "signalink/interface/ihttp_request.hpp"

namespace signalink {
namespace test {

using interface::RequestState;

/**
 * @brief Server side of one fake HTTP exchange.
 *
 * Outlives the request object handed to the code under test, so a test can
 * still inspect it after the request was aborted or destroyed.
 */
struct FakeHttpExchange {
  std::string method;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  bool sent = false;
  bool aborted = false;
  bool destroyed = false;

  RequestState state = RequestState::Unsent;
  unsigned status = 0;
  std::string response_text;

  interface::HttpRequestInterface::OnReadyStateChange on_change;
  interface::HttpRequestInterface::OnError on_error;

  bool active() const { return sent && !aborted && !destroyed; }

  void receive_headers(unsigned status_code = 200) {
    if (!active()) return;
    status = status_code;
    change_state(RequestState::HeadersReceived);
  }

  // Append to the body; headers are implied if they have not arrived yet
  void receive(const std::string& chunk) {
    if (!active()) return;
    if (state < RequestState::HeadersReceived) receive_headers();
    if (!active()) return;
    response_text += chunk;
    change_state(RequestState::Loading);
  }

  void finish() {
    if (!active()) return;
    change_state(RequestState::Done);
  }

  void fail(const boost::system::error_code& ec) {
    if (!active()) return;
    state = RequestState::Done;
    if (on_error) {
      auto callback = on_error;
      callback(ec);
    }
  }

 private:
  void change_state(RequestState next) {
    state = next;
    if (on_change) {
      auto callback = on_change;
      callback();
    }
  }
};

class FakeHttpRequest : public interface::HttpRequestInterface {
 public:
  FakeHttpRequest(std::shared_ptr<FakeHttpExchange> exchange, bool throw_on_send)
      : exchange_(std::move(exchange)), throw_on_send_(throw_on_send) {}

  ~FakeHttpRequest() override {
    exchange_->destroyed = true;
    exchange_->on_change = nullptr;
    exchange_->on_error = nullptr;
  }

  void open(const std::string& method, const std::string& url) override {
    if (url.compare(0, 4, "http") != 0) throw std::invalid_argument("bad url: " + url);
    exchange_->method = method;
    exchange_->url = url;
    exchange_->state = RequestState::Opened;
  }

  void set_request_header(const std::string& name, const std::string& value) override {
    exchange_->headers[name] = value;
  }

  void send(const std::string& body) override {
    if (throw_on_send_) throw std::runtime_error("network unavailable");
    exchange_->body = body;
    exchange_->sent = true;
  }

  void abort() override {
    exchange_->aborted = true;
    if (exchange_->state != RequestState::Done) exchange_->state = RequestState::Unsent;
  }

  RequestState ready_state() const override { return exchange_->state; }
  unsigned status() const override { return exchange_->status; }
  const std::string& response_text() const override { return exchange_->response_text; }

  void on_ready_state_change(OnReadyStateChange cb) override { exchange_->on_change = std::move(cb); }
  void on_error(OnError cb) override { exchange_->on_error = std::move(cb); }

 private:
  std::shared_ptr<FakeHttpExchange> exchange_;
  bool throw_on_send_;
};

/**
 * @brief Records every request created through its factory
 */
class FakeHttpBackend {
 public:
  interface::HttpRequestFactory factory() {
    return [this]() -> std::unique_ptr<interface::HttpRequestInterface> {
      auto exchange = std::make_shared<FakeHttpExchange>();
      exchanges_.push_back(exchange);
      return std::make_unique<FakeHttpRequest>(exchange, throw_on_send_);
    };
  }

  void set_throw_on_send(bool enabled) { throw_on_send_ = enabled; }

  const std::vector<std::shared_ptr<FakeHttpExchange>>& exchanges() const { return exchanges_; }

  // Long-poll requests in creation order
  std::vector<std::shared_ptr<FakeHttpExchange>> polls() const { return filter(true); }
  // Outbound message posts in creation order
  std::vector<std::shared_ptr<FakeHttpExchange>> posts() const { return filter(false); }

  std::shared_ptr<FakeHttpExchange> poll(size_t index) const {
    auto all = polls();
    return index < all.size() ? all[index] : nullptr;
  }

 private:
  std::vector<std::shared_ptr<FakeHttpExchange>> filter(bool want_polls) const {
    std::vector<std::shared_ptr<FakeHttpExchange>> result;
    for (const auto& exchange : exchanges_) {
      const bool is_poll = exchange->url.find("/id?i=") != std::string::npos;
      if (is_poll == want_polls) result.push_back(exchange);
    }
    return result;
  }

  std::vector<std::shared_ptr<FakeHttpExchange>> exchanges_;
  bool throw_on_send_ = false;
};

}  // namespace test
}  // namespace signalink
