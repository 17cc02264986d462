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

#include "signalink/transport/http_stream/chained_poll_request.hpp"

#include "signalink/base/constants.hpp"
#include "signalink/diagnostics/logger.hpp"

namespace signalink {
namespace transport {

using interface::RequestState;

ChainedPollRequest::ChainedPollRequest(uint32_t stream_index, std::string http_url,
                                       std::unique_ptr<interface::HttpRequestInterface> request,
                                       std::unique_ptr<interface::TimerInterface> open_timer)
    : stream_index_(stream_index),
      http_url_(std::move(http_url)),
      request_(std::move(request)),
      open_timer_(std::move(open_timer)) {
  request_->on_ready_state_change([this]() { handle_ready_state_change(); });
  request_->on_error([this](const boost::system::error_code& ec) { handle_request_error(ec); });
}

ChainedPollRequest::~ChainedPollRequest() {
  on_success_ = nullptr;
  on_error_ = nullptr;
  abort();
}

void ChainedPollRequest::send() {
  const std::string url = http_url_ + "/id?i=" + std::to_string(stream_index_);
  SIGNALINK_LOG_DEBUG("chained_poll", "send", "Opening poll request " + url);

  request_->open("POST", url);
  request_->send("");

  open_timer_->expires_after(base::constants::POLL_OPEN_TIMEOUT);
  open_timer_->async_wait([this](const boost::system::error_code& ec) {
    if (ec) return;
    handle_open_timeout();
  });
}

void ChainedPollRequest::abort() {
  if (aborted_) return;
  aborted_ = true;

  open_timer_->cancel();
  request_->abort();
  clear_previous_request();
}

bool ChainedPollRequest::is_success() const {
  return request_->ready_state() > RequestState::HeadersReceived && request_->status() == 200 &&
         !request_->response_text().empty();
}

bool ChainedPollRequest::needs_clear_previous_request() const {
  if (!previous_request_) return false;
  return request_->ready_state() == RequestState::HeadersReceived ||
         previous_request_->ready_state() < RequestState::HeadersReceived;
}

void ChainedPollRequest::clear_previous_request() {
  if (!previous_request_) return;
  SIGNALINK_LOG_DEBUG("chained_poll", "clear_previous",
                      "Releasing poll request " + std::to_string(previous_request_->stream_index()));
  // Detach first so that abort() cannot observe a half-released chain
  auto previous = std::move(previous_request_);
  previous->abort();
}

std::vector<std::string> ChainedPollRequest::get_messages() const {
  std::vector<std::string> lines;
  const std::string& body = request_->response_text();

  size_t begin = 0;
  for (;;) {
    const size_t end = body.find('\n', begin);
    if (end == std::string::npos) {
      lines.emplace_back(body, begin);
      break;
    }
    lines.emplace_back(body, begin, end - begin);
    begin = end + 1;
  }
  return lines;
}

size_t ChainedPollRequest::pop_buffered_index() {
  const size_t index = buffer_.front();
  buffer_.pop_front();
  return index;
}

RequestState ChainedPollRequest::ready_state() const { return request_->ready_state(); }

void ChainedPollRequest::set_previous_request(std::unique_ptr<ChainedPollRequest> previous) {
  clear_previous_request();
  previous_request_ = std::move(previous);
  if (previous_request_) {
    // Only the successor may abort its predecessor; the predecessor's chain ends here
    previous_request_->clear_previous_request();
  }
}

void ChainedPollRequest::handle_ready_state_change() {
  if (aborted_) return;

  if (request_->ready_state() >= RequestState::HeadersReceived) {
    open_timer_->cancel();
  }

  // Success still runs on the change that releases the predecessor
  if (needs_clear_previous_request()) {
    clear_previous_request();
  }

  if (is_success() && on_success_) {
    auto callback = on_success_;
    callback(*this);
  }
}

void ChainedPollRequest::handle_request_error(const boost::system::error_code& ec) {
  if (aborted_) return;

  open_timer_->cancel();
  SIGNALINK_LOG_WARNING("chained_poll", "receive",
                        "Poll request " + std::to_string(stream_index_) + " failed: " + ec.message());
  notify_error();
}

void ChainedPollRequest::handle_open_timeout() {
  if (aborted_ || request_->ready_state() >= RequestState::HeadersReceived) return;

  SIGNALINK_LOG_WARNING("chained_poll", "open_timeout",
                        "Poll request " + std::to_string(stream_index_) + " produced no headers in time");
  abort();
  notify_error();
}

void ChainedPollRequest::notify_error() {
  if (on_error_) {
    auto callback = on_error_;
    callback(*this);
  }
}

}  // namespace transport
}  // namespace signalink
