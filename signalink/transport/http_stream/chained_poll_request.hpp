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

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "signalink/base/visibility.hpp"
#include "signalink/interface/ihttp_request.hpp"
#include "signalink/interface/itimer.hpp"

namespace signalink {
namespace transport {

/**
 * @brief One position of the chained long-poll stream.
 *
 * Issues `POST {http_url}/id?i={stream_index}` and exposes the growing
 * response body as newline-delimited lines. A request may own the request
 * it superseded (its predecessor) and aborts it as soon as it reaches the
 * header-received state itself, or as soon as the predecessor is found still
 * stuck before that state. At most two requests of a chain are outstanding.
 *
 * Line offsets that could not be parsed when last observed are kept in a
 * FIFO and re-read from the next snapshot of the same response.
 */
class SIGNALINK_API ChainedPollRequest {
 public:
  using OnSuccess = std::function<void(ChainedPollRequest&)>;
  using OnError = std::function<void(ChainedPollRequest&)>;

  ChainedPollRequest(uint32_t stream_index, std::string http_url,
                     std::unique_ptr<interface::HttpRequestInterface> request,
                     std::unique_ptr<interface::TimerInterface> open_timer);
  ~ChainedPollRequest();

  ChainedPollRequest(const ChainedPollRequest&) = delete;
  ChainedPollRequest& operator=(const ChainedPollRequest&) = delete;

  /**
   * @brief Issue the request and arm the open timeout.
   *
   * If the response headers have not arrived when the timeout fires, the
   * request is aborted and the error callback runs.
   * @throws std::exception if the underlying request cannot be issued
   */
  void send();

  /**
   * @brief Abort this request and its predecessor; no callback runs afterwards.
   */
  void abort();

  bool is_success() const;
  bool needs_clear_previous_request() const;
  void clear_previous_request();

  /**
   * @brief Response body split on '\n'.
   *
   * The last element is empty exactly when the body ends with '\n'.
   */
  std::vector<std::string> get_messages() const;

  bool has_buffered_indices() const { return !buffer_.empty(); }
  size_t pop_buffered_index();
  void push_index_to_buffer(size_t index) { buffer_.push_back(index); }
  void push_index_to_buffer_front(size_t index) { buffer_.push_front(index); }
  const std::deque<size_t>& buffered_indices() const { return buffer_; }

  uint32_t stream_index() const { return stream_index_; }
  size_t index() const { return index_; }
  void set_index(size_t index) { index_ = index; }

  interface::RequestState ready_state() const;
  bool is_aborted() const { return aborted_; }

  ChainedPollRequest* previous_request() const { return previous_request_.get(); }
  void set_previous_request(std::unique_ptr<ChainedPollRequest> previous);

  void on_success(OnSuccess cb) { on_success_ = std::move(cb); }
  void on_error(OnError cb) { on_error_ = std::move(cb); }

 private:
  void handle_ready_state_change();
  void handle_request_error(const boost::system::error_code& ec);
  void handle_open_timeout();
  void notify_error();

  const uint32_t stream_index_;
  const std::string http_url_;
  std::unique_ptr<interface::HttpRequestInterface> request_;
  std::unique_ptr<interface::TimerInterface> open_timer_;
  std::unique_ptr<ChainedPollRequest> previous_request_;

  size_t index_ = 0;
  std::deque<size_t> buffer_;
  bool aborted_ = false;

  OnSuccess on_success_;
  OnError on_error_;
};

}  // namespace transport
}  // namespace signalink
