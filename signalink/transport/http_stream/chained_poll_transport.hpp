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

#include <cstdint>
#include <deque>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "signalink/base/visibility.hpp"
#include "signalink/config/server_connection_config.hpp"
#include "signalink/interface/ihttp_request.hpp"
#include "signalink/interface/itimer.hpp"
#include "signalink/interface/signaling_channel.hpp"
#include "signalink/transport/http_stream/chained_poll_request.hpp"

namespace signalink {
namespace transport {

/**
 * @brief Signaling channel over a chain of overlapping HTTP long-poll requests.
 *
 * Inbound messages arrive as newline-delimited JSON in the body of
 * `POST {base_url}/{id}/{token}/id?i={n}`. A new poll is issued every
 * POLL_IDLE_TIMEOUT and keeps the expiring one as its predecessor until its
 * own headers arrive, so the stream has no gap. Outbound messages are posted
 * individually to `{base_url}/{id}/{token}/{type}`.
 *
 * Messages passed to send() before a session id is known are queued and are
 * not transmitted once the id is assigned; see queued_messages().
 */
class SIGNALINK_API ChainedPollTransport : public interface::SignalingChannel {
 public:
  ChainedPollTransport(const config::ServerConnectionConfig& cfg, interface::HttpRequestFactory request_factory,
                       interface::TimerFactory timer_factory);
  ~ChainedPollTransport() override;

  ChainedPollTransport(const ChainedPollTransport&) = delete;
  ChainedPollTransport& operator=(const ChainedPollTransport&) = delete;

  // SignalingChannel implementation
  void start(const std::string& id, const std::string& token) override;
  void send(const nlohmann::json& data) override;
  void close() override;
  void on_event(OnEvent cb) override;

  bool is_disconnected() const { return disconnected_; }
  const std::string& base_url() const { return base_url_; }
  const std::deque<nlohmann::json>& queued_messages() const { return messages_queue_; }
  const ChainedPollRequest* current_request() const { return current_request_.get(); }

 private:
  void start_stream(uint32_t stream_index, std::unique_ptr<ChainedPollRequest> previous);
  void arm_idle_timeout();
  void handle_idle_timeout();
  void handle_stream(ChainedPollRequest& request);
  bool drain_buffered_lines(ChainedPollRequest& request, const std::vector<std::string>& lines);
  bool read_new_lines(ChainedPollRequest& request, const std::vector<std::string>& lines);
  void flush_final_lines(ChainedPollRequest& request, const std::vector<std::string>& lines);
  void handle_stream_error(ChainedPollRequest& request);
  void prune_outbound_requests();
  void emit(const interface::ChannelEvent& event);

  const std::string base_url_;
  interface::HttpRequestFactory request_factory_;
  interface::TimerFactory timer_factory_;

  std::string id_;
  std::string token_;
  std::string http_url_;
  bool disconnected_ = true;
  bool started_ = false;

  std::deque<nlohmann::json> messages_queue_;
  std::unique_ptr<ChainedPollRequest> current_request_;
  std::unique_ptr<interface::TimerInterface> idle_timer_;
  std::vector<std::unique_ptr<interface::HttpRequestInterface>> outbound_requests_;

  OnEvent on_event_;
};

}  // namespace transport
}  // namespace signalink
