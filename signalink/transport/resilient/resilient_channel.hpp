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

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "signalink/base/visibility.hpp"
#include "signalink/interface/itimer.hpp"
#include "signalink/interface/signaling_channel.hpp"

namespace signalink {
namespace transport {

/**
 * @brief Signaling channel that falls back from a primary transport to a
 * chained poll transport.
 *
 * start() always tries the primary first. If the primary neither delivers a
 * message nor disconnects within PRIMARY_OPEN_TIMEOUT, or disconnects before
 * its first message, it is closed and the fallback is started with the same
 * id and token. The switch happens at most once per session.
 *
 * Both inner transports report to this object; only events of the current
 * one are forwarded. Messages in flight while switching are lost.
 */
class SIGNALINK_API ResilientChannel : public interface::SignalingChannel {
 public:
  enum class Current { None, Primary, Fallback };

  ResilientChannel(std::shared_ptr<interface::SignalingChannel> primary,
                   std::shared_ptr<interface::SignalingChannel> fallback, interface::TimerFactory timer_factory);
  ~ResilientChannel() override;

  ResilientChannel(const ResilientChannel&) = delete;
  ResilientChannel& operator=(const ResilientChannel&) = delete;

  // SignalingChannel implementation
  void start(const std::string& id, const std::string& token) override;
  void send(const nlohmann::json& data) override;
  void close() override;
  void on_event(OnEvent cb) override;

  Current current() const { return current_; }
  bool is_open_timeout_pending() const { return open_timeout_pending_; }

 private:
  void start_primary();
  void start_fallback();
  void arm_open_timeout();
  void cancel_open_timeout();
  void handle_primary_event(const interface::ChannelEvent& event);
  void handle_fallback_event(const interface::ChannelEvent& event);
  void emit(const interface::ChannelEvent& event);
  interface::SignalingChannel* current_channel() const;

  std::shared_ptr<interface::SignalingChannel> primary_;
  std::shared_ptr<interface::SignalingChannel> fallback_;
  std::unique_ptr<interface::TimerInterface> open_timer_;

  std::string server_id_;
  std::string server_token_;
  Current current_ = Current::None;
  bool open_timeout_pending_ = false;
  bool closed_ = false;

  OnEvent on_event_;
};

SIGNALINK_API const char* to_cstr(ResilientChannel::Current current);

}  // namespace transport
}  // namespace signalink
