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

#include "signalink/transport/resilient/resilient_channel.hpp"

#include "signalink/base/constants.hpp"
#include "signalink/diagnostics/logger.hpp"

namespace signalink {
namespace transport {

using interface::ChannelEvent;
using interface::SocketEvent;

const char* to_cstr(ResilientChannel::Current current) {
  switch (current) {
    case ResilientChannel::Current::None:
      return "none";
    case ResilientChannel::Current::Primary:
      return "primary";
    case ResilientChannel::Current::Fallback:
      return "fallback";
  }
  return "?";
}

ResilientChannel::ResilientChannel(std::shared_ptr<interface::SignalingChannel> primary,
                                   std::shared_ptr<interface::SignalingChannel> fallback,
                                   interface::TimerFactory timer_factory)
    : primary_(std::move(primary)), fallback_(std::move(fallback)), open_timer_(timer_factory()) {
  primary_->on_event([this](const ChannelEvent& event) { handle_primary_event(event); });
  fallback_->on_event([this](const ChannelEvent& event) { handle_fallback_event(event); });
}

ResilientChannel::~ResilientChannel() {
  on_event_ = nullptr;
  close();
  primary_->on_event(nullptr);
  fallback_->on_event(nullptr);
}

void ResilientChannel::start(const std::string& id, const std::string& token) {
  if (closed_ || current_ != Current::None) {
    SIGNALINK_LOG_DEBUG("resilient_channel", "start", "Start called while started or closed, ignoring");
    return;
  }

  server_id_ = id;
  server_token_ = token;
  start_primary();
}

void ResilientChannel::send(const nlohmann::json& data) {
  if (auto* channel = current_channel()) {
    channel->send(data);
  }
}

void ResilientChannel::close() {
  cancel_open_timeout();
  if (auto* channel = current_channel()) {
    // Clear first so nothing the closing transport emits is forwarded
    current_ = Current::None;
    channel->close();
  }
  current_ = Current::None;
  closed_ = true;
}

void ResilientChannel::on_event(OnEvent cb) { on_event_ = std::move(cb); }

void ResilientChannel::start_primary() {
  current_ = Current::None;
  fallback_->close();
  current_ = Current::Primary;

  arm_open_timeout();
  primary_->start(server_id_, server_token_);
}

void ResilientChannel::start_fallback() {
  SIGNALINK_LOG_INFO("resilient_channel", "failover", "Primary transport unavailable, switching to HTTP stream");

  current_ = Current::None;
  primary_->close();
  current_ = Current::Fallback;

  cancel_open_timeout();
  fallback_->start(server_id_, server_token_);
}

void ResilientChannel::arm_open_timeout() {
  cancel_open_timeout();
  open_timeout_pending_ = true;
  open_timer_->expires_after(base::constants::PRIMARY_OPEN_TIMEOUT);
  open_timer_->async_wait([this](const boost::system::error_code& ec) {
    if (ec || !open_timeout_pending_) return;
    SIGNALINK_LOG_WARNING("resilient_channel", "open_timeout", "Primary transport did not confirm in time");
    start_fallback();
  });
}

void ResilientChannel::cancel_open_timeout() {
  if (!open_timeout_pending_) return;
  open_timeout_pending_ = false;
  open_timer_->cancel();
}

void ResilientChannel::handle_primary_event(const ChannelEvent& event) {
  if (open_timeout_pending_) {
    switch (event.type) {
      case SocketEvent::Disconnected:
        SIGNALINK_LOG_WARNING("resilient_channel", "primary", "Primary transport disconnected before confirming");
        start_fallback();
        return;
      case SocketEvent::Message:
        cancel_open_timeout();
        SIGNALINK_LOG_DEBUG("resilient_channel", "primary", "Primary transport confirmed");
        break;
      case SocketEvent::Error:
      case SocketEvent::Close:
        break;
    }
  }

  if (current_ == Current::Primary) {
    emit(event);
  }
}

void ResilientChannel::handle_fallback_event(const ChannelEvent& event) {
  if (current_ == Current::Fallback) {
    emit(event);
  }
}

void ResilientChannel::emit(const ChannelEvent& event) {
  if (on_event_) {
    auto callback = on_event_;
    callback(event);
  }
}

interface::SignalingChannel* ResilientChannel::current_channel() const {
  switch (current_) {
    case Current::Primary:
      return primary_.get();
    case Current::Fallback:
      return fallback_.get();
    case Current::None:
      break;
  }
  return nullptr;
}

}  // namespace transport
}  // namespace signalink
