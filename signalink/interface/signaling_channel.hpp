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

#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace signalink {
namespace interface {

enum class SocketEvent { Message, Disconnected, Error, Close };

inline const char* to_cstr(SocketEvent e) {
  switch (e) {
    case SocketEvent::Message:
      return "message";
    case SocketEvent::Disconnected:
      return "disconnected";
    case SocketEvent::Error:
      return "error";
    case SocketEvent::Close:
      return "close";
  }
  return "?";
}

/**
 * @brief Event emitted by a signaling transport
 *
 * `message` is set for Message events, `error` for Error events.
 */
struct ChannelEvent {
  SocketEvent type;
  nlohmann::json message;
  std::string error;

  static ChannelEvent make_message(nlohmann::json msg) { return {SocketEvent::Message, std::move(msg), {}}; }
  static ChannelEvent make_error(std::string err) { return {SocketEvent::Error, nullptr, std::move(err)}; }
  static ChannelEvent make(SocketEvent type) { return {type, nullptr, {}}; }
};

/**
 * @brief Message channel to the coordination server
 *
 * Implemented by the primary transport, the chained poll transport and the
 * resilient channel that composes them, so callers never need to know which
 * one they hold.
 */
class SignalingChannel {
 public:
  using OnEvent = std::function<void(const ChannelEvent&)>;

  virtual ~SignalingChannel() = default;

  virtual void start(const std::string& id, const std::string& token) = 0;
  virtual void send(const nlohmann::json& data) = 0;
  virtual void close() = 0;

  // Single subscriber; passing nullptr unsubscribes
  virtual void on_event(OnEvent cb) = 0;
};

}  // namespace interface
}  // namespace signalink
