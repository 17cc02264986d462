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
#include "signalink/connection/server_message.hpp"
#include "signalink/interface/itimer.hpp"
#include "signalink/interface/signaling_channel.hpp"

namespace signalink {
namespace connection {

enum class ConnectionType { Data, Media };

SIGNALINK_API const char* to_cstr(ConnectionType type);

struct ConnectionOptions {
  std::string connection_id;  // see ManagedConnection::generate_connection_id()
  nlohmann::json metadata;    // opaque to the library
  bool reconnectable = false;
};

/**
 * @brief Shared lifecycle of a logical peer connection riding on the
 * signaling channel.
 *
 * Concrete kinds supply close() and handle_message(). The base keeps the
 * open/reconnectable flags and a single close-grace timer that bridges a
 * reconnect of the native transport underneath.
 */
class SIGNALINK_API ManagedConnection {
 public:
  ManagedConnection(std::string peer, std::weak_ptr<interface::SignalingChannel> provider,
                    ConnectionOptions options, interface::TimerFactory timer_factory);
  virtual ~ManagedConnection();

  ManagedConnection(const ManagedConnection&) = delete;
  ManagedConnection& operator=(const ManagedConnection&) = delete;

  virtual ConnectionType type() const = 0;

  /**
   * @brief Give the native transport CLOSE_GRACE_TIMEOUT to reconnect.
   *
   * Returns false, arming nothing, unless the connection is reconnectable
   * and open. While a timer is pending further calls only return true. When
   * the timer fires, close() runs if the connection is still open.
   */
  bool set_close_timeout();
  void clear_close_timeout();
  bool is_close_timeout_pending() const { return close_timeout_pending_; }

  virtual void close() = 0;
  virtual void handle_message(const ServerMessage& message) = 0;

  bool is_open() const { return open_; }
  bool reconnectable() const { return reconnectable_; }
  void set_reconnectable(bool reconnectable) { reconnectable_ = reconnectable; }

  const std::string& peer() const { return peer_; }
  const std::string& connection_id() const { return connection_id_; }
  const nlohmann::json& metadata() const { return metadata_; }
  std::shared_ptr<interface::SignalingChannel> provider() const { return provider_.lock(); }

  // "dc_" or "mc_" followed by random alphanumerics
  static std::string generate_connection_id(ConnectionType type);

 protected:
  void set_open(bool open) { open_ = open; }

 private:
  const std::string peer_;
  std::weak_ptr<interface::SignalingChannel> provider_;
  std::string connection_id_;
  const nlohmann::json metadata_;
  bool reconnectable_;
  bool open_ = false;

  std::unique_ptr<interface::TimerInterface> close_timer_;
  bool close_timeout_pending_ = false;
};

}  // namespace connection
}  // namespace signalink
