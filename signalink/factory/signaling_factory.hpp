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
#include <memory>

#include "signalink/base/visibility.hpp"
#include "signalink/config/server_connection_config.hpp"
#include "signalink/interface/signaling_channel.hpp"

namespace signalink {
namespace factory {

/**
 * Signaling Factory
 * - WebSocket only, or WebSocket with HTTP stream fallback
 * - Callers only see SignalingChannel either way
 */
class SIGNALINK_API SignalingFactory {
 public:
  // Throws ConfigurationException when the configuration is invalid
  static std::shared_ptr<interface::SignalingChannel> create(const config::ServerConnectionConfig& cfg,
                                                             boost::asio::io_context& ioc);

 private:
  static std::shared_ptr<interface::SignalingChannel> create_websocket(const config::ServerConnectionConfig& cfg,
                                                                       boost::asio::io_context& ioc);
  static std::shared_ptr<interface::SignalingChannel> create_resilient(const config::ServerConnectionConfig& cfg,
                                                                       boost::asio::io_context& ioc);
};

}  // namespace factory
}  // namespace signalink
