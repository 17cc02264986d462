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

#include "signalink/factory/signaling_factory.hpp"

#include "signalink/base/exceptions.hpp"
#include "signalink/diagnostics/error_handler.hpp"
#include "signalink/diagnostics/logger.hpp"
#include "signalink/transport/http/beast_http_request.hpp"
#include "signalink/transport/http_stream/chained_poll_transport.hpp"
#include "signalink/transport/resilient/resilient_channel.hpp"
#include "signalink/transport/timer/steady_timer.hpp"
#include "signalink/transport/websocket/websocket_transport.hpp"

namespace signalink {
namespace factory {

using namespace diagnostics;  // For error_reporting namespace

std::shared_ptr<interface::SignalingChannel> SignalingFactory::create(const config::ServerConnectionConfig& cfg,
                                                                      boost::asio::io_context& ioc) {
  config::ServerConnectionConfig checked = cfg;
  checked.validate_and_clamp();
  if (!checked.is_valid()) {
    error_reporting::report_configuration_error("factory", "create", "Invalid server connection configuration");
    throw ConfigurationException("Invalid server connection configuration for host '" + cfg.host + "'",
                                 "ServerConnectionConfig");
  }

  if (!checked.use_http_stream_fallback) {
    return create_websocket(checked, ioc);
  }
  return create_resilient(checked, ioc);
}

std::shared_ptr<interface::SignalingChannel> SignalingFactory::create_websocket(
    const config::ServerConnectionConfig& cfg, boost::asio::io_context& ioc) {
  SIGNALINK_LOG_DEBUG("factory", "create", "Creating websocket channel");
  return transport::WebSocketTransport::create(cfg, ioc);
}

std::shared_ptr<interface::SignalingChannel> SignalingFactory::create_resilient(
    const config::ServerConnectionConfig& cfg, boost::asio::io_context& ioc) {
  SIGNALINK_LOG_DEBUG("factory", "create", "Creating websocket channel with HTTP stream fallback");

  auto ssl_ctx = cfg.secure ? transport::BeastHttpRequest::make_client_ssl_context() : nullptr;
  auto primary = transport::WebSocketTransport::create(cfg, ioc, ssl_ctx);
  auto fallback = std::make_shared<transport::ChainedPollTransport>(
      cfg, transport::BeastHttpRequest::factory(ioc, ssl_ctx), transport::BoostSteadyTimer::factory(ioc));

  return std::make_shared<transport::ResilientChannel>(std::move(primary), std::move(fallback),
                                                       transport::BoostSteadyTimer::factory(ioc));
}

}  // namespace factory
}  // namespace signalink
