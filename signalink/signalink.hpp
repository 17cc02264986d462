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

#include "signalink/base/error_codes.hpp"
#include "signalink/base/exceptions.hpp"
#include "signalink/config/server_connection_config.hpp"
#include "signalink/connection/connection_registry.hpp"
#include "signalink/connection/managed_connection.hpp"
#include "signalink/connection/server_message.hpp"
#include "signalink/diagnostics/error_handler.hpp"
#include "signalink/diagnostics/logger.hpp"
#include "signalink/factory/signaling_factory.hpp"
#include "signalink/interface/signaling_channel.hpp"

namespace signalink {

// === Convenience Functions ===

/**
 * @brief Create the signaling channel described by `cfg`
 * @param cfg Server endpoint; `use_http_stream_fallback` selects the resilient channel
 * @param ioc io_context that must be run by the caller
 * @return std::shared_ptr<interface::SignalingChannel> Channel, not started yet
 */
inline std::shared_ptr<interface::SignalingChannel> signaling_channel(const config::ServerConnectionConfig& cfg,
                                                                      boost::asio::io_context& ioc) {
  return factory::SignalingFactory::create(cfg, ioc);
}

}  // namespace signalink
