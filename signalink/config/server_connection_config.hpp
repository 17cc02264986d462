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
#include <optional>
#include <string>

#include "signalink/base/constants.hpp"

namespace signalink {
namespace config {

/**
 * @brief Endpoint description of the coordination server
 *
 * The same settings drive both the WebSocket primary transport and the
 * chained HTTP poll fallback.
 */
struct ServerConnectionConfig {
  bool secure = false;  // wss/https instead of ws/http
  std::string host = "127.0.0.1";
  uint16_t port = base::constants::DEFAULT_PORT;
  std::string path = base::constants::DEFAULT_PATH;
  std::string key = base::constants::DEFAULT_KEY;
  std::optional<unsigned> ping_interval_ms;  // heartbeat of the primary transport
  bool use_http_stream_fallback = false;

  bool is_valid() const {
    if (host.empty() || host.size() > base::constants::MAX_HOSTNAME_LENGTH) return false;
    if (port == 0) return false;
    if (key.empty() || key.size() > base::constants::MAX_KEY_LENGTH) return false;
    if (path.size() > base::constants::MAX_PATH_LENGTH) return false;
    if (key.find_first_of("/?#& ") != std::string::npos) return false;
    if (ping_interval_ms && (*ping_interval_ms < base::constants::MIN_PING_INTERVAL_MS ||
                             *ping_interval_ms > base::constants::MAX_PING_INTERVAL_MS)) {
      return false;
    }
    return true;
  }

  // Normalise the path to "/.../" and clamp the heartbeat interval
  void validate_and_clamp() {
    if (path.empty() || path.front() != '/') {
      path.insert(path.begin(), '/');
    }
    if (path.back() != '/') {
      path.push_back('/');
    }

    if (ping_interval_ms) {
      if (*ping_interval_ms < base::constants::MIN_PING_INTERVAL_MS) {
        ping_interval_ms = base::constants::MIN_PING_INTERVAL_MS;
      } else if (*ping_interval_ms > base::constants::MAX_PING_INTERVAL_MS) {
        ping_interval_ms = base::constants::MAX_PING_INTERVAL_MS;
      }
    }
  }

  unsigned effective_ping_interval_ms() const {
    return ping_interval_ms.value_or(base::constants::DEFAULT_PING_INTERVAL_MS);
  }

  /**
   * @brief {http|https}://{host}:{port}{path}{key}
   */
  std::string http_base_url() const {
    return std::string(secure ? "https://" : "http://") + host + ":" + std::to_string(port) + path + key;
  }

  /**
   * @brief Request target of the WebSocket upgrade for a session
   */
  std::string websocket_target(const std::string& id, const std::string& token) const {
    return path + "peerjs?key=" + key + "&id=" + id + "&token=" + token;
  }
};

}  // namespace config
}  // namespace signalink
