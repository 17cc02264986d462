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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "signalink/base/visibility.hpp"

namespace signalink {
namespace connection {

/**
 * @brief A message received from the coordination server.
 *
 * `src` is the peer the message is about; `payload` is opaque apart from
 * the optional `connectionId` used for routing.
 */
struct SIGNALINK_API ServerMessage {
  std::string type;
  nlohmann::json payload;
  std::string src;

  // std::nullopt unless `data` is an object with a string "type"
  static std::optional<ServerMessage> from_json(const nlohmann::json& data);
  nlohmann::json to_json() const;

  // payload.connectionId, or an empty string
  std::string connection_id() const;
};

}  // namespace connection
}  // namespace signalink
