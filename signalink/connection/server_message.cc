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

#include "signalink/connection/server_message.hpp"

namespace signalink {
namespace connection {

std::optional<ServerMessage> ServerMessage::from_json(const nlohmann::json& data) {
  if (!data.is_object()) return std::nullopt;

  auto type = data.find("type");
  if (type == data.end() || !type->is_string()) return std::nullopt;

  ServerMessage message;
  message.type = type->get<std::string>();

  auto payload = data.find("payload");
  if (payload != data.end()) {
    message.payload = *payload;
  }

  auto src = data.find("src");
  if (src != data.end() && src->is_string()) {
    message.src = src->get<std::string>();
  }
  return message;
}

nlohmann::json ServerMessage::to_json() const {
  nlohmann::json data = {{"type", type}};
  if (!payload.is_null()) data["payload"] = payload;
  if (!src.empty()) data["src"] = src;
  return data;
}

std::string ServerMessage::connection_id() const {
  if (!payload.is_object()) return {};
  auto it = payload.find("connectionId");
  if (it == payload.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

}  // namespace connection
}  // namespace signalink
