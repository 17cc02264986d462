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

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "signalink/base/visibility.hpp"
#include "signalink/connection/managed_connection.hpp"
#include "signalink/connection/server_message.hpp"

namespace signalink {
namespace connection {

/**
 * @brief Connections of one client, grouped by remote peer.
 *
 * Server messages addressed to a connection that is not registered yet are
 * kept and handed to it, in arrival order, when it is added. At most
 * MAX_LOST_MESSAGES_PER_CONNECTION are kept per id, and removing a
 * connection forgets any still held for its id.
 */
class SIGNALINK_API ConnectionRegistry {
 public:
  ConnectionRegistry() = default;
  ~ConnectionRegistry() = default;

  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  void add(std::shared_ptr<ManagedConnection> connection);
  std::shared_ptr<ManagedConnection> find(const std::string& peer, const std::string& connection_id) const;
  std::vector<std::shared_ptr<ManagedConnection>> connections_for(const std::string& peer) const;
  std::vector<std::shared_ptr<ManagedConnection>> connections_for(const std::string& peer,
                                                                  ConnectionType type) const;
  bool remove(const std::string& peer, const std::string& connection_id);

  /**
   * @brief Deliver a message to the connection named by payload.connectionId.
   * @return true if a registered connection handled it
   */
  bool route(const ServerMessage& message);

  void close_all();

  size_t size() const;
  size_t lost_message_count(const std::string& connection_id) const;

 private:
  std::map<std::string, std::vector<std::shared_ptr<ManagedConnection>>> connections_;
  std::map<std::string, std::deque<ServerMessage>> lost_messages_;
};

}  // namespace connection
}  // namespace signalink
