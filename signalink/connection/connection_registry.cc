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

#include "signalink/connection/connection_registry.hpp"

#include <algorithm>

#include "signalink/base/constants.hpp"
#include "signalink/diagnostics/error_handler.hpp"
#include "signalink/diagnostics/logger.hpp"

namespace signalink {
namespace connection {

using namespace diagnostics;  // For error_reporting namespace

void ConnectionRegistry::add(std::shared_ptr<ManagedConnection> connection) {
  if (!connection) return;

  SIGNALINK_LOG_DEBUG("connection_registry", "add",
                      std::string("Adding ") + to_cstr(connection->type()) + " connection " +
                          connection->connection_id() + " for " + connection->peer());
  connections_[connection->peer()].push_back(connection);

  auto lost = lost_messages_.find(connection->connection_id());
  if (lost == lost_messages_.end()) return;

  auto messages = std::move(lost->second);
  lost_messages_.erase(lost);
  for (const auto& message : messages) {
    connection->handle_message(message);
  }
}

std::shared_ptr<ManagedConnection> ConnectionRegistry::find(const std::string& peer,
                                                            const std::string& connection_id) const {
  auto it = connections_.find(peer);
  if (it == connections_.end()) return nullptr;

  for (const auto& connection : it->second) {
    if (connection->connection_id() == connection_id) return connection;
  }
  return nullptr;
}

std::vector<std::shared_ptr<ManagedConnection>> ConnectionRegistry::connections_for(const std::string& peer) const {
  auto it = connections_.find(peer);
  if (it == connections_.end()) return {};
  return it->second;
}

std::vector<std::shared_ptr<ManagedConnection>> ConnectionRegistry::connections_for(const std::string& peer,
                                                                                    ConnectionType type) const {
  std::vector<std::shared_ptr<ManagedConnection>> result;
  for (const auto& connection : connections_for(peer)) {
    if (connection->type() == type) result.push_back(connection);
  }
  return result;
}

bool ConnectionRegistry::remove(const std::string& peer, const std::string& connection_id) {
  lost_messages_.erase(connection_id);

  auto it = connections_.find(peer);
  if (it == connections_.end()) return false;

  auto& list = it->second;
  auto pos = std::find_if(list.begin(), list.end(), [&connection_id](const std::shared_ptr<ManagedConnection>& c) {
    return c->connection_id() == connection_id;
  });
  if (pos == list.end()) return false;

  list.erase(pos);
  if (list.empty()) connections_.erase(it);
  return true;
}

bool ConnectionRegistry::route(const ServerMessage& message) {
  const std::string connection_id = message.connection_id();

  if (auto connection = find(message.src, connection_id)) {
    connection->handle_message(message);
    return true;
  }

  if (!connection_id.empty()) {
    auto& held = lost_messages_[connection_id];
    held.push_back(message);
    if (held.size() > base::constants::MAX_LOST_MESSAGES_PER_CONNECTION) {
      SIGNALINK_LOG_WARNING("connection_registry", "route",
                            "Dropping oldest held " + held.front().type + " message for " + connection_id);
      held.pop_front();
    }
    return false;
  }

  SIGNALINK_LOG_WARNING("connection_registry", "route",
                        "Unroutable " + message.type + " message from " + message.src);
  error_reporting::report_protocol_error("connection_registry", "route", "Message without connectionId");
  return false;
}

void ConnectionRegistry::close_all() {
  auto connections = std::move(connections_);
  connections_.clear();
  lost_messages_.clear();

  for (auto& entry : connections) {
    for (auto& connection : entry.second) {
      connection->close();
    }
  }
}

size_t ConnectionRegistry::size() const {
  size_t count = 0;
  for (const auto& entry : connections_) {
    count += entry.second.size();
  }
  return count;
}

size_t ConnectionRegistry::lost_message_count(const std::string& connection_id) const {
  auto it = lost_messages_.find(connection_id);
  return it == lost_messages_.end() ? 0 : it->second.size();
}

}  // namespace connection
}  // namespace signalink
