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

#include "signalink/connection/managed_connection.hpp"

#include <random>

#include "signalink/base/constants.hpp"
#include "signalink/diagnostics/logger.hpp"

namespace signalink {
namespace connection {

const char* to_cstr(ConnectionType type) {
  switch (type) {
    case ConnectionType::Data:
      return "data";
    case ConnectionType::Media:
      return "media";
  }
  return "?";
}

ManagedConnection::ManagedConnection(std::string peer, std::weak_ptr<interface::SignalingChannel> provider,
                                     ConnectionOptions options, interface::TimerFactory timer_factory)
    : peer_(std::move(peer)),
      provider_(std::move(provider)),
      connection_id_(std::move(options.connection_id)),
      metadata_(std::move(options.metadata)),
      reconnectable_(options.reconnectable),
      close_timer_(timer_factory()) {}

ManagedConnection::~ManagedConnection() { clear_close_timeout(); }

bool ManagedConnection::set_close_timeout() {
  if (!reconnectable_ || !open_) {
    return false;
  }

  if (close_timeout_pending_) {
    return true;
  }

  SIGNALINK_LOG_DEBUG("managed_connection", "set_close_timeout",
                      "Waiting for " + connection_id_ + " to reconnect");
  close_timeout_pending_ = true;
  close_timer_->expires_after(base::constants::CLOSE_GRACE_TIMEOUT);
  close_timer_->async_wait([this](const boost::system::error_code& ec) {
    if (ec || !close_timeout_pending_) return;
    close_timeout_pending_ = false;
    if (open_) {
      SIGNALINK_LOG_INFO("managed_connection", "close_timeout", connection_id_ + " did not reconnect, closing");
      close();
    }
  });
  return true;
}

void ManagedConnection::clear_close_timeout() {
  if (!close_timeout_pending_) return;
  close_timeout_pending_ = false;
  close_timer_->cancel();
}

std::string ManagedConnection::generate_connection_id(ConnectionType type) {
  static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  thread_local std::mt19937 generator{std::random_device{}()};
  std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

  std::string id = type == ConnectionType::Data ? "dc_" : "mc_";
  for (int i = 0; i < 10; ++i) {
    id.push_back(alphabet[pick(generator)]);
  }
  return id;
}

}  // namespace connection
}  // namespace signalink
