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

#include <boost/asio.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "signalink/signalink.hpp"
#include "signalink/transport/timer/steady_timer.hpp"

using namespace signalink;

namespace {

/**
 * @brief Data connection that only logs what the server routes to it
 */
class LoggingConnection : public connection::ManagedConnection {
 public:
  LoggingConnection(const std::string& peer, std::weak_ptr<interface::SignalingChannel> provider,
                    interface::TimerFactory timer_factory)
      : ManagedConnection(peer, std::move(provider),
                          connection::ConnectionOptions{
                              generate_connection_id(connection::ConnectionType::Data), nullptr, true},
                          std::move(timer_factory)) {
    set_open(true);
  }

  connection::ConnectionType type() const override { return connection::ConnectionType::Data; }

  void close() override {
    clear_close_timeout();
    set_open(false);
    diagnostics::Logger::instance().info("client", "close", "Connection " + connection_id() + " closed");
  }

  void handle_message(const connection::ServerMessage& message) override {
    diagnostics::Logger::instance().info("client", "route",
                                         connection_id() + " <- " + message.type + " " + message.payload.dump());
  }
};

void print_usage(const char* program) {
  std::cout << "Usage: " << program << " <host> <port> <id> <token> [peer] [--fallback] [--secure]" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 5) {
    print_usage(argv[0]);
    return 1;
  }

  auto& logger = diagnostics::Logger::instance();
  logger.set_level(diagnostics::LogLevel::INFO);
  logger.set_console_output(true);

  config::ServerConnectionConfig cfg;
  cfg.host = argv[1];
  cfg.port = static_cast<uint16_t>(std::stoi(argv[2]));
  const std::string id = argv[3];
  const std::string token = argv[4];
  std::string peer;
  for (int i = 5; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--fallback") {
      cfg.use_http_stream_fallback = true;
    } else if (arg == "--secure") {
      cfg.secure = true;
    } else {
      peer = arg;
    }
  }

  boost::asio::io_context ioc;
  std::shared_ptr<interface::SignalingChannel> channel;
  try {
    channel = signaling_channel(cfg, ioc);
  } catch (const ConfigurationException& e) {
    logger.error("client", "startup", e.get_full_message());
    return 1;
  }

  connection::ConnectionRegistry registry;
  if (!peer.empty()) {
    auto conn = std::make_shared<LoggingConnection>(peer, channel, transport::BoostSteadyTimer::factory(ioc));
    logger.info("client", "startup", "Tracking " + conn->connection_id() + " to " + peer);
    registry.add(conn);
  }

  channel->on_event([&](const interface::ChannelEvent& event) {
    switch (event.type) {
      case interface::SocketEvent::Message: {
        auto message = connection::ServerMessage::from_json(event.message);
        if (!message) {
          logger.warning("client", "receive", "Ignoring " + event.message.dump());
          return;
        }
        logger.info("client", "receive", message->type);
        if (message->src.empty()) return;
        if (!registry.route(*message)) {
          logger.debug("client", "route", "No connection for " + message->connection_id() + " yet");
        }
        return;
      }
      case interface::SocketEvent::Error:
        logger.error("client", "error", event.error);
        return;
      case interface::SocketEvent::Disconnected:
        logger.warning("client", "disconnect", "Lost connection to signaling server");
        registry.close_all();
        ioc.stop();
        return;
      case interface::SocketEvent::Close:
        return;
    }
  });

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& ec, int) {
    if (ec) return;
    logger.info("client", "shutdown", "Closing");
    registry.close_all();
    channel->close();
    ioc.stop();
  });

  channel->start(id, token);
  ioc.run();
  logger.flush();
  return 0;
}
