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
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <deque>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "signalink/base/visibility.hpp"
#include "signalink/config/server_connection_config.hpp"
#include "signalink/interface/signaling_channel.hpp"

namespace signalink {
namespace transport {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

/**
 * @brief Primary signaling transport over a WebSocket.
 *
 * Connects to `{ws|wss}://host:port{path}peerjs?key=&id=&token=` and
 * exchanges one JSON object per text frame. While open, a
 * `{"type":"HEARTBEAT"}` frame is written every ping interval.
 *
 * Any transport failure before close() emits Disconnected once. close()
 * emits nothing and a closed transport cannot be started again.
 */
class SIGNALINK_API WebSocketTransport : public interface::SignalingChannel,
                                         public std::enable_shared_from_this<WebSocketTransport> {
 public:
  static std::shared_ptr<WebSocketTransport> create(const config::ServerConnectionConfig& cfg, net::io_context& ioc);
  static std::shared_ptr<WebSocketTransport> create(const config::ServerConnectionConfig& cfg, net::io_context& ioc,
                                                    std::shared_ptr<ssl::context> ssl_ctx);
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport&) = delete;
  WebSocketTransport& operator=(const WebSocketTransport&) = delete;

  // SignalingChannel implementation
  void start(const std::string& id, const std::string& token) override;
  void send(const nlohmann::json& data) override;
  void close() override;
  void on_event(OnEvent cb) override;

  bool is_open() const { return open_; }
  bool is_disconnected() const { return disconnected_; }

 private:
  using PlainWebSocket = websocket::stream<beast::tcp_stream>;
  using TlsWebSocket = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

  WebSocketTransport(const config::ServerConnectionConfig& cfg, net::io_context& ioc,
                     std::shared_ptr<ssl::context> ssl_ctx);

  template <typename Handler>
  void with_stream(Handler&& handler);

  void on_resolve(const boost::system::error_code& ec, net::ip::tcp::resolver::results_type results);
  void on_connect(const boost::system::error_code& ec);
  void do_handshake();
  void on_open();
  void do_read();
  void on_read(const boost::system::error_code& ec);
  void write(std::string text);
  void do_write();
  void schedule_heartbeat();
  void send_queued_messages();
  void handle_failure(const char* operation, const boost::system::error_code& ec);
  void cleanup();
  void emit(const interface::ChannelEvent& event);

  config::ServerConnectionConfig cfg_;
  net::io_context& ioc_;
  std::shared_ptr<ssl::context> ssl_ctx_;
  net::ip::tcp::resolver resolver_;
  net::steady_timer heartbeat_timer_;
  std::unique_ptr<PlainWebSocket> plain_ws_;
  std::unique_ptr<TlsWebSocket> tls_ws_;

  std::string id_;
  std::string target_;
  bool started_ = false;
  bool disconnected_ = true;
  bool open_ = false;

  beast::flat_buffer rx_;
  std::deque<std::string> tx_;
  bool writing_ = false;
  std::deque<nlohmann::json> messages_queue_;

  OnEvent on_event_;
};

}  // namespace transport
}  // namespace signalink
