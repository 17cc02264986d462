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

#include "signalink/transport/websocket/websocket_transport.hpp"

#include <openssl/err.h>

#include <boost/beast/version.hpp>

#include "signalink/base/error_codes.hpp"
#include "signalink/diagnostics/error_handler.hpp"
#include "signalink/diagnostics/logger.hpp"
#include "signalink/transport/http/beast_http_request.hpp"

namespace signalink {
namespace transport {

using interface::ChannelEvent;
using interface::SocketEvent;
using tcp = net::ip::tcp;
using namespace diagnostics;  // For error_reporting namespace

namespace {

const char* const HEARTBEAT_MESSAGE = R"({"type":"HEARTBEAT"})";

bool has_message_type(const nlohmann::json& data) {
  if (!data.is_object()) return false;
  auto it = data.find("type");
  return it != data.end() && it->is_string() && !it->get_ref<const std::string&>().empty();
}

}  // namespace

std::shared_ptr<WebSocketTransport> WebSocketTransport::create(const config::ServerConnectionConfig& cfg,
                                                               net::io_context& ioc) {
  return create(cfg, ioc, cfg.secure ? BeastHttpRequest::make_client_ssl_context() : nullptr);
}

std::shared_ptr<WebSocketTransport> WebSocketTransport::create(const config::ServerConnectionConfig& cfg,
                                                               net::io_context& ioc,
                                                               std::shared_ptr<ssl::context> ssl_ctx) {
  return std::shared_ptr<WebSocketTransport>(new WebSocketTransport(cfg, ioc, std::move(ssl_ctx)));
}

WebSocketTransport::WebSocketTransport(const config::ServerConnectionConfig& cfg, net::io_context& ioc,
                                       std::shared_ptr<ssl::context> ssl_ctx)
    : cfg_(cfg), ioc_(ioc), ssl_ctx_(std::move(ssl_ctx)), resolver_(ioc), heartbeat_timer_(ioc) {
  cfg_.validate_and_clamp();
}

WebSocketTransport::~WebSocketTransport() {
  on_event_ = nullptr;
  // No handler can be pending here; every one of them holds a strong reference
  boost::system::error_code ec;
  if (tls_ws_) {
    beast::get_lowest_layer(*tls_ws_).socket().close(ec);
  } else if (plain_ws_) {
    beast::get_lowest_layer(*plain_ws_).socket().close(ec);
  }
}

template <typename Handler>
void WebSocketTransport::with_stream(Handler&& handler) {
  if (tls_ws_) {
    handler(*tls_ws_);
  } else if (plain_ws_) {
    handler(*plain_ws_);
  }
}

void WebSocketTransport::start(const std::string& id, const std::string& token) {
  if (started_ || !disconnected_) {
    SIGNALINK_LOG_DEBUG("websocket", "start", "Start called while already started, ignoring");
    return;
  }
  if (cfg_.secure && !ssl_ctx_) {
    SIGNALINK_LOG_ERROR("websocket", "start", "Secure connection requested without a TLS context");
    error_reporting::report_configuration_error("websocket", "start", "Missing TLS context for wss");
    return;
  }

  started_ = true;
  disconnected_ = false;
  id_ = id;
  target_ = cfg_.websocket_target(id, token);

  if (cfg_.secure) {
    tls_ws_ = std::make_unique<TlsWebSocket>(ioc_, *ssl_ctx_);
  } else {
    plain_ws_ = std::make_unique<PlainWebSocket>(ioc_);
  }

  SIGNALINK_LOG_INFO("websocket", "start",
                     std::string(cfg_.secure ? "wss://" : "ws://") + cfg_.host + ":" + std::to_string(cfg_.port) +
                         cfg_.path);

  auto self = shared_from_this();
  resolver_.async_resolve(cfg_.host, std::to_string(cfg_.port),
                          [self](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                            self->on_resolve(ec, std::move(results));
                          });
}

void WebSocketTransport::send(const nlohmann::json& data) {
  if (disconnected_) return;

  // No id yet: nothing can be addressed, keep it for on_open()
  if (id_.empty()) {
    messages_queue_.push_back(data);
    return;
  }

  if (!has_message_type(data)) {
    SIGNALINK_LOG_WARNING("websocket", "send", "Rejecting outbound message without type");
    error_reporting::report_protocol_error("websocket", "send", "Outbound message has no type");
    emit(ChannelEvent::make_error(to_string(ErrorCode::InvalidMessage)));
    return;
  }

  if (!open_) return;

  write(data.dump());
}

void WebSocketTransport::close() {
  if (disconnected_) return;

  SIGNALINK_LOG_INFO("websocket", "close", "Closing websocket");
  cleanup();
  disconnected_ = true;
}

void WebSocketTransport::on_event(OnEvent cb) { on_event_ = std::move(cb); }

void WebSocketTransport::on_resolve(const boost::system::error_code& ec, tcp::resolver::results_type results) {
  if (disconnected_) return;
  if (ec) {
    handle_failure("resolve", ec);
    return;
  }

  auto self = shared_from_this();
  with_stream([self, &results](auto& ws) {
    beast::get_lowest_layer(ws).async_connect(
        results, [self](const boost::system::error_code& ec, const tcp::endpoint&) { self->on_connect(ec); });
  });
}

void WebSocketTransport::on_connect(const boost::system::error_code& ec) {
  if (disconnected_) return;
  if (ec) {
    handle_failure("connect", ec);
    return;
  }

  if (!tls_ws_) {
    do_handshake();
    return;
  }

  if (!SSL_set_tlsext_host_name(tls_ws_->next_layer().native_handle(), cfg_.host.c_str())) {
    handle_failure("tls_handshake",
                   boost::system::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    return;
  }

  auto self = shared_from_this();
  tls_ws_->next_layer().async_handshake(ssl::stream_base::client, [self](const boost::system::error_code& ec) {
    if (self->disconnected_) return;
    if (ec) {
      self->handle_failure("tls_handshake", ec);
      return;
    }
    self->do_handshake();
  });
}

void WebSocketTransport::do_handshake() {
  auto self = shared_from_this();
  const std::string host = cfg_.host + ":" + std::to_string(cfg_.port);

  with_stream([self, &host](auto& ws) {
    // The websocket layer owns timeouts from here on
    beast::get_lowest_layer(ws).expires_never();
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
      req.set(beast::http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " signalink");
    }));

    ws.async_handshake(host, self->target_, [self](const boost::system::error_code& ec) {
      if (self->disconnected_) return;
      if (ec) {
        self->handle_failure("handshake", ec);
        return;
      }
      self->on_open();
    });
  });
}

void WebSocketTransport::on_open() {
  open_ = true;
  SIGNALINK_LOG_INFO("websocket", "open", "Websocket open");

  send_queued_messages();
  if (disconnected_) return;

  schedule_heartbeat();
  do_read();
}

void WebSocketTransport::do_read() {
  auto self = shared_from_this();
  with_stream([self](auto& ws) {
    ws.async_read(self->rx_, [self](const boost::system::error_code& ec, std::size_t) { self->on_read(ec); });
  });
}

void WebSocketTransport::on_read(const boost::system::error_code& ec) {
  if (disconnected_) return;
  if (ec) {
    // The stream is finished; cleanup() must not start a close handshake on it
    open_ = false;
    handle_failure("read", ec);
    return;
  }

  const std::string text = beast::buffers_to_string(rx_.data());
  rx_.consume(rx_.size());

  auto message = nlohmann::json::parse(text, nullptr, false);
  if (message.is_discarded()) {
    SIGNALINK_LOG_WARNING("websocket", "receive", "Invalid server message: " + text);
    error_reporting::report_protocol_error("websocket", "receive", "Invalid server message");
  } else {
    emit(ChannelEvent::make_message(std::move(message)));
    if (disconnected_) return;
  }

  do_read();
}

void WebSocketTransport::write(std::string text) {
  tx_.push_back(std::move(text));
  if (writing_) return;
  do_write();
}

void WebSocketTransport::do_write() {
  if (tx_.empty() || !open_ || disconnected_) {
    writing_ = false;
    return;
  }

  writing_ = true;
  auto self = shared_from_this();
  with_stream([self](auto& ws) {
    ws.text(true);
    ws.async_write(net::buffer(self->tx_.front()), [self](const boost::system::error_code& ec, std::size_t) {
      if (self->disconnected_) return;
      if (ec) {
        self->writing_ = false;
        self->open_ = false;
        self->handle_failure("write", ec);
        return;
      }
      self->tx_.pop_front();
      self->do_write();
    });
  });
}

void WebSocketTransport::schedule_heartbeat() {
  heartbeat_timer_.expires_after(std::chrono::milliseconds(cfg_.effective_ping_interval_ms()));
  auto self = shared_from_this();
  heartbeat_timer_.async_wait([self](const boost::system::error_code& ec) {
    if (ec || self->disconnected_ || !self->open_) return;
    self->write(HEARTBEAT_MESSAGE);
    self->schedule_heartbeat();
  });
}

void WebSocketTransport::send_queued_messages() {
  auto queued = std::move(messages_queue_);
  messages_queue_.clear();
  for (const auto& message : queued) {
    send(message);
    if (disconnected_) return;
  }
}

void WebSocketTransport::handle_failure(const char* operation, const boost::system::error_code& ec) {
  SIGNALINK_LOG_WARNING("websocket", operation, "Websocket failed: " + ec.message());
  error_reporting::report_connection_error("websocket", operation, ec, true);

  cleanup();
  disconnected_ = true;

  if (on_event_) {
    auto callback = on_event_;
    callback(ChannelEvent::make(SocketEvent::Disconnected));
  }
}

void WebSocketTransport::cleanup() {
  resolver_.cancel();
  heartbeat_timer_.cancel();

  // A close frame may not be written while a data frame is in flight
  if (!open_ || writing_) {
    open_ = false;
    boost::system::error_code ec;
    with_stream([&ec](auto& ws) { beast::get_lowest_layer(ws).socket().close(ec); });
    if (ec) {
      SIGNALINK_LOG_DEBUG("websocket", "cleanup", "Socket close failed: " + ec.message());
    }
    return;
  }

  open_ = false;
  auto self = shared_from_this();
  with_stream([self](auto& ws) {
    ws.async_close(websocket::close_code::normal, [self](const boost::system::error_code& ec) {
      if (ec) {
        SIGNALINK_LOG_DEBUG("websocket", "cleanup", "Close handshake failed: " + ec.message());
      }
    });
  });
}

void WebSocketTransport::emit(const ChannelEvent& event) {
  if (disconnected_ || !on_event_) return;
  auto callback = on_event_;
  callback(event);
}

}  // namespace transport
}  // namespace signalink
