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

#include "signalink/transport/http_stream/chained_poll_transport.hpp"

#include <algorithm>
#include <cctype>

#include "signalink/base/constants.hpp"
#include "signalink/base/error_codes.hpp"
#include "signalink/diagnostics/error_handler.hpp"
#include "signalink/diagnostics/logger.hpp"

namespace signalink {
namespace transport {

using interface::ChannelEvent;
using interface::RequestState;
using interface::SocketEvent;
using namespace diagnostics;  // For error_reporting namespace

namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// Outbound messages need a non-empty string "type"; it names the endpoint
const std::string* message_type(const nlohmann::json& data) {
  if (!data.is_object()) return nullptr;
  auto it = data.find("type");
  if (it == data.end() || !it->is_string()) return nullptr;
  const auto& type = it->get_ref<const std::string&>();
  return type.empty() ? nullptr : &type;
}

}  // namespace

ChainedPollTransport::ChainedPollTransport(const config::ServerConnectionConfig& cfg,
                                           interface::HttpRequestFactory request_factory,
                                           interface::TimerFactory timer_factory)
    : base_url_(cfg.http_base_url()),
      request_factory_(std::move(request_factory)),
      timer_factory_(std::move(timer_factory)),
      idle_timer_(timer_factory_()) {}

ChainedPollTransport::~ChainedPollTransport() {
  on_event_ = nullptr;
  close();
  current_request_.reset();
  for (auto& request : outbound_requests_) {
    request->abort();
  }
}

void ChainedPollTransport::start(const std::string& id, const std::string& token) {
  if (started_ || current_request_ || !disconnected_) {
    SIGNALINK_LOG_DEBUG("http_stream", "start", "Start called while already started, ignoring");
    return;
  }

  started_ = true;
  id_ = id;
  token_ = token;
  http_url_ = base_url_ + "/" + id_ + "/" + token_;

  SIGNALINK_LOG_INFO("http_stream", "start", "Starting poll stream at " + base_url_);
  disconnected_ = false;
  start_stream(0, nullptr);
}

void ChainedPollTransport::send(const nlohmann::json& data) {
  if (disconnected_) return;

  if (id_.empty()) {
    messages_queue_.push_back(data);
    return;
  }

  const std::string* type = message_type(data);
  if (!type) {
    SIGNALINK_LOG_WARNING("http_stream", "send", "Rejecting outbound message without type");
    error_reporting::report_protocol_error("http_stream", "send", "Outbound message has no type");
    emit(ChannelEvent::make_error(to_string(ErrorCode::InvalidMessage)));
    return;
  }

  prune_outbound_requests();

  auto request = request_factory_();
  request->on_error([type_name = *type](const boost::system::error_code& ec) {
    SIGNALINK_LOG_WARNING("http_stream", "send", "Failed to post " + type_name + ": " + ec.message());
  });

  try {
    request->open("POST", http_url_ + "/" + to_lower(*type));
    request->set_request_header("Content-Type", "application/json");
    request->send(data.dump());
  } catch (const std::exception& e) {
    SIGNALINK_LOG_ERROR("http_stream", "send", "Error while posting message: " + std::string(e.what()));
    error_reporting::report_communication_error("http_stream", "send", e.what(), false);
    return;
  }

  outbound_requests_.push_back(std::move(request));
}

void ChainedPollTransport::close() {
  if (disconnected_) return;

  SIGNALINK_LOG_INFO("http_stream", "close", "Closing poll stream");
  disconnected_ = true;
  idle_timer_->cancel();
  if (current_request_) {
    current_request_->abort();
  }
}

void ChainedPollTransport::on_event(OnEvent cb) { on_event_ = std::move(cb); }

void ChainedPollTransport::start_stream(uint32_t stream_index, std::unique_ptr<ChainedPollRequest> previous) {
  auto request = std::make_unique<ChainedPollRequest>(stream_index, http_url_, request_factory_(), timer_factory_());
  ChainedPollRequest* raw = request.get();

  request->on_error([this](ChainedPollRequest& failed) { handle_stream_error(failed); });
  request->on_success([this](ChainedPollRequest& ready) { handle_stream(ready); });
  request->set_previous_request(std::move(previous));
  current_request_ = std::move(request);

  try {
    raw->send();
  } catch (const std::exception& e) {
    SIGNALINK_LOG_ERROR("http_stream", "start_stream",
                        "Error while sending poll request " + std::to_string(stream_index) + ": " + e.what());
    error_reporting::report_communication_error("http_stream", "start_stream", e.what(), true);
  }

  arm_idle_timeout();
}

void ChainedPollTransport::arm_idle_timeout() {
  idle_timer_->expires_after(base::constants::POLL_IDLE_TIMEOUT);
  idle_timer_->async_wait([this](const boost::system::error_code& ec) {
    if (ec) return;
    handle_idle_timeout();
  });
}

void ChainedPollTransport::handle_idle_timeout() {
  if (disconnected_ || !current_request_) return;

  auto expiring = std::move(current_request_);
  const uint32_t next_index = expiring->stream_index() + 1;
  SIGNALINK_LOG_DEBUG("http_stream", "idle_timeout", "Rolling poll stream to " + std::to_string(next_index));
  start_stream(next_index, std::move(expiring));
}

void ChainedPollTransport::handle_stream(ChainedPollRequest& request) {
  if (disconnected_) return;

  const std::vector<std::string> lines = request.get_messages();

  if (!drain_buffered_lines(request, lines)) return;
  if (!read_new_lines(request, lines)) return;

  if (request.ready_state() == RequestState::Done) {
    flush_final_lines(request, lines);
  }
}

// Buffered offsets first, oldest first. Only an offset that is still the
// unterminated tail is kept for the next snapshot; returns false once closed.
bool ChainedPollTransport::drain_buffered_lines(ChainedPollRequest& request, const std::vector<std::string>& lines) {
  while (request.has_buffered_indices()) {
    const size_t index = request.pop_buffered_index();
    if (index >= lines.size()) {
      request.push_index_to_buffer_front(index);
      return true;
    }

    auto message = nlohmann::json::parse(lines[index], nullptr, false);
    if (message.is_discarded()) {
      if (index + 1 == lines.size()) {
        request.push_index_to_buffer_front(index);
        return true;
      }
      SIGNALINK_LOG_WARNING("http_stream", "receive", "Invalid server message: " + lines[index]);
      error_reporting::report_protocol_error("http_stream", "receive", "Invalid server message");
      continue;
    }

    emit(ChannelEvent::make_message(std::move(message)));
    if (disconnected_) return false;
  }
  return true;
}

// The exchange is over, so whatever is still buffered will never grow
void ChainedPollTransport::flush_final_lines(ChainedPollRequest& request, const std::vector<std::string>& lines) {
  while (request.has_buffered_indices()) {
    const size_t index = request.pop_buffered_index();
    if (index >= lines.size()) continue;

    auto message = nlohmann::json::parse(lines[index], nullptr, false);
    if (message.is_discarded()) {
      SIGNALINK_LOG_WARNING("http_stream", "receive", "Dropping truncated server message: " + lines[index]);
      error_reporting::report_protocol_error("http_stream", "receive", "Truncated server message");
      continue;
    }

    emit(ChannelEvent::make_message(std::move(message)));
    if (disconnected_) return;
  }
}

void ChainedPollTransport::handle_stream_error(ChainedPollRequest& request) {
  idle_timer_->cancel();
  const std::string message = "Poll stream " + std::to_string(request.stream_index()) + " failed, disconnecting";
  SIGNALINK_LOG_WARNING("http_stream", "receive", message);
  error_reporting::report_communication_error("http_stream", "receive", message, true);
  emit(ChannelEvent::make(SocketEvent::Disconnected));
}

void ChainedPollTransport::prune_outbound_requests() {
  outbound_requests_.erase(
      std::remove_if(outbound_requests_.begin(), outbound_requests_.end(),
                     [](const std::unique_ptr<interface::HttpRequestInterface>& r) {
                       return r->ready_state() == RequestState::Done;
                     }),
      outbound_requests_.end());
}

void ChainedPollTransport::emit(const ChannelEvent& event) {
  if (disconnected_ || !on_event_) return;
  auto callback = on_event_;
  callback(event);
}

}  // namespace transport
}  // namespace signalink
