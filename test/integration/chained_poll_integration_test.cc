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

#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "signalink/config/server_connection_config.hpp"
#include "signalink/interface/signaling_channel.hpp"
#include "signalink/transport/http/beast_http_request.hpp"
#include "signalink/transport/http_stream/chained_poll_transport.hpp"
#include "signalink/transport/timer/steady_timer.hpp"
#include "test/utils/loopback_servers.hpp"

using namespace signalink;
using namespace signalink::interface;
using namespace signalink::transport;
using namespace signalink::test;
using namespace std::chrono_literals;
using nlohmann::json;

/**
 * @brief ChainedPollTransport over real HTTP requests and timers
 */
class ChainedPollIntegrationTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (transport_) transport_->close();
    if (server_) server_->stop();
    run_for(ioc_, 50ms);
  }

  void start(ScriptedHttpServer::Script script) {
    server_ = std::make_shared<ScriptedHttpServer>(ioc_, std::move(script));
    server_->start();

    config::ServerConnectionConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = server_->port();
    cfg.validate_and_clamp();

    transport_ = std::make_unique<ChainedPollTransport>(cfg, BeastHttpRequest::factory(ioc_, nullptr),
                                                        BoostSteadyTimer::factory(ioc_));
    transport_->on_event([this](const ChannelEvent& event) { events_.push_back(event); });
    transport_->start("abc", "tok");
  }

  std::vector<json> messages() const {
    std::vector<json> result;
    for (const auto& event : events_) {
      if (event.type == SocketEvent::Message) result.push_back(event.message);
    }
    return result;
  }

  net::io_context ioc_;
  std::shared_ptr<ScriptedHttpServer> server_;
  std::unique_ptr<ChainedPollTransport> transport_;
  std::vector<ChannelEvent> events_;
};

TEST_F(ChainedPollIntegrationTest, DeliversStreamedLinesInOrder) {
  // Given: a poll response split across chunk boundaries
  start([](const RecordedRequest& request) {
    ScriptedResponse response;
    if (request.target.find("/id?i=") != std::string::npos) {
      response.chunks = {"{\"type\":\"OPEN\"}\n{\"type\":\"OF", "FER\",\"src\":\"peer-b\"}\n", "{\"type\":\"CANDIDATE\"}\n"};
      response.hold_open = true;
    }
    return response;
  });

  // When
  ASSERT_TRUE(run_until(ioc_, [this]() { return messages().size() >= 3; }));

  // Then
  auto received = messages();
  EXPECT_EQ(received[0]["type"], "OPEN");
  EXPECT_EQ(received[1]["type"], "OFFER");
  EXPECT_EQ(received[1]["src"], "peer-b");
  EXPECT_EQ(received[2]["type"], "CANDIDATE");
  EXPECT_EQ(server_->requests()[0].target, "/peerjs/abc/tok/id?i=0");
}

TEST_F(ChainedPollIntegrationTest, PostsOutboundMessagesByType) {
  start([](const RecordedRequest& request) {
    ScriptedResponse response;
    if (request.target.find("/id?i=") != std::string::npos) {
      response.chunks = {"{\"type\":\"OPEN\"}\n"};
      response.hold_open = true;
    }
    return response;
  });
  ASSERT_TRUE(run_until(ioc_, [this]() { return !messages().empty(); }));

  // When
  transport_->send(json{{"type", "OFFER"}, {"dst", "peer-b"}});

  // Then
  ASSERT_TRUE(run_until(ioc_, [this]() { return server_->requests().size() >= 2; }));
  const auto& post = server_->requests()[1];
  EXPECT_EQ(post.method, "POST");
  EXPECT_EQ(post.target, "/peerjs/abc/tok/offer");
  EXPECT_EQ(post.content_type, "application/json");
  EXPECT_EQ(json::parse(post.body), (json{{"type", "OFFER"}, {"dst", "peer-b"}}));
}

TEST_F(ChainedPollIntegrationTest, UnreachableServerDisconnects) {
  config::ServerConnectionConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = closed_port(ioc_);
  cfg.validate_and_clamp();

  transport_ = std::make_unique<ChainedPollTransport>(cfg, BeastHttpRequest::factory(ioc_, nullptr),
                                                      BoostSteadyTimer::factory(ioc_));
  transport_->on_event([this](const ChannelEvent& event) { events_.push_back(event); });
  transport_->start("abc", "tok");

  ASSERT_TRUE(run_until(ioc_, [this]() { return !events_.empty(); }));
  EXPECT_EQ(events_[0].type, SocketEvent::Disconnected);
}

TEST_F(ChainedPollIntegrationTest, CloseStopsDelivery) {
  start([](const RecordedRequest& request) {
    ScriptedResponse response;
    if (request.target.find("/id?i=") != std::string::npos) {
      response.chunks = {"{\"type\":\"OPEN\"}\n", "{\"type\":\"LATE\"}\n"};
      response.interval = 100ms;
      response.hold_open = true;
    }
    return response;
  });
  ASSERT_TRUE(run_until(ioc_, [this]() { return !messages().empty(); }));

  transport_->close();
  run_for(ioc_, 300ms);

  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].message["type"], "OPEN");
  EXPECT_TRUE(transport_->is_disconnected());
}
