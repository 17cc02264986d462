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

#include "signalink/config/server_connection_config.hpp"

using namespace signalink;
using namespace signalink::config;

namespace {

ServerConnectionConfig make_config() {
  ServerConnectionConfig cfg;
  cfg.host = "signal.example.com";
  cfg.port = 9000;
  cfg.path = "/";
  cfg.key = "peerjs";
  return cfg;
}

}  // namespace

TEST(ServerConnectionConfigTest, DefaultsAreValid) {
  ServerConnectionConfig cfg;
  EXPECT_TRUE(cfg.is_valid());
  EXPECT_EQ(cfg.effective_ping_interval_ms(), base::constants::DEFAULT_PING_INTERVAL_MS);
  EXPECT_FALSE(cfg.use_http_stream_fallback);
}

TEST(ServerConnectionConfigTest, RejectsMissingHostPortOrKey) {
  auto cfg = make_config();
  cfg.host.clear();
  EXPECT_FALSE(cfg.is_valid());

  cfg = make_config();
  cfg.port = 0;
  EXPECT_FALSE(cfg.is_valid());

  cfg = make_config();
  cfg.key.clear();
  EXPECT_FALSE(cfg.is_valid());
}

TEST(ServerConnectionConfigTest, RejectsKeyThatBreaksUrls) {
  auto cfg = make_config();
  cfg.key = "peer/js";
  EXPECT_FALSE(cfg.is_valid());

  cfg.key = "peer&js";
  EXPECT_FALSE(cfg.is_valid());
}

TEST(ServerConnectionConfigTest, RejectsOversizedHost) {
  auto cfg = make_config();
  cfg.host = std::string(base::constants::MAX_HOSTNAME_LENGTH + 1, 'a');
  EXPECT_FALSE(cfg.is_valid());
}

TEST(ServerConnectionConfigTest, PingIntervalOutOfRangeIsClamped) {
  auto cfg = make_config();

  // Given: an interval below the minimum
  cfg.ping_interval_ms = 10;
  EXPECT_FALSE(cfg.is_valid());

  // When
  cfg.validate_and_clamp();

  // Then
  EXPECT_TRUE(cfg.is_valid());
  EXPECT_EQ(cfg.effective_ping_interval_ms(), base::constants::MIN_PING_INTERVAL_MS);

  cfg.ping_interval_ms = 10 * 60 * 1000;
  cfg.validate_and_clamp();
  EXPECT_EQ(cfg.effective_ping_interval_ms(), base::constants::MAX_PING_INTERVAL_MS);
}

TEST(ServerConnectionConfigTest, PathIsNormalisedWithSlashes) {
  auto cfg = make_config();
  cfg.path = "signal";
  cfg.validate_and_clamp();
  EXPECT_EQ(cfg.path, "/signal/");

  cfg.path = "";
  cfg.validate_and_clamp();
  EXPECT_EQ(cfg.path, "/");

  cfg.path = "/already/";
  cfg.validate_and_clamp();
  EXPECT_EQ(cfg.path, "/already/");
}

TEST(ServerConnectionConfigTest, HttpBaseUrl) {
  auto cfg = make_config();
  EXPECT_EQ(cfg.http_base_url(), "http://signal.example.com:9000/peerjs");

  cfg.secure = true;
  cfg.port = 443;
  cfg.path = "/myapp/";
  EXPECT_EQ(cfg.http_base_url(), "https://signal.example.com:443/myapp/peerjs");
}

TEST(ServerConnectionConfigTest, WebsocketTarget) {
  auto cfg = make_config();
  cfg.path = "/myapp/";
  cfg.key = "secret";
  EXPECT_EQ(cfg.websocket_target("peer-a", "tok1"), "/myapp/peerjs?key=secret&id=peer-a&token=tok1");
}
