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

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace signalink {
namespace base {
namespace constants {

// Fixed protocol timeouts
constexpr std::chrono::milliseconds POLL_OPEN_TIMEOUT{5000};     // poll request must reach headers within 5s
constexpr std::chrono::milliseconds POLL_IDLE_TIMEOUT{25000};    // next poll is issued after 25s
constexpr std::chrono::milliseconds PRIMARY_OPEN_TIMEOUT{5000};  // primary must confirm within 5s
constexpr std::chrono::milliseconds CLOSE_GRACE_TIMEOUT{15000};  // native reconnect grace period

// Heartbeat of the primary transport
constexpr unsigned DEFAULT_PING_INTERVAL_MS = 5000;  // 5 seconds
constexpr unsigned MIN_PING_INTERVAL_MS = 1000;      // 1 second minimum
constexpr unsigned MAX_PING_INTERVAL_MS = 300000;    // 5 minutes maximum

// Server endpoint defaults
constexpr const char* DEFAULT_PATH = "/";
constexpr const char* DEFAULT_KEY = "peerjs";
constexpr uint16_t DEFAULT_PORT = 9000;

// Validation constants
constexpr size_t MAX_HOSTNAME_LENGTH = 253;  // Maximum hostname length (RFC 1123)
constexpr size_t MAX_KEY_LENGTH = 256;
constexpr size_t MAX_PATH_LENGTH = 1024;

// Read limits
constexpr size_t DEFAULT_READ_CHUNK_SIZE = 4096;
constexpr size_t MAX_RESPONSE_BODY_SIZE = 16 * 1024 * 1024;  // 16MB per poll response

// Messages held for a connection id that is not registered yet; oldest dropped first
constexpr size_t MAX_LOST_MESSAGES_PER_CONNECTION = 64;

// Error handling constants
constexpr size_t DEFAULT_MAX_RECENT_ERRORS = 1000;

}  // namespace constants
}  // namespace base
}  // namespace signalink
