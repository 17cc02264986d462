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

#include "signalink/transport/timer/steady_timer.hpp"

namespace signalink {
namespace transport {

BoostSteadyTimer::BoostSteadyTimer(net::io_context& ioc)
    : timer_(ioc), generation_(std::make_shared<uint64_t>(0)) {}

// Queued completions hold only a weak reference, so they see it expire here
BoostSteadyTimer::~BoostSteadyTimer() { generation_.reset(); }

void BoostSteadyTimer::expires_after(std::chrono::milliseconds expiry_time) {
  invalidate_pending_wait();
  timer_.expires_after(expiry_time);
}

void BoostSteadyTimer::async_wait(Handler handler) {
  std::weak_ptr<uint64_t> weak_generation = generation_;
  const uint64_t armed = *generation_;
  timer_.async_wait([weak_generation, armed, handler = std::move(handler)](const boost::system::error_code& ec) {
    auto generation = weak_generation.lock();
    if (!generation || *generation != armed) return;
    handler(ec);
  });
}

void BoostSteadyTimer::cancel() {
  invalidate_pending_wait();
  timer_.cancel();
}

void BoostSteadyTimer::invalidate_pending_wait() { ++*generation_; }

interface::TimerFactory BoostSteadyTimer::factory(net::io_context& ioc) {
  return [&ioc]() -> std::unique_ptr<interface::TimerInterface> { return std::make_unique<BoostSteadyTimer>(ioc); };
}

}  // namespace transport
}  // namespace signalink
