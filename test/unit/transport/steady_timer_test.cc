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

#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <thread>

using namespace signalink;
using namespace signalink::transport;
using namespace std::chrono_literals;

namespace {

// Stands in for a channel that arms a timer and touches itself on expiry
struct TimerOwner {
  explicit TimerOwner(net::io_context& ioc) : timer(std::make_unique<BoostSteadyTimer>(ioc)) {}

  void arm(std::chrono::milliseconds after, bool& fired) {
    timer->expires_after(after);
    timer->async_wait([this, &fired](const boost::system::error_code& ec) {
      if (ec) return;
      ++expirations;
      fired = true;
    });
  }

  int expirations = 0;
  std::unique_ptr<interface::TimerInterface> timer;
};

}  // namespace

class SteadyTimerTest : public ::testing::Test {
 protected:
  // Both deadlines pass before the io_context runs, so both completions
  // are dispatched from the same batch with the killer first
  void expire_both_then_run() {
    std::this_thread::sleep_for(20ms);
    ioc_.run();
  }

  net::io_context ioc_;
  bool fired_ = false;
};

TEST_F(SteadyTimerTest, FiresAfterDeadline) {
  BoostSteadyTimer timer(ioc_);
  boost::system::error_code result = net::error::operation_aborted;

  timer.expires_after(1ms);
  timer.async_wait([&](const boost::system::error_code& ec) {
    fired_ = true;
    result = ec;
  });
  ioc_.run();

  EXPECT_TRUE(fired_);
  EXPECT_FALSE(result);
}

TEST_F(SteadyTimerTest, CancelledWaitNeverRunsHandler) {
  BoostSteadyTimer timer(ioc_);
  timer.expires_after(50ms);
  timer.async_wait([&](const boost::system::error_code&) { fired_ = true; });

  timer.cancel();
  ioc_.run();

  EXPECT_FALSE(fired_);
}

TEST_F(SteadyTimerTest, OwnerDestroyedAfterExpiryBeforeDispatch) {
  // Given: an owner whose timer expires right after another timer
  auto owner = std::make_unique<TimerOwner>(ioc_);
  net::steady_timer killer(ioc_);
  killer.expires_after(1ms);
  killer.async_wait([&](const boost::system::error_code&) { owner.reset(); });
  owner->arm(2ms, fired_);

  // When: the killer destroys the owner while its completion is already queued
  expire_both_then_run();

  // Then: the owner's handler is discarded
  EXPECT_EQ(owner, nullptr);
  EXPECT_FALSE(fired_);
}

TEST_F(SteadyTimerTest, CancelAfterExpiryBeforeDispatchDiscardsHandler) {
  TimerOwner owner(ioc_);
  net::steady_timer killer(ioc_);
  killer.expires_after(1ms);
  killer.async_wait([&](const boost::system::error_code&) { owner.timer->cancel(); });
  owner.arm(2ms, fired_);

  expire_both_then_run();

  EXPECT_FALSE(fired_);
  EXPECT_EQ(owner.expirations, 0);
}

TEST_F(SteadyTimerTest, RearmAfterExpiryRunsOnlyNewWait) {
  // Given: a wait that has expired but not yet been dispatched
  TimerOwner owner(ioc_);
  bool rearmed_fired = false;
  net::steady_timer killer(ioc_);
  killer.expires_after(1ms);
  killer.async_wait([&](const boost::system::error_code&) { owner.arm(5ms, rearmed_fired); });
  owner.arm(2ms, fired_);

  // When: it is re-armed from the earlier handler
  expire_both_then_run();

  // Then: only the new arming is delivered
  EXPECT_FALSE(fired_);
  EXPECT_TRUE(rearmed_fired);
  EXPECT_EQ(owner.expirations, 1);
}
