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
#include <cstdint>
#include <memory>

#include "signalink/base/visibility.hpp"
#include "signalink/interface/itimer.hpp"

namespace signalink {
namespace transport {

namespace net = boost::asio;

/**
 * @brief Boost.Asio implementation of TimerInterface.
 * This is the real implementation used in production.
 *
 * A wait is tied to the arming that issued it. Once the timer is cancelled,
 * re-armed or destroyed, a completion already queued on the io_context is
 * discarded instead of being delivered.
 */
class SIGNALINK_API BoostSteadyTimer : public interface::TimerInterface {
 public:
  explicit BoostSteadyTimer(net::io_context& ioc);
  ~BoostSteadyTimer() override;

  void expires_after(std::chrono::milliseconds expiry_time) override;
  void async_wait(Handler handler) override;
  void cancel() override;

  static interface::TimerFactory factory(net::io_context& ioc);

 private:
  void invalidate_pending_wait();

  net::steady_timer timer_;
  // Bumped on every cancel or re-arm; released on destruction
  std::shared_ptr<uint64_t> generation_;
};

}  // namespace transport
}  // namespace signalink
