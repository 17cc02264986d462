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

#include <boost/system/error_code.hpp>
#include <chrono>
#include <functional>
#include <memory>

namespace signalink {
namespace interface {

/**
 * @brief An interface abstracting Boost.Asio's steady_timer for testability.
 *
 * Each owner holds exactly one timer per timeout slot. Re-arming, cancelling
 * or destroying the timer guarantees the pending handler never runs, even if
 * its deadline had already passed. Owners may therefore capture `this` as
 * long as the timer does not outlive them.
 */
class TimerInterface {
 public:
  using Handler = std::function<void(const boost::system::error_code&)>;

  virtual ~TimerInterface() = default;

  virtual void expires_after(std::chrono::milliseconds expiry_time) = 0;
  virtual void async_wait(Handler handler) = 0;
  virtual void cancel() = 0;
};

using TimerFactory = std::function<std::unique_ptr<TimerInterface>()>;

}  // namespace interface
}  // namespace signalink
