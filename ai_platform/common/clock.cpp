/* Copyright 2025 The AI Platform Authors. All Rights Reserved.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
==============================================================================*/

#include "common/clock.h"

#include <absl/time/clock.h>

namespace ai_platform {

namespace {

class RealClock final : public Clock {
 public:
  absl::Time now() const override { return absl::Now(); }
};

}  // namespace

std::shared_ptr<Clock> Clock::real() {
  static std::shared_ptr<Clock> clock = std::make_shared<RealClock>();
  return clock;
}

}  // namespace ai_platform
