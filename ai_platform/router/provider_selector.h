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

#pragma once

#include <absl/random/random.h>

#include <mutex>
#include <vector>

#include "common/feature_config.h"
#include "common/macros.h"

namespace ai_platform {

// Picks one provider out of the filtered candidates. Every method returns
// nullptr for an empty candidate list.
class ProviderSelector final {
 public:
  ProviderSelector() = default;
  ~ProviderSelector() = default;

  // Dispatches on the feature's routing policy, PRIORITY when none is set.
  const ProviderConfig* select(const Feature& feature,
                               const std::vector<ProviderConfig>& candidates);

  // Uniform among the candidates tied at the lowest priority value.
  const ProviderConfig* select_by_priority(
      const std::vector<ProviderConfig>& candidates);

  // Probability of a candidate converges to weight / total weight. Falls
  // back to the first candidate when no weight is positive.
  const ProviderConfig* select_by_weight(
      const std::vector<ProviderConfig>& candidates);

  // Any self-hosted candidate wins; otherwise the cheapest third party by
  // the per-request cost table, or the first candidate without cost data.
  const ProviderConfig* select_by_cost(
      const Feature& feature,
      const std::vector<ProviderConfig>& candidates);

 private:
  DISALLOW_COPY_AND_ASSIGN(ProviderSelector);

  std::mutex gen_mutex_;
  absl::BitGen gen_;
};

}  // namespace ai_platform
