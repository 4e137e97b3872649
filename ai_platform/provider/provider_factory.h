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

#include <absl/status/statusor.h>

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/macros.h"
#include "provider/provider.h"

namespace ai_platform {

// Vendor name of the built-in client for the self-hosted fleet.
inline constexpr char kSelfHostedVendor[] = "self_hosted";

using ProviderCreator = std::function<absl::StatusOr<std::unique_ptr<Provider>>(
    const ProviderSettings& settings)>;

// Builds provider clients by vendor name. The self-hosted client is
// registered on construction; third party vendors are registered by the
// embedding application.
class ProviderFactory final {
 public:
  ProviderFactory();
  ~ProviderFactory() = default;

  // Replaces an existing creator of the same vendor.
  void register_vendor(const std::string& vendor, ProviderCreator creator);

  bool has_vendor(const std::string& vendor) const;

  std::vector<std::string> vendors() const;

  absl::StatusOr<std::unique_ptr<Provider>> create(
      const std::string& vendor,
      const ProviderSettings& settings) const;

 private:
  DISALLOW_COPY_AND_ASSIGN(ProviderFactory);

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, ProviderCreator> creators_;
};

}  // namespace ai_platform
