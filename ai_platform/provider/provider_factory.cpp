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

#include "provider/provider_factory.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <algorithm>
#include <mutex>

#include "common/errors.h"
#include "provider/self_hosted_provider.h"

namespace ai_platform {

ProviderFactory::ProviderFactory() {
  creators_[kSelfHostedVendor] = [](const ProviderSettings& settings)
      -> absl::StatusOr<std::unique_ptr<Provider>> {
    return SelfHostedProvider::create(settings);
  };
}

void ProviderFactory::register_vendor(const std::string& vendor,
                                      ProviderCreator creator) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  creators_.insert_or_assign(vendor, std::move(creator));
  LOG(INFO) << "Register provider vendor " << vendor;
}

bool ProviderFactory::has_vendor(const std::string& vendor) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return creators_.find(vendor) != creators_.end();
}

std::vector<std::string> ProviderFactory::vendors() const {
  std::vector<std::string> names;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    names.reserve(creators_.size());
    for (const auto& it : creators_) {
      names.emplace_back(it.first);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

absl::StatusOr<std::unique_ptr<Provider>> ProviderFactory::create(
    const std::string& vendor,
    const ProviderSettings& settings) const {
  ProviderCreator creator;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = creators_.find(vendor);
    if (it == creators_.end()) {
      return not_found_error(absl::StrCat("unsupported vendor: ", vendor));
    }
    creator = it->second;
  }
  return creator(settings);
}

}  // namespace ai_platform
