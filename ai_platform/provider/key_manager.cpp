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

#include "provider/key_manager.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <algorithm>

#include "common/errors.h"

namespace ai_platform {

namespace {

// primary before backup before overflow, unknown tiers last
int32_t tier_rank(const std::string& tier) {
  if (tier == "primary") {
    return 0;
  }
  if (tier == "backup") {
    return 1;
  }
  if (tier == "overflow") {
    return 2;
  }
  return 3;
}

}  // namespace

void InMemoryKeyManager::add_key(const ApiKey& key, const std::string& secret) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(keys_.begin(), keys_.end(), [&key](const ApiKey& k) {
    return k.id == key.id;
  });
  if (it != keys_.end()) {
    *it = key;
  } else {
    keys_.emplace_back(key);
  }
  secrets_[key.id] = secret;
  LOG(INFO) << "Add API key " << key.id << " for " << key.vendor << "/"
            << key.service << ", tier: " << key.tier;
}

absl::Status InMemoryKeyManager::set_enabled(const std::string& key_id,
                                             bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& key : keys_) {
    if (key.id == key_id) {
      key.enabled = enabled;
      return absl::OkStatus();
    }
  }
  return not_found_error(absl::StrCat("key not found: ", key_id));
}

absl::StatusOr<ApiKey> InMemoryKeyManager::get_active_key(
    const std::string& vendor,
    const std::string& service) {
  std::lock_guard<std::mutex> lock(mutex_);
  const ApiKey* active = nullptr;
  for (const auto& key : keys_) {
    if (!key.enabled || key.vendor != vendor || key.service != service) {
      continue;
    }
    if (active == nullptr || tier_rank(key.tier) < tier_rank(active->tier)) {
      active = &key;
    }
  }
  if (active == nullptr) {
    return not_found_error(
        absl::StrCat("no active key found for ", vendor, "/", service));
  }
  return *active;
}

absl::StatusOr<std::string> InMemoryKeyManager::get_plaintext_key(
    const ApiKey& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = secrets_.find(key.id);
  if (it == secrets_.end()) {
    return not_found_error(absl::StrCat("key not found: ", key.id));
  }
  return it->second;
}

absl::Status InMemoryKeyManager::record_usage(const std::string& key_id,
                                              const KeyUsageRecord& usage) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (secrets_.find(key_id) == secrets_.end()) {
    return not_found_error(absl::StrCat("key not found: ", key_id));
  }
  usages_[key_id].emplace_back(usage);
  return absl::OkStatus();
}

std::vector<KeyUsageRecord> InMemoryKeyManager::usages(
    const std::string& key_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = usages_.find(key_id);
  if (it == usages_.end()) {
    return {};
  }
  return it->second;
}

}  // namespace ai_platform
