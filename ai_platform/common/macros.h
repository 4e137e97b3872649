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

#include <utility>

namespace ai_platform {

#define DISALLOW_COPY_AND_ASSIGN(TypeName) \
  TypeName(const TypeName&) = delete;      \
  void operator=(const TypeName&) = delete

// Fluent getter/setter pair backed by a private member `name_`.
//   options.heartbeat_interval_s(15).max_missed_heartbeats(2);
#define PROPERTY(T, property)                                        \
 public:                                                             \
  [[nodiscard]] const T& property() const& noexcept {                \
    return property##_;                                              \
  }                                                                  \
  [[nodiscard]] T& property() & noexcept { return property##_; }     \
  [[nodiscard]] T&& property() && noexcept {                         \
    return std::move(property##_);                                   \
  }                                                                  \
                                                                     \
  auto property(const T& value) & -> decltype(*this) {               \
    property##_ = value;                                             \
    return *this;                                                    \
  }                                                                  \
                                                                     \
  auto property(T&& value) & -> decltype(*this) {                    \
    property##_ = std::move(value);                                  \
    return *this;                                                    \
  }                                                                  \
                                                                     \
  auto property(const T& value) && -> decltype(std::move(*this)) {   \
    property##_ = value;                                             \
    return std::move(*this);                                         \
  }                                                                  \
                                                                     \
  auto property(T&& value) && -> decltype(std::move(*this)) {        \
    property##_ = std::move(value);                                  \
    return std::move(*this);                                         \
  }                                                                  \
                                                                     \
 private:                                                            \
  T property##_

}  // namespace ai_platform
