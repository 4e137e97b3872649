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

#include "common/errors.h"

#include <gtest/gtest.h>

#include "common/utils.h"

namespace ai_platform {

TEST(ErrorsTest, KindsMapToHttpStatus) {
  EXPECT_EQ(http_status_code(not_found_error("x")), 404);
  EXPECT_EQ(http_status_code(unavailable_error("x")), 503);
  EXPECT_EQ(http_status_code(unauthorized_error("x")), 401);
  EXPECT_EQ(http_status_code(budget_exceeded_error("x")), 429);
  EXPECT_EQ(http_status_code(rate_limited_error("x")), 429);
  EXPECT_EQ(http_status_code(provider_error("x", true)), 500);
  EXPECT_EQ(http_status_code(invalid_argument_error("x")), 400);
  EXPECT_EQ(http_status_code(absl::OkStatus()), 200);
}

TEST(ErrorsTest, KindSurvivesSharedCanonicalCode) {
  absl::Status budget = budget_exceeded_error("global budget exceeded");
  absl::Status limited = rate_limited_error("slow down");
  EXPECT_EQ(budget.code(), limited.code());
  EXPECT_EQ(error_kind(budget), ErrorKind::kBudgetExceeded);
  EXPECT_EQ(error_kind(limited), ErrorKind::kRateLimited);
}

TEST(ErrorsTest, PlainStatusFallsBackToCanonicalCode) {
  EXPECT_EQ(error_kind(absl::NotFoundError("x")), ErrorKind::kNotFound);
  EXPECT_EQ(error_kind(absl::UnavailableError("x")), ErrorKind::kUnavailable);
  EXPECT_EQ(error_kind(absl::DataLossError("x")), ErrorKind::kInternal);
  EXPECT_EQ(error_kind(absl::OkStatus()), ErrorKind::kOk);
}

TEST(ErrorsTest, ProviderErrorCarriesRetryable) {
  EXPECT_TRUE(is_retryable(provider_error("timeout", true)));
  EXPECT_FALSE(is_retryable(provider_error("bad request", false)));
  EXPECT_FALSE(is_retryable(not_found_error("x")));
}

TEST(ErrorsTest, EnvelopeHasCodeAndMessage) {
  nlohmann::json envelope =
      error_envelope(unauthorized_error("invalid token"));
  EXPECT_EQ(envelope["code"], "UNAUTHORIZED");
  EXPECT_EQ(envelope["message"], "invalid token");
}

TEST(UtilsTest, ServiceIdIsStablePerNetworkIdentity) {
  const std::string id =
      utils::make_service_id("text_to_image", "gpu-0", "10.0.0.1", 8000);
  EXPECT_EQ(id,
            utils::make_service_id("text_to_image", "gpu-0", "10.0.0.1", 8000));
  EXPECT_NE(id,
            utils::make_service_id("text_to_image", "gpu-0", "10.0.0.1", 8001));
  EXPECT_EQ(id.rfind("text_to_image-", 0), 0u);
  EXPECT_EQ(id.size(), std::string("text_to_image-").size() + 8);
}

TEST(UtilsTest, TokensAreRandomHex) {
  auto first = utils::generate_token();
  auto second = utils::generate_token();
  ASSERT_TRUE(first.ok()) << first.status();
  ASSERT_TRUE(second.ok()) << second.status();
  const std::string& a = *first;
  const std::string& b = *second;
  EXPECT_EQ(a.size(), 32u);
  EXPECT_NE(a, b);
  EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(UtilsTest, FormatDateIsUtc) {
  EXPECT_EQ(utils::format_date(absl::FromUnixSeconds(1700000000)),
            "2023-11-14");
}

}  // namespace ai_platform
