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

#include "scaler/cluster_client.h"

#include <gtest/gtest.h>

#include "common/errors.h"

namespace ai_platform {

TEST(InMemoryClusterClientTest, TracksReplicasPerNamespace) {
  InMemoryClusterClient cluster;
  cluster.add_deployment("text_to_image-inference", "ai-platform", 1);
  cluster.add_deployment("text_to_image-inference", "staging", 3);

  EXPECT_EQ(*cluster.get_replicas("text_to_image-inference", "ai-platform"),
            1);
  ASSERT_TRUE(
      cluster.set_replicas("text_to_image-inference", "ai-platform", 4).ok());
  EXPECT_EQ(*cluster.get_replicas("text_to_image-inference", "ai-platform"),
            4);
  EXPECT_EQ(*cluster.get_replicas("text_to_image-inference", "staging"), 3);
  EXPECT_EQ(cluster.set_replicas_calls(), 1u);
}

TEST(InMemoryClusterClientTest, RejectsUnknownDeploymentAndNegativeCount) {
  InMemoryClusterClient cluster;
  cluster.add_deployment("image_editing-inference", "ai-platform", 0);

  auto missing = cluster.get_replicas("image_editing-inference", "prod");
  ASSERT_FALSE(missing.ok());
  EXPECT_EQ(error_kind(missing.status()), ErrorKind::kNotFound);
  EXPECT_EQ(missing.status().message(),
            "deployment not found: prod/image_editing-inference");

  EXPECT_EQ(error_kind(cluster.set_replicas("video-inference", "prod", 1)),
            ErrorKind::kNotFound);
  EXPECT_EQ(error_kind(cluster.set_replicas("image_editing-inference",
                                            "ai-platform", -1)),
            ErrorKind::kInvalidArgument);
  EXPECT_EQ(cluster.set_replicas_calls(), 0u);
}

}  // namespace ai_platform
