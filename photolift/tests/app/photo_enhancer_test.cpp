//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "app/photo_enhancer.hpp"

#include <memory>
#include <opencv2/core.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/service_test_fixation.hpp"
#include "face/face_test_fixation.hpp"

using namespace photolift;

namespace {
auto HasStage(const nlohmann::json& stages, const std::string& name) -> bool {
  for (const auto& stage : stages) {
    if (stage.contains(name)) return true;
  }
  return false;
}
}  // namespace

TEST_F(ServiceTests, EmbeddedFaceOnBacklitFrameIsRelit) {
  auto          detector = std::make_unique<FixedFaceDetector>(std::vector<cv::Rect>{});
  auto*         fixed    = detector.get();
  PhotoEnhancer enhancer(EnhancerConfig{}, std::move(detector));

  ImageBuffer   frame(BacklitFrame(200));
  auto result = enhancer.Enhance(frame, std::nullopt, {NormalizedFaceArea{0.5, 0.5, 0.4, 0.4}});

  EXPECT_TRUE(result.metrics_.is_backlit);
  ASSERT_EQ(result.face_regions_.size(), 1u);
  EXPECT_EQ(result.face_regions_[0].ToRect(), cv::Rect(60, 60, 80, 80));
  EXPECT_EQ(fixed->calls_, 0);
  EXPECT_GT(result.params_.face_relight_strength, 0.0);
  EXPECT_TRUE(HasStage(result.applied_stages_, "face_relight"));

  ASSERT_TRUE(result.enhanced_.IsValidPixelBuffer());
  EXPECT_EQ(result.enhanced_.Width(), 200);
  EXPECT_EQ(result.enhanced_.Height(), 200);
}

TEST_F(ServiceTests, DetectorIsUsedWithoutEmbeddedAreas) {
  auto          detector = std::make_unique<FixedFaceDetector>(
      std::vector<cv::Rect>{cv::Rect(60, 60, 80, 80)});
  auto*         fixed    = detector.get();
  PhotoEnhancer enhancer(EnhancerConfig{}, std::move(detector));

  auto          result   = enhancer.Enhance(ImageBuffer(BacklitFrame(200)), std::nullopt, {});
  EXPECT_EQ(fixed->calls_, 1);
  ASSERT_EQ(result.face_regions_.size(), 1u);
  EXPECT_GT(result.params_.face_relight_strength, 0.0);
}

TEST_F(ServiceTests, NoFacesMeansNoRelight) {
  PhotoEnhancer enhancer(EnhancerConfig{},
                         std::make_unique<FixedFaceDetector>(std::vector<cv::Rect>{}));
  auto          result = enhancer.Enhance(ImageBuffer(BacklitFrame(200)), std::nullopt, {});
  EXPECT_TRUE(result.face_regions_.empty());
  EXPECT_DOUBLE_EQ(result.params_.face_relight_strength, 0.0);
  EXPECT_FALSE(HasStage(result.applied_stages_, "face_relight"));
}

TEST_F(ServiceTests, EnhancerRejectsInvalidBuffers) {
  PhotoEnhancer enhancer(EnhancerConfig{}, nullptr);
  EXPECT_THROW(enhancer.Enhance(ImageBuffer(), std::nullopt, {}), std::invalid_argument);
  EXPECT_THROW(enhancer.Enhance(ImageBuffer(cv::Mat(8, 8, CV_32FC3, cv::Scalar::all(0.5))),
                                std::nullopt, {}),
               std::invalid_argument);
}
