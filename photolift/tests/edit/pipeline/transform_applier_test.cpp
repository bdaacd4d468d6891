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

#include "edit/pipeline/transform_applier.hpp"

#include <opencv2/core.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "edit/pipeline/pipeline_test_fixation.hpp"

using namespace photolift;

namespace {
auto StageNames(const nlohmann::json& stages) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto& stage : stages) {
    names.push_back(stage.begin().key());
  }
  return names;
}
}  // namespace

TEST_F(PipelineTests, NeutralParamsAreIdentity) {
  cv::Mat pixels(48, 64, CV_8UC3);
  cv::randu(pixels, cv::Scalar::all(0), cv::Scalar::all(256));
  ImageBuffer input(pixels);
  input.SetColorProfile({9, 8, 7});

  TransformApplier applier;
  ApplyResult      result = applier.Apply(input, AdjustmentParameters::Neutral(), {});

  EXPECT_EQ(cv::norm(result.enhanced_.GetCPUData(), pixels, cv::NORM_INF), 0.0);
  EXPECT_TRUE(result.applied_stages_.empty());
  EXPECT_EQ(result.effective_params_, AdjustmentParameters::Neutral());
  EXPECT_EQ(result.enhanced_.GetColorProfile(), input.GetColorProfile());
}

TEST_F(PipelineTests, OutputKeepsShapeAndType) {
  ImageBuffer          input(cv::Mat(30, 50, CV_8UC3, cv::Scalar(30, 90, 150)));
  AdjustmentParameters params;
  params.exposure_adjustment   = 0.5;
  params.contrast_adjustment   = 1.2;
  params.saturation_adjustment = 1.3;
  params.sharpness_amount      = 0.8;
  params.noise_reduction       = 0.4;

  ApplyResult result = TransformApplier().Apply(input, params, {});
  EXPECT_EQ(result.enhanced_.GetCPUData().type(), CV_8UC3);
  EXPECT_EQ(result.enhanced_.GetCPUData().size(), cv::Size(50, 30));
}

TEST_F(PipelineTests, StagesRunInFixedOrder) {
  ImageBuffer          input(cv::Mat(32, 32, CV_8UC3, cv::Scalar::all(100)));
  AdjustmentParameters params;
  params.sharpness_amount      = 0.5;
  params.exposure_adjustment   = 0.2;
  params.noise_reduction       = 0.3;
  params.shadow_lift           = 0.2;
  params.saturation_adjustment = 1.2;
  params.contrast_adjustment   = 1.1;
  params.highlight_recovery    = 0.2;

  ApplyResult result = TransformApplier().Apply(input, params, {});
  const std::vector<std::string> expected = {
      "exposure",   "contrast",        "shadow_lift", "highlight_recovery",
      "saturation", "noise_reduction", "sharpen"};
  EXPECT_EQ(StageNames(result.applied_stages_), expected);
}

TEST_F(PipelineTests, TinyAdjustmentsAreSkipped) {
  ImageBuffer          input(cv::Mat(16, 16, CV_8UC3, cv::Scalar::all(100)));
  AdjustmentParameters params;
  params.exposure_adjustment   = 0.005;
  params.contrast_adjustment   = 1.005;
  params.saturation_adjustment = 0.995;
  params.sharpness_amount      = 0.01;

  ApplyResult result = TransformApplier().Apply(input, params, {});
  EXPECT_TRUE(result.applied_stages_.empty());
}

TEST_F(PipelineTests, InputIsNotModified) {
  cv::Mat     pixels(20, 20, CV_8UC3, cv::Scalar::all(60));
  ImageBuffer input(pixels);
  ImageBuffer snapshot = input.Clone();

  AdjustmentParameters params;
  params.exposure_adjustment   = 1.0;
  params.face_relight_strength = 0.3;
  const AdjustmentParameters requested = params;

  TransformApplier().Apply(input, params, {{5, 5, 10, 10}});
  EXPECT_EQ(cv::norm(input.GetCPUData(), snapshot.GetCPUData(), cv::NORM_INF), 0.0);
  EXPECT_EQ(params, requested);
}

TEST_F(PipelineTests, AutoHighlightRecoveryIsReported) {
  cv::Mat pixels(20, 20, CV_8UC3, cv::Scalar::all(100));
  pixels.rowRange(0, 10).setTo(cv::Scalar::all(250));
  AdjustmentParameters params;
  params.exposure_adjustment = 0.3;

  ApplierConfig config;
  ApplyResult   result = TransformApplier(config).Apply(ImageBuffer(pixels), params, {});
  EXPECT_DOUBLE_EQ(result.effective_params_.highlight_recovery, config.auto_highlight_max);
  EXPECT_DOUBLE_EQ(params.highlight_recovery, 0.0);
}

TEST_F(PipelineTests, FaceStrengthWithoutFacesIsZero) {
  AdjustmentParameters params;
  params.face_relight_strength = 0.4;
  ApplyResult result =
      TransformApplier().Apply(MakeBacklitFrame(100, {30, 30, 40, 40}), params, {});
  EXPECT_DOUBLE_EQ(result.effective_params_.face_relight_strength, 0.0);
}

TEST_F(PipelineTests, FaceStrengthIsClampedToMax) {
  AdjustmentParameters params;
  params.face_relight_strength = 5.0;
  ApplierConfig config;
  ApplyResult   result = TransformApplier(config).Apply(MakeBacklitFrame(100, {30, 30, 40, 40}),
                                                        params, {{30, 30, 40, 40}});
  EXPECT_DOUBLE_EQ(result.effective_params_.face_relight_strength, config.face_relight_max);
}

TEST_F(PipelineTests, WeakRequestFallsBackToAutoStrength) {
  AdjustmentParameters params;
  params.face_relight_strength = 0.0;
  ApplyResult result = TransformApplier().Apply(MakeBacklitFrame(200, {80, 80, 40, 40}), params,
                                                {{80, 80, 40, 40}});
  EXPECT_GT(result.effective_params_.face_relight_strength, 0.0);
  EXPECT_GT(NormalizedMean(result.enhanced_, {80, 80, 40, 40}), 40.0 / 255.0);
}

TEST_F(PipelineTests, FlatFaceBelowTriggerIsReset) {
  ImageBuffer          flat(cv::Mat(120, 120, CV_8UC3, cv::Scalar::all(100)));
  AdjustmentParameters params;
  params.face_relight_strength = 0.05;

  ApplyResult result = TransformApplier().Apply(flat, params, {{20, 20, 40, 40}});
  EXPECT_DOUBLE_EQ(result.effective_params_.face_relight_strength, 0.0);
  EXPECT_TRUE(result.applied_stages_.empty());
}

TEST_F(PipelineTests, RejectsNonPixelBuffers) {
  TransformApplier applier;
  EXPECT_THROW(applier.Apply(ImageBuffer(), AdjustmentParameters::Neutral(), {}),
               std::invalid_argument);
  EXPECT_THROW(applier.Apply(ImageBuffer(cv::Mat(4, 4, CV_32FC3, cv::Scalar::all(0.5))),
                             AdjustmentParameters::Neutral(), {}),
               std::invalid_argument);
}
