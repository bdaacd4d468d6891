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

#include <easy/profiler.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "edit/operators/basic/contrast_op.hpp"
#include "edit/operators/basic/exposure_op.hpp"
#include "edit/operators/basic/highlight_op.hpp"
#include "edit/operators/basic/shadow_op.hpp"
#include "edit/operators/color/saturation_op.hpp"
#include "edit/operators/detail/noise_reduction_op.hpp"
#include "edit/operators/detail/sharpen_op.hpp"
#include "edit/operators/face/face_relight_op.hpp"
#include "edit/operators/utils/functions.hpp"

namespace photolift {
TransformApplier::TransformApplier(ApplierConfig config) : _config(std::move(config)) {}

void TransformApplier::RunStage(IOperatorBase& op, const std::shared_ptr<ImageBuffer>& working,
                                nlohmann::json& applied_stages) {
  if (op.IsNoOp()) {
    return;
  }
  op.Apply(working);
  applied_stages.push_back(op.GetParams());
}

auto TransformApplier::Apply(const ImageBuffer& input, const AdjustmentParameters& params,
                             const std::vector<FaceRegion>& face_regions) const -> ApplyResult {
  EASY_FUNCTION();
  if (!input.IsValidPixelBuffer()) {
    throw std::invalid_argument("TransformApplier: input must be a non-empty 8-bit RGB buffer");
  }

  ApplyResult result;
  result.effective_params_ = params;
  auto& applied            = result.applied_stages_;
  auto  working            = std::make_shared<ImageBuffer>(ToWorkingFloat(input.GetCPUData()));

  EASY_BLOCK("Tone");
  ExposureOp exposure(params.exposure_adjustment);
  RunStage(exposure, working, applied);

  ContrastOp contrast(params.contrast_adjustment);
  RunStage(contrast, working, applied);

  ShadowLiftOp shadow(params.shadow_lift);
  RunStage(shadow, working, applied);

  // Brightening above may have pushed new areas into clipping
  const double auto_recovery =
      HighlightRecoveryOp::EstimateAutoRecovery(working->GetCPUData(), params, _config);
  const double recovery = std::max(params.highlight_recovery, auto_recovery);
  result.effective_params_.highlight_recovery = recovery;
  HighlightRecoveryOp highlight(recovery);
  RunStage(highlight, working, applied);
  EASY_END_BLOCK;

  EASY_BLOCK("Face Relight");
  double strength = Clamp(params.face_relight_strength, 0.0, _config.face_relight_max);
  if (face_regions.empty()) {
    strength = 0.0;
  } else {
    if (strength < _config.face_relight_min_trigger) {
      strength = std::max(
          strength, FaceRelightOp::EstimateAutoStrength(working->GetCPUData(), face_regions));
    }
    if (strength >= _config.face_relight_min_trigger) {
      FaceRelightOp relight(strength, face_regions, _config.min_face_size);
      RunStage(relight, working, applied);
    } else {
      strength = 0.0;
    }
  }
  result.effective_params_.face_relight_strength = strength;
  EASY_END_BLOCK;

  EASY_BLOCK("Color and Detail");
  SaturationOp saturation(params.saturation_adjustment, params.skin_tone_protection);
  RunStage(saturation, working, applied);

  NoiseReductionOp noise(params.noise_reduction);
  RunStage(noise, working, applied);

  SharpenOp sharpen(params.sharpness_amount);
  RunStage(sharpen, working, applied);
  EASY_END_BLOCK;

  cv::Mat& img = working->GetCPUData();
  ClampToUnit(img);
  result.enhanced_ = ImageBuffer(ToPixelBuffer(img));
  result.enhanced_.SetColorProfile(input.GetColorProfile());
  return result;
}
};  // namespace photolift
