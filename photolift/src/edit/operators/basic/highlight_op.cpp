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

#include "edit/operators/basic/highlight_op.hpp"

#include "edit/operators/utils/functions.hpp"

namespace photolift {
HighlightRecoveryOp::HighlightRecoveryOp(double amount) : _amount(amount) {}

HighlightRecoveryOp::HighlightRecoveryOp(const nlohmann::json& params) { SetParams(params); }

auto HighlightRecoveryOp::EstimateAutoRecovery(const cv::Mat&              working,
                                               const AdjustmentParameters& params,
                                               const ApplierConfig&        config) -> double {
  const bool brightening = params.exposure_adjustment > 0.0 || params.contrast_adjustment > 1.0 ||
                           params.shadow_lift > 0.0;
  if (!brightening) {
    return 0.0;
  }

  const double clipping = HighlightClippingPercent(working);
  if (clipping <= config.auto_highlight_trigger_percent) {
    return 0.0;
  }

  const double recovery =
      config.auto_highlight_base +
      (clipping - config.auto_highlight_trigger_percent) * config.auto_highlight_slope;
  return Clamp(recovery, 0.0, config.auto_highlight_max);
}

void HighlightRecoveryOp::Apply(std::shared_ptr<ImageBuffer> input) {
  cv::Mat&    img         = input->GetCPUData();

  const float compression = static_cast<float>(_amount) * kMaxCompression;
  img.forEach<cv::Vec3f>([&](cv::Vec3f& pixel, const int*) {
    const float luminance = Luma(pixel);
    if (luminance <= kKneeThreshold) {
      return;
    }
    const float pull = compression * (luminance - kKneeThreshold);
    pixel[0]         = Clamp01(pixel[0] - pull);
    pixel[1]         = Clamp01(pixel[1] - pull);
    pixel[2]         = Clamp01(pixel[2] - pull);
  });
}

auto HighlightRecoveryOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  o[_script_name] = _amount;

  return o;
}

void HighlightRecoveryOp::SetParams(const nlohmann::json& params) {
  if (params.contains(_script_name)) {
    _amount = params[_script_name].get<double>();
  } else {
    _amount = 0.0;
  }
}

auto HighlightRecoveryOp::IsNoOp() const -> bool { return _amount <= kStageSkipEpsilon; }
};  // namespace photolift
