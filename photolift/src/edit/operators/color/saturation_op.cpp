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

#include "edit/operators/color/saturation_op.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "edit/operators/utils/functions.hpp"

namespace photolift {
SaturationOp::SaturationOp(double scale, bool protect_skin_tones)
    : _scale(scale), _protect_skin_tones(protect_skin_tones) {}

SaturationOp::SaturationOp(const nlohmann::json& params) { SetParams(params); }

void SaturationOp::Apply(std::shared_ptr<ImageBuffer> input) {
  cv::Mat& img = input->GetCPUData();

  // HSV is taken on the 8-bit image so hue and saturation use OpenCV's integer scales
  cv::Mat  hsv;
  cv::cvtColor(ToPixelBuffer(img), hsv, cv::COLOR_RGB2HSV);

  const float scale      = static_cast<float>(_scale);
  const float skin_scale = 1.0f + (scale - 1.0f) * 0.5f;
  hsv.forEach<cv::Vec3b>([&](cv::Vec3b& pixel, const int*) {
    const bool  skin       = _protect_skin_tones && pixel[0] <= kSkinHueMax;
    const float saturation = pixel[1] * (skin ? skin_scale : scale);
    pixel[1]               = static_cast<uchar>(std::clamp(saturation, 0.0f, 255.0f));
  });

  cv::Mat rgb8;
  cv::cvtColor(hsv, rgb8, cv::COLOR_HSV2RGB);
  img = ToWorkingFloat(rgb8);
}

auto SaturationOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  nlohmann::json inner;

  inner["scale"]              = _scale;
  inner["protect_skin_tones"] = _protect_skin_tones;

  o[_script_name]             = inner;
  return o;
}

void SaturationOp::SetParams(const nlohmann::json& params) {
  _scale              = 1.0;
  _protect_skin_tones = false;
  if (!params.contains(_script_name)) {
    return;
  }
  const nlohmann::json& inner = params[_script_name];
  if (inner.contains("scale")) {
    _scale = inner["scale"].get<double>();
  }
  if (inner.contains("protect_skin_tones")) {
    _protect_skin_tones = inner["protect_skin_tones"].get<bool>();
  }
}

auto SaturationOp::IsNoOp() const -> bool { return std::abs(_scale - 1.0) <= kStageSkipEpsilon; }
};  // namespace photolift
