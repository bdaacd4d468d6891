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

#include "edit/operators/basic/shadow_op.hpp"

#include <cmath>

#include "edit/operators/utils/functions.hpp"

namespace photolift {
ShadowLiftOp::ShadowLiftOp(double amount) : _amount(amount) {}

ShadowLiftOp::ShadowLiftOp(const nlohmann::json& params) { SetParams(params); }

void ShadowLiftOp::GetMask(const cv::Mat& src, cv::Mat& mask) {
  mask.create(src.size(), CV_32FC1);
  src.forEach<cv::Vec3f>([&](const cv::Vec3f& pixel, const int* pos) {
    const float m                  = Clamp01((kShadowPivot - Luma(pixel)) / kShadowPivot);
    mask.at<float>(pos[0], pos[1]) = std::pow(m, kMaskExponent);
  });
}

void ShadowLiftOp::Apply(std::shared_ptr<ImageBuffer> input) {
  cv::Mat& img = input->GetCPUData();

  cv::Mat  mask;
  GetMask(img, mask);

  const float amount = static_cast<float>(_amount);
  img.forEach<cv::Vec3f>([&](cv::Vec3f& pixel, const int* pos) {
    const float gain = 1.0f + amount * mask.at<float>(pos[0], pos[1]);
    pixel[0]         = Clamp01(pixel[0] * gain);
    pixel[1]         = Clamp01(pixel[1] * gain);
    pixel[2]         = Clamp01(pixel[2] * gain);
  });
}

auto ShadowLiftOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  o[_script_name] = _amount;

  return o;
}

void ShadowLiftOp::SetParams(const nlohmann::json& params) {
  if (params.contains(_script_name)) {
    _amount = params[_script_name].get<double>();
  } else {
    _amount = 0.0;
  }
}

auto ShadowLiftOp::IsNoOp() const -> bool { return _amount <= kStageSkipEpsilon; }
};  // namespace photolift
