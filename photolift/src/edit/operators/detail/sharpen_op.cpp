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

#include "edit/operators/detail/sharpen_op.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "edit/operators/utils/functions.hpp"

namespace photolift {
SharpenOp::SharpenOp(double amount) : _amount(amount) {}

SharpenOp::SharpenOp(const nlohmann::json& params) { SetParams(params); }

void SharpenOp::Apply(std::shared_ptr<ImageBuffer> input) {
  cv::Mat& img  = input->GetCPUData();
  cv::Mat  rgb8 = ToPixelBuffer(img);

  // Use USM to sharpen the image: original * (1 + a) - blurred * a, saturated to 8 bits
  cv::Mat  blurred;
  cv::GaussianBlur(rgb8, blurred, cv::Size(kKernelSize, kKernelSize), 0);

  cv::Mat sharpened;
  cv::addWeighted(rgb8, 1.0 + _amount, blurred, -_amount, 0.0, sharpened);
  img = ToWorkingFloat(sharpened);
}

auto SharpenOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  o[_script_name] = _amount;

  return o;
}

void SharpenOp::SetParams(const nlohmann::json& params) {
  if (params.contains(_script_name)) {
    _amount = params[_script_name].get<double>();
  } else {
    _amount = 0.0;
  }
}

auto SharpenOp::IsNoOp() const -> bool { return _amount <= kStageSkipEpsilon; }
};  // namespace photolift
