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

#include "edit/operators/detail/noise_reduction_op.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "edit/operators/utils/functions.hpp"

namespace photolift {
NoiseReductionOp::NoiseReductionOp(double amount) : _amount(amount) {}

NoiseReductionOp::NoiseReductionOp(const nlohmann::json& params) { SetParams(params); }

// 5 to 15 pixels
auto NoiseReductionOp::Diameter() const -> int { return static_cast<int>(5.0 + _amount * 10.0); }

// 25 to 75
auto NoiseReductionOp::SigmaColor() const -> double { return 25.0 + _amount * 50.0; }

void NoiseReductionOp::Apply(std::shared_ptr<ImageBuffer> input) {
  cv::Mat&  img      = input->GetCPUData();

  const int diameter = Diameter();
  cv::Mat   denoised;
  cv::bilateralFilter(ToPixelBuffer(img), denoised, diameter, SigmaColor(),
                      static_cast<double>(diameter));
  img = ToWorkingFloat(denoised);
}

auto NoiseReductionOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  o[_script_name] = _amount;

  return o;
}

void NoiseReductionOp::SetParams(const nlohmann::json& params) {
  if (params.contains(_script_name)) {
    _amount = params[_script_name].get<double>();
  } else {
    _amount = 0.0;
  }
}

auto NoiseReductionOp::IsNoOp() const -> bool { return _amount <= kStageSkipEpsilon; }
};  // namespace photolift
