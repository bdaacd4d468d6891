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

#include "edit/operators/basic/exposure_op.hpp"

#include <cmath>
#include <opencv2/core.hpp>

#include "edit/operators/utils/functions.hpp"

namespace photolift {
/**
 * @brief Construct a new Exposure Op:: Exposure Op object
 *
 * @param exposure_offset
 */
ExposureOp::ExposureOp(double exposure_offset) : _exposure_offset(exposure_offset) {
  ComputeScale();
}

ExposureOp::ExposureOp(const nlohmann::json& params) { SetParams(params); }

void ExposureOp::ComputeScale() { _scale = std::pow(2.0, _exposure_offset); }

void ExposureOp::Apply(std::shared_ptr<ImageBuffer> input) {
  cv::Mat& img = input->GetCPUData();
  img *= _scale;
  ClampToUnit(img);
}

auto ExposureOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  o[GetScriptName()] = _exposure_offset;

  return o;
}

void ExposureOp::SetParams(const nlohmann::json& params) {
  if (params.contains(_script_name)) {
    _exposure_offset = params[_script_name].get<double>();
  } else {
    _exposure_offset = 0.0;
  }
  ComputeScale();
}

auto ExposureOp::IsNoOp() const -> bool { return std::abs(_exposure_offset) <= kStageSkipEpsilon; }
};  // namespace photolift
