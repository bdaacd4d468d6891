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

#include "edit/operators/basic/contrast_op.hpp"

#include <cmath>
#include <opencv2/core.hpp>

#include "edit/operators/utils/functions.hpp"

namespace photolift {
ContrastOp::ContrastOp(double scale) : _scale(scale) {}

ContrastOp::ContrastOp(const nlohmann::json& params) { SetParams(params); }

void ContrastOp::Apply(std::shared_ptr<ImageBuffer> input) {
  cv::Mat& img = input->GetCPUData();
  // (x - 0.5) * scale + 0.5
  img.convertTo(img, -1, _scale, 0.5 * (1.0 - _scale));
  ClampToUnit(img);
}

auto ContrastOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  o[_script_name] = _scale;

  return o;
}

void ContrastOp::SetParams(const nlohmann::json& params) {
  if (params.contains(_script_name)) {
    _scale = params[_script_name].get<double>();
  } else {
    _scale = 1.0;
  }
}

auto ContrastOp::IsNoOp() const -> bool { return std::abs(_scale - 1.0) <= kStageSkipEpsilon; }
};  // namespace photolift
