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

#pragma once

#include <opencv2/core.hpp>
#include <string_view>

#include "edit/operators/op_base.hpp"
#include "type/type.hpp"

namespace photolift {
class ShadowLiftOp : public OperatorBase<ShadowLiftOp> {
 private:
  double                 _amount       = 0.0;

  // Luminance below which pixels receive lift
  static constexpr float kShadowPivot  = 0.55f;
  // Higher exponent keeps the midtones out of the lift
  static constexpr float kMaskExponent = 1.8f;

 public:
  static constexpr std::string_view _script_name   = "shadow_lift";
  static constexpr OperatorType     _operator_type = OperatorType::SHADOWS;

  ShadowLiftOp()                                    = default;
  explicit ShadowLiftOp(double amount);
  explicit ShadowLiftOp(const nlohmann::json& params);

  /**
   * @brief Soft shadow mask clip((0.55 - L) / 0.55, 0, 1)^1.8 of a float RGB image
   *
   * @param src CV_32FC3 in [0, 1]
   * @param mask CV_32FC1 output
   */
  static void GetMask(const cv::Mat& src, cv::Mat& mask);

  void        Apply(std::shared_ptr<ImageBuffer> input) override;
  auto        GetParams() const -> nlohmann::json override;
  void        SetParams(const nlohmann::json& params) override;
  auto        IsNoOp() const -> bool override;
};
};  // namespace photolift
