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

#include "config/enhancer_config.hpp"
#include "edit/operators/op_base.hpp"
#include "edit/params/adjustment_params.hpp"
#include "type/type.hpp"

namespace photolift {
class HighlightRecoveryOp : public OperatorBase<HighlightRecoveryOp> {
 private:
  double                 _amount          = 0.0;

  // Soft knee; only pixels brighter than this are compressed
  static constexpr float kKneeThreshold   = 0.7f;
  // Strongest pull at amount 1.0
  static constexpr float kMaxCompression  = 0.3f;

 public:
  static constexpr std::string_view _script_name   = "highlight_recovery";
  static constexpr OperatorType     _operator_type = OperatorType::HIGHLIGHTS;

  HighlightRecoveryOp()                             = default;
  explicit HighlightRecoveryOp(double amount);
  explicit HighlightRecoveryOp(const nlohmann::json& params);

  /**
   * @brief Extra recovery needed after the brightening stages.
   *
   * Non-zero only when the parameters brighten the image (positive exposure, contrast above 1
   * or any shadow lift) and the share of pixels at luminance >= 250/255 in the current
   * working image exceeds the configured trigger.
   *
   * @param working CV_32FC3 image after the exposure, contrast and shadow stages
   * @param params The requested parameters
   * @param config
   * @return double in [0, config.auto_highlight_max]
   */
  static auto EstimateAutoRecovery(const cv::Mat& working, const AdjustmentParameters& params,
                                   const ApplierConfig& config) -> double;

  auto        GetAmount() const -> double { return _amount; }

  void        Apply(std::shared_ptr<ImageBuffer> input) override;
  auto        GetParams() const -> nlohmann::json override;
  void        SetParams(const nlohmann::json& params) override;
  auto        IsNoOp() const -> bool override;
};
};  // namespace photolift
