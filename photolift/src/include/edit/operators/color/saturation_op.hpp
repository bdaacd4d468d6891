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

#include <string_view>

#include "edit/operators/op_base.hpp"
#include "type/type.hpp"

namespace photolift {
class SaturationOp : public OperatorBase<SaturationOp> {
 private:
  /**
   * @brief Multiplier on the HSV saturation channel, 1.0 for identity
   *
   */
  double                 _scale              = 1.0;
  /**
   * @brief Halve the change for skin hues
   *
   */
  bool                   _protect_skin_tones = false;

  // Upper bound of the skin hue band on OpenCV's 0-179 scale
  static constexpr float kSkinHueMax         = 25.0f;

 public:
  static constexpr std::string_view _script_name   = "saturation";
  static constexpr OperatorType     _operator_type = OperatorType::SATURATION;

  SaturationOp()                                    = default;
  SaturationOp(double scale, bool protect_skin_tones);
  explicit SaturationOp(const nlohmann::json& params);

  void Apply(std::shared_ptr<ImageBuffer> input) override;
  auto GetParams() const -> nlohmann::json override;
  void SetParams(const nlohmann::json& params) override;
  auto IsNoOp() const -> bool override;
};
};  // namespace photolift
