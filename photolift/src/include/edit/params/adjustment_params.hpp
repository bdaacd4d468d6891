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

#include <nlohmann/json.hpp>

namespace photolift {
struct StylePreferences {
  bool natural_appearance  = true;
  bool preserve_highlights = true;
  bool stable_skin_tones   = true;
  bool avoid_filter_look   = true;

  auto ToJson() const -> nlohmann::json;
  void FromJson(const nlohmann::json& style_json);

  bool operator==(const StylePreferences& other) const = default;
};

/**
 * @brief Bounded adjustment vector consumed by the transform applier
 */
struct AdjustmentParameters {
  // EV, [-2, 2]
  double exposure_adjustment   = 0.0;
  // Multiplier, [0.5, 1.5]
  double contrast_adjustment   = 1.0;
  // [0, 1]
  double shadow_lift           = 0.0;
  double highlight_recovery    = 0.0;
  // Multiplier, [0.5, 1.5]
  double saturation_adjustment = 1.0;
  // [0, 2]
  double sharpness_amount      = 0.0;
  // [0, 1]
  double noise_reduction       = 0.0;
  bool   skin_tone_protection  = false;
  // [0, 0.6]
  double face_relight_strength = 0.0;

  /**
   * @brief Parameters under which every stage is skipped
   */
  static auto Neutral() -> AdjustmentParameters { return {}; }

  auto        ToJson() const -> nlohmann::json;
  void        FromJson(const nlohmann::json& params_json);

  bool        operator==(const AdjustmentParameters& other) const = default;
};
};  // namespace photolift
