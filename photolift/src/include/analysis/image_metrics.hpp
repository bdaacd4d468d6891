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
#include <optional>
#include <utility>

#include "image/capture_metadata.hpp"

namespace photolift {
/**
 * @brief Photometric measurements of one image, produced once by MetricsAnalyzer
 */
struct ImageMetrics {
  // EV, [-2, 2]
  double                                  exposure_level             = 0.0;
  // [0, 1]
  double                                  contrast_level             = 0.0;
  // [0, 100]
  double                                  shadow_clipping_percent    = 0.0;
  double                                  highlight_clipping_percent = 0.0;
  // [0, 2], 1.0 is normal
  double                                  saturation_level           = 0.0;
  // [0, 1]
  double                                  sharpness_score            = 0.0;
  double                                  noise_level                = 0.0;

  bool                                    skin_tone_detected         = false;
  // Degrees, min <= max
  std::optional<std::pair<double, double>> skin_tone_hue_range;

  bool                                    is_backlit                 = false;
  bool                                    is_low_light               = false;

  std::optional<CaptureMetadata>          capture_metadata;

  auto FlashFired() const -> bool {
    return capture_metadata && capture_metadata->flash_fired.value_or(false);
  }

  auto ToJson() const -> nlohmann::json;
  void FromJson(const nlohmann::json& metrics_json);

  bool operator==(const ImageMetrics& other) const = default;
};
};  // namespace photolift
