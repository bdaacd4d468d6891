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

#include "analysis/image_metrics.hpp"

namespace photolift {
auto ImageMetrics::ToJson() const -> nlohmann::json {
  nlohmann::json metrics_json;
  metrics_json["exposure_level"]             = exposure_level;
  metrics_json["contrast_level"]             = contrast_level;
  metrics_json["shadow_clipping_percent"]    = shadow_clipping_percent;
  metrics_json["highlight_clipping_percent"] = highlight_clipping_percent;
  metrics_json["saturation_level"]           = saturation_level;
  metrics_json["sharpness_score"]            = sharpness_score;
  metrics_json["noise_level"]                = noise_level;
  metrics_json["skin_tone_detected"]         = skin_tone_detected;
  if (skin_tone_hue_range) {
    metrics_json["skin_tone_hue_range"] = {skin_tone_hue_range->first, skin_tone_hue_range->second};
  } else {
    metrics_json["skin_tone_hue_range"] = nullptr;
  }
  metrics_json["is_backlit"]   = is_backlit;
  metrics_json["is_low_light"] = is_low_light;
  if (capture_metadata) {
    metrics_json["capture_metadata"] = capture_metadata->ToJson();
  }
  return metrics_json;
}

void ImageMetrics::FromJson(const nlohmann::json& metrics_json) {
  exposure_level             = metrics_json.value("exposure_level", 0.0);
  contrast_level             = metrics_json.value("contrast_level", 0.0);
  shadow_clipping_percent    = metrics_json.value("shadow_clipping_percent", 0.0);
  highlight_clipping_percent = metrics_json.value("highlight_clipping_percent", 0.0);
  saturation_level           = metrics_json.value("saturation_level", 0.0);
  sharpness_score            = metrics_json.value("sharpness_score", 0.0);
  noise_level                = metrics_json.value("noise_level", 0.0);
  skin_tone_detected         = metrics_json.value("skin_tone_detected", false);
  is_backlit                 = metrics_json.value("is_backlit", false);
  is_low_light               = metrics_json.value("is_low_light", false);

  skin_tone_hue_range.reset();
  if (auto it = metrics_json.find("skin_tone_hue_range");
      it != metrics_json.end() && it->is_array() && it->size() == 2) {
    skin_tone_hue_range = std::make_pair((*it)[0].get<double>(), (*it)[1].get<double>());
  }

  capture_metadata.reset();
  if (auto it = metrics_json.find("capture_metadata");
      it != metrics_json.end() && it->is_object()) {
    CaptureMetadata metadata;
    metadata.FromJson(*it);
    capture_metadata = std::move(metadata);
  }
}
};  // namespace photolift
