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

#include "edit/params/adjustment_params.hpp"

namespace photolift {
auto StylePreferences::ToJson() const -> nlohmann::json {
  nlohmann::json style_json;
  style_json["natural_appearance"]  = natural_appearance;
  style_json["preserve_highlights"] = preserve_highlights;
  style_json["stable_skin_tones"]   = stable_skin_tones;
  style_json["avoid_filter_look"]   = avoid_filter_look;
  return style_json;
}

void StylePreferences::FromJson(const nlohmann::json& style_json) {
  natural_appearance  = style_json.value("natural_appearance", true);
  preserve_highlights = style_json.value("preserve_highlights", true);
  stable_skin_tones   = style_json.value("stable_skin_tones", true);
  avoid_filter_look   = style_json.value("avoid_filter_look", true);
}

auto AdjustmentParameters::ToJson() const -> nlohmann::json {
  nlohmann::json params_json;
  params_json["exposure_adjustment"]   = exposure_adjustment;
  params_json["contrast_adjustment"]   = contrast_adjustment;
  params_json["shadow_lift"]           = shadow_lift;
  params_json["highlight_recovery"]    = highlight_recovery;
  params_json["saturation_adjustment"] = saturation_adjustment;
  params_json["sharpness_amount"]      = sharpness_amount;
  params_json["noise_reduction"]       = noise_reduction;
  params_json["skin_tone_protection"]  = skin_tone_protection;
  params_json["face_relight_strength"] = face_relight_strength;
  return params_json;
}

void AdjustmentParameters::FromJson(const nlohmann::json& params_json) {
  exposure_adjustment   = params_json.value("exposure_adjustment", 0.0);
  contrast_adjustment   = params_json.value("contrast_adjustment", 1.0);
  shadow_lift           = params_json.value("shadow_lift", 0.0);
  highlight_recovery    = params_json.value("highlight_recovery", 0.0);
  saturation_adjustment = params_json.value("saturation_adjustment", 1.0);
  sharpness_amount      = params_json.value("sharpness_amount", 0.0);
  noise_reduction       = params_json.value("noise_reduction", 0.0);
  skin_tone_protection  = params_json.value("skin_tone_protection", false);
  face_relight_strength = params_json.value("face_relight_strength", 0.0);
}
};  // namespace photolift
