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

#include "edit/params/parameter_generator.hpp"

#include <algorithm>

#include "edit/operators/utils/functions.hpp"

namespace photolift {
namespace {
constexpr double kTargetContrast   = 0.65;
constexpr double kTargetSaturation = 1.0;
constexpr double kTargetSharpness  = 0.65;

// Piecewise ISO contribution to noise reduction, [0, 0.9]
auto IsoNoiseFactor(int iso) -> double {
  if (iso < 400) {
    return 0.0;
  }
  if (iso < 800) {
    return (iso - 400) / 400.0 * 0.3;
  }
  if (iso < 1600) {
    return 0.3 + (iso - 800) / 800.0 * 0.2;
  }
  return 0.5 + std::min((iso - 1600) / 1600.0 * 0.4, 0.4);
}
}  // namespace

ParameterGenerator::ParameterGenerator(StylePreferences style) : _style(style) {}

auto ParameterGenerator::Generate(const ImageMetrics& metrics) const -> AdjustmentParameters {
  AdjustmentParameters params;
  params.exposure_adjustment   = ExposureAdjustment(metrics);
  params.contrast_adjustment   = ContrastAdjustment(metrics);
  params.highlight_recovery    = HighlightRecovery(metrics);
  params.shadow_lift           = ShadowLift(metrics);
  params.face_relight_strength = FaceRelightStrength(metrics);
  params.saturation_adjustment = SaturationAdjustment(metrics);
  params.sharpness_amount      = SharpnessAmount(metrics);
  params.noise_reduction       = NoiseReduction(metrics);
  params.skin_tone_protection  = metrics.skin_tone_detected && _style.stable_skin_tones;
  return params;
}

auto ParameterGenerator::ExposureAdjustment(const ImageMetrics& metrics) const -> double {
  // Correct half of the way for a natural look, 80% otherwise
  const double correction = _style.natural_appearance ? 0.5 : 0.8;
  return Clamp(-metrics.exposure_level * correction, -2.0, 2.0);
}

auto ParameterGenerator::ContrastAdjustment(const ImageMetrics& metrics) const -> double {
  const double raise_rate = _style.natural_appearance ? 0.3 : 0.5;
  const double lower_rate = _style.natural_appearance ? 0.2 : 0.4;

  double       adjustment = 1.0;
  if (metrics.contrast_level < kTargetContrast) {
    adjustment = 1.0 + (kTargetContrast - metrics.contrast_level) * raise_rate;
  } else {
    adjustment = 1.0 - (metrics.contrast_level - kTargetContrast) * lower_rate;
  }
  return Clamp(adjustment, 0.5, 1.5);
}

auto ParameterGenerator::HighlightRecovery(const ImageMetrics& metrics) const -> double {
  const double clipping = metrics.highlight_clipping_percent;
  if (!_style.preserve_highlights) {
    return clipping > 10.0 ? 0.3 : 0.0;
  }

  double recovery = 0.0;
  if (clipping > 10.0) {
    recovery = 0.8 + (clipping - 10.0) / 100.0;
  } else if (clipping > 5.0) {
    recovery = 0.5 + (clipping - 5.0) / 20.0;
  } else if (clipping > 1.0) {
    recovery = 0.2 + (clipping - 1.0) / 20.0;
  }

  // Shadow lift on a backlit scene tends to push the background into clipping
  if (metrics.is_backlit && metrics.exposure_level > -0.2) {
    recovery = std::max(recovery, 0.12);
  }
  return Clamp(recovery, 0.0, 1.0);
}

auto ParameterGenerator::ShadowLift(const ImageMetrics& metrics) const -> double {
  const double shadow_clipping = metrics.shadow_clipping_percent;

  double       lift            = 0.0;
  if (shadow_clipping > 12.0) {
    lift = 0.4;
  } else if (shadow_clipping > 6.0) {
    lift = 0.2;
  } else if (shadow_clipping > 2.0) {
    lift = 0.1;
  }

  if (metrics.is_backlit) {
    double backlit_lift = 0.18;
    if (metrics.exposure_level < -0.35) backlit_lift += 0.08;
    if (shadow_clipping > 10.0) backlit_lift += 0.08;
    if (metrics.exposure_level > 0.2) backlit_lift -= 0.06;
    if (metrics.highlight_clipping_percent > 1.0) backlit_lift -= 0.05;
    lift = std::max(lift, Clamp(backlit_lift, 0.08, 0.32));
  }

  // Flash already opened up the shadows. Face relight strength is left untouched here.
  if (metrics.FlashFired()) {
    lift *= 0.5;
  }
  if (_style.natural_appearance) {
    lift *= 0.85;
  }
  return Clamp(lift, 0.0, 1.0);
}

auto ParameterGenerator::FaceRelightStrength(const ImageMetrics& metrics) const -> double {
  if (!metrics.is_backlit) {
    return 0.0;
  }

  double strength = 0.18;
  if (metrics.exposure_level < -0.6) {
    strength += 0.12;
  } else if (metrics.exposure_level < -0.2) {
    strength += 0.06;
  }

  if (metrics.shadow_clipping_percent > 10.0) {
    strength += 0.12;
  } else if (metrics.shadow_clipping_percent > 4.0) {
    strength += 0.06;
  }

  if (metrics.skin_tone_detected) {
    strength += 0.04;
  }

  if (metrics.highlight_clipping_percent > 6.0) {
    strength -= 0.08;
  } else if (metrics.highlight_clipping_percent > 2.0) {
    strength -= 0.04;
  }

  if (_style.natural_appearance) {
    strength *= 0.85;
  }
  return Clamp(strength, 0.0, 0.6);
}

auto ParameterGenerator::SaturationAdjustment(const ImageMetrics& metrics) const -> double {
  double rate = 0.3;
  if (metrics.skin_tone_detected && _style.stable_skin_tones) {
    rate = 0.1;
  } else if (_style.avoid_filter_look) {
    rate = 0.2;
  }

  double adjustment = 1.0;
  if (metrics.saturation_level < kTargetSaturation) {
    adjustment = 1.0 + (kTargetSaturation - metrics.saturation_level) * rate;
  } else {
    adjustment = 1.0 - (metrics.saturation_level - kTargetSaturation) * rate;
  }
  return Clamp(adjustment, 0.5, 1.5);
}

auto ParameterGenerator::SharpnessAmount(const ImageMetrics& metrics) const -> double {
  double amount = 0.0;
  if (metrics.sharpness_score < kTargetSharpness) {
    amount = (kTargetSharpness - metrics.sharpness_score) * 2.0;
  }
  // Do not amplify what noise reduction is about to smooth
  if (metrics.noise_level > 0.5) {
    amount *= 0.5;
  }
  if (_style.natural_appearance) {
    amount *= 0.7;
  }
  return Clamp(amount, 0.0, 2.0);
}

auto ParameterGenerator::NoiseReduction(const ImageMetrics& metrics) const -> double {
  double reduction = metrics.noise_level;
  if (metrics.capture_metadata && metrics.capture_metadata->iso) {
    reduction = 0.6 * metrics.noise_level + 0.4 * IsoNoiseFactor(*metrics.capture_metadata->iso);
  }
  if (metrics.is_low_light) {
    reduction = std::min(reduction * 1.2, 1.0);
  }
  return Clamp(reduction, 0.0, 1.0);
}
};  // namespace photolift
