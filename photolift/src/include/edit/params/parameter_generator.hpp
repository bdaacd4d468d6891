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

#include "analysis/image_metrics.hpp"
#include "edit/params/adjustment_params.hpp"

namespace photolift {
/**
 * @brief Maps image metrics and style preferences to a bounded adjustment vector
 */
class ParameterGenerator {
 private:
  StylePreferences _style;

  auto             ExposureAdjustment(const ImageMetrics& metrics) const -> double;
  auto             ContrastAdjustment(const ImageMetrics& metrics) const -> double;
  auto             HighlightRecovery(const ImageMetrics& metrics) const -> double;
  auto             ShadowLift(const ImageMetrics& metrics) const -> double;
  auto             FaceRelightStrength(const ImageMetrics& metrics) const -> double;
  auto             SaturationAdjustment(const ImageMetrics& metrics) const -> double;
  auto             SharpnessAmount(const ImageMetrics& metrics) const -> double;
  auto             NoiseReduction(const ImageMetrics& metrics) const -> double;

 public:
  ParameterGenerator() = default;
  explicit ParameterGenerator(StylePreferences style);

  auto Generate(const ImageMetrics& metrics) const -> AdjustmentParameters;

  auto GetStyle() const -> const StylePreferences& { return _style; }
};
};  // namespace photolift
