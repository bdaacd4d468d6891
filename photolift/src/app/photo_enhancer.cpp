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

#include "app/photo_enhancer.hpp"

#include <easy/profiler.h>

#include <stdexcept>
#include <utility>

namespace photolift {
PhotoEnhancer::PhotoEnhancer(EnhancerConfig config)
    : PhotoEnhancer(config, MakeFaceDetector(config.cascade_path_)) {}

PhotoEnhancer::PhotoEnhancer(EnhancerConfig config, std::unique_ptr<IFaceDetector> detector)
    : _config(std::move(config)),
      _analyzer(_config.analyzer_),
      _generator(_config.style_),
      _locator(_config.locator_, std::move(detector)),
      _applier(_config.applier_) {}

auto PhotoEnhancer::Enhance(const ImageBuffer& buffer,
                            const std::optional<CaptureMetadata>&  metadata,
                            const std::vector<NormalizedFaceArea>& embedded_areas)
    -> EnhanceResult {
  EASY_FUNCTION();
  if (!buffer.IsValidPixelBuffer()) {
    throw std::invalid_argument("PhotoEnhancer: expected a non-empty 8-bit RGB buffer");
  }

  EnhanceResult result;
  result.metrics_                = _analyzer.Analyze(buffer, metadata);
  AdjustmentParameters requested = _generator.Generate(result.metrics_);
  result.face_regions_           = _locator.Locate(buffer, embedded_areas);

  ApplyResult applied            = _applier.Apply(buffer, requested, result.face_regions_);
  result.enhanced_       = std::move(applied.enhanced_);
  result.params_         = applied.effective_params_;
  result.applied_stages_ = std::move(applied.applied_stages_);
  return result;
}
};  // namespace photolift
