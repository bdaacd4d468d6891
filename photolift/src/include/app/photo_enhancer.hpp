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

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

#include "analysis/image_metrics.hpp"
#include "analysis/metrics_analyzer.hpp"
#include "config/enhancer_config.hpp"
#include "edit/params/adjustment_params.hpp"
#include "edit/params/parameter_generator.hpp"
#include "edit/pipeline/transform_applier.hpp"
#include "face/face_detector.hpp"
#include "face/face_region.hpp"
#include "face/face_region_locator.hpp"
#include "image/capture_metadata.hpp"
#include "image/image_buffer.hpp"

namespace photolift {
struct EnhanceResult {
  ImageBuffer             enhanced_;
  ImageMetrics            metrics_;
  // As applied, see ApplyResult::effective_params_
  AdjustmentParameters    params_;
  std::vector<FaceRegion> face_regions_;
  nlohmann::json          applied_stages_ = nlohmann::json::array();
};

/**
 * @brief Analyze, generate, locate and apply for one image at a time.
 *
 * Holds a face detector, so an instance must not be shared between threads. Create one per
 * worker.
 */
class PhotoEnhancer {
 private:
  EnhancerConfig     _config;
  MetricsAnalyzer    _analyzer;
  ParameterGenerator _generator;
  FaceRegionLocator  _locator;
  TransformApplier   _applier;

 public:
  /**
   * @brief Build the pipeline with the Haar cascade named by the config (or the installed one)
   */
  explicit PhotoEnhancer(EnhancerConfig config);
  PhotoEnhancer(EnhancerConfig config, std::unique_ptr<IFaceDetector> detector);

  PhotoEnhancer(const PhotoEnhancer&)            = delete;
  PhotoEnhancer& operator=(const PhotoEnhancer&) = delete;

  /**
   * @brief Enhance a decoded image
   *
   * @param buffer CV_8UC3 RGB
   * @param metadata Capture settings, if the container had any
   * @param embedded_areas Face areas from the container's XMP, may be empty
   * @return EnhanceResult
   * @throws std::invalid_argument when the buffer is not an 8-bit, 3-channel image
   */
  auto Enhance(const ImageBuffer& buffer, const std::optional<CaptureMetadata>& metadata,
               const std::vector<NormalizedFaceArea>& embedded_areas) -> EnhanceResult;

  auto GetConfig() const -> const EnhancerConfig& { return _config; }
};
};  // namespace photolift
