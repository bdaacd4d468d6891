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

#include <optional>
#include <utility>

#include <opencv2/core.hpp>

#include "analysis/image_metrics.hpp"
#include "config/enhancer_config.hpp"
#include "image/capture_metadata.hpp"
#include "image/image_buffer.hpp"

namespace photolift {
/**
 * @brief Measures exposure, contrast, clipping, color and noise of an 8-bit RGB buffer.
 *
 * Stateless apart from its configuration; safe to share between threads.
 */
class MetricsAnalyzer {
 private:
  AnalyzerConfig _config;

  auto EstimateExposure(const cv::Mat& gray, const std::optional<CaptureMetadata>& metadata) const
      -> double;
  auto EstimateContrast(const cv::Mat& gray) const -> double;
  auto DetectClipping(const cv::Mat& gray) const -> std::pair<double, double>;
  auto EstimateSaturation(const cv::Mat& hsv) const -> double;
  auto EstimateSharpness(const cv::Mat& gray) const -> double;
  auto EstimateNoise(const cv::Mat& gray, const std::optional<CaptureMetadata>& metadata) const
      -> double;
  auto DetectSkinTones(const cv::Mat& hsv) const
      -> std::pair<bool, std::optional<std::pair<double, double>>>;
  auto DetectBacklit(const cv::Mat& gray) const -> bool;
  auto DetectLowLight(const cv::Mat& gray, const std::optional<CaptureMetadata>& metadata) const
      -> bool;

 public:
  MetricsAnalyzer() = default;
  explicit MetricsAnalyzer(AnalyzerConfig config);

  /**
   * @brief Compute the metric vector of a valid pixel buffer
   *
   * @param buffer CV_8UC3, R,G,B order
   * @param metadata carried into the result unchanged
   * @return ImageMetrics
   */
  auto Analyze(const ImageBuffer& buffer, const std::optional<CaptureMetadata>& metadata) const
      -> ImageMetrics;
};
};  // namespace photolift
