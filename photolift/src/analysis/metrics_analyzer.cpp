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

#include "analysis/metrics_analyzer.hpp"

#include <easy/profiler.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <opencv2/imgproc.hpp>
#include <tuple>
#include <vector>

#include "edit/operators/utils/functions.hpp"

namespace photolift {
namespace {
constexpr double kExposureFloorEv = -2.0;
constexpr double kExposureCeilEv  = 2.0;

auto MeanOf(const cv::Mat& region) -> double {
  return region.empty() ? 0.0 : cv::mean(region)[0];
}

auto StdDevOf(const cv::Mat& region) -> double {
  cv::Scalar mean, stddev;
  cv::meanStdDev(region, mean, stddev);
  return stddev[0];
}

// Index of the first cumulative bin that reaches q
auto SearchSorted(const std::array<double, 256>& cumsum, double q) -> int {
  auto it = std::lower_bound(cumsum.begin(), cumsum.end(), q);
  return static_cast<int>(std::min<std::ptrdiff_t>(it - cumsum.begin(), 255));
}
}  // namespace

MetricsAnalyzer::MetricsAnalyzer(AnalyzerConfig config) : _config(std::move(config)) {}

auto MetricsAnalyzer::Analyze(const ImageBuffer&                    buffer,
                              const std::optional<CaptureMetadata>& metadata) const
    -> ImageMetrics {
  EASY_FUNCTION();
  const cv::Mat& rgb = buffer.GetCPUData();

  cv::Mat        gray;
  cv::Mat        hsv;
  cv::cvtColor(rgb, gray, cv::COLOR_RGB2GRAY);
  cv::cvtColor(rgb, hsv, cv::COLOR_RGB2HSV);

  ImageMetrics metrics;
  metrics.exposure_level = EstimateExposure(gray, metadata);
  metrics.contrast_level = EstimateContrast(gray);
  std::tie(metrics.shadow_clipping_percent, metrics.highlight_clipping_percent) =
      DetectClipping(gray);
  metrics.saturation_level = EstimateSaturation(hsv);
  metrics.sharpness_score  = EstimateSharpness(gray);
  metrics.noise_level      = EstimateNoise(gray, metadata);
  std::tie(metrics.skin_tone_detected, metrics.skin_tone_hue_range) = DetectSkinTones(hsv);
  metrics.is_backlit       = DetectBacklit(gray);
  metrics.is_low_light     = DetectLowLight(gray, metadata);
  metrics.capture_metadata = metadata;
  return metrics;
}

/**
 * @brief Middle-tone exposure: weighted mean of the histogram bins between the 25th and 75th
 * cumulative percentile, expressed in EV relative to 0.5.
 */
auto MetricsAnalyzer::EstimateExposure(const cv::Mat&                        gray,
                                       const std::optional<CaptureMetadata>& metadata) const
    -> double {
  EASY_BLOCK("Exposure Histogram");
  cv::Mat      hist;
  const int    hist_size  = 256;
  const float  range[]    = {0.0f, 256.0f};
  const float* ranges[]   = {range};
  const int    channels[] = {0};
  cv::calcHist(&gray, 1, channels, cv::Mat(), hist, 1, &hist_size, ranges);

  const double            total   = static_cast<double>(gray.total());
  std::array<double, 256> normalized{};
  std::array<double, 256> cumsum{};
  double                  running = 0.0;
  for (int i = 0; i < hist_size; ++i) {
    normalized[i] = static_cast<double>(hist.at<float>(i)) / total;
    running += normalized[i];
    cumsum[i] = running;
  }

  const int lower_idx    = SearchSorted(cumsum, 0.25);
  const int upper_idx    = SearchSorted(cumsum, 0.75);

  double    weight_sum   = 0.0;
  double    weighted_sum = 0.0;
  for (int i = lower_idx; i <= upper_idx; ++i) {
    weight_sum += normalized[i];
    weighted_sum += normalized[i] * static_cast<double>(i);
  }
  EASY_END_BLOCK;

  const double mean_luminance =
      weight_sum > 0.0 ? (weighted_sum / weight_sum) / 255.0 : MeanOf(gray) / 255.0;

  double exposure_ev =
      mean_luminance > 0.0 ? std::log2(mean_luminance / 0.5) : kExposureFloorEv;
  if (metadata && metadata->exposure_compensation) {
    exposure_ev += *metadata->exposure_compensation;
  }
  return Clamp(exposure_ev, kExposureFloorEv, kExposureCeilEv);
}

auto MetricsAnalyzer::EstimateContrast(const cv::Mat& gray) const -> double {
  return Clamp(StdDevOf(gray) / _config.contrast_normalizer, 0.0, 1.0);
}

auto MetricsAnalyzer::DetectClipping(const cv::Mat& gray) const -> std::pair<double, double> {
  const double total           = static_cast<double>(gray.total());
  const int    shadow_count    = cv::countNonZero(gray <= _config.shadow_clip_level);
  const int    highlight_count = cv::countNonZero(gray >= _config.highlight_clip_level);
  return {shadow_count / total * 100.0, highlight_count / total * 100.0};
}

auto MetricsAnalyzer::EstimateSaturation(const cv::Mat& hsv) const -> double {
  const double mean_saturation = cv::mean(hsv)[1] / 255.0;
  return Clamp(mean_saturation * 2.0, 0.0, 2.0);
}

auto MetricsAnalyzer::EstimateSharpness(const cv::Mat& gray) const -> double {
  cv::Mat laplacian;
  cv::Laplacian(gray, laplacian, CV_64F);
  const double stddev = StdDevOf(laplacian);
  return Clamp(stddev * stddev / _config.sharpness_normalizer, 0.0, 1.0);
}

auto MetricsAnalyzer::EstimateNoise(const cv::Mat&                        gray,
                                    const std::optional<CaptureMetadata>& metadata) const
    -> double {
  cv::Mat gray_f;
  cv::Mat blurred;
  gray.convertTo(gray_f, CV_32F);
  cv::GaussianBlur(gray_f, blurred, cv::Size(5, 5), 0);
  cv::Mat      high_freq  = gray_f - blurred;

  const double measured   = StdDevOf(high_freq) / _config.noise_normalizer;
  double       noise      = measured;
  if (metadata && metadata->iso) {
    const double iso_factor = std::min(*metadata->iso / _config.iso_noise_reference, 1.0);
    noise                   = 0.6 * measured + 0.4 * iso_factor;
  }
  return Clamp(noise, 0.0, 1.0);
}

auto MetricsAnalyzer::DetectSkinTones(const cv::Mat& hsv) const
    -> std::pair<bool, std::optional<std::pair<double, double>>> {
  cv::Mat skin_mask;
  cv::inRange(hsv,
              cv::Scalar(_config.skin_hue_min, _config.skin_saturation_min, _config.skin_value_min),
              cv::Scalar(_config.skin_hue_max, _config.skin_saturation_max, 255), skin_mask);

  const int    skin_pixels  = cv::countNonZero(skin_mask);
  const double skin_percent = static_cast<double>(skin_pixels) / hsv.total() * 100.0;
  if (skin_percent <= _config.skin_min_percent || skin_pixels == 0) {
    return {false, std::nullopt};
  }

  std::vector<cv::Mat> planes;
  cv::split(hsv, planes);
  double min_hue = 0.0;
  double max_hue = 0.0;
  cv::minMaxLoc(planes[0], &min_hue, &max_hue, nullptr, nullptr, skin_mask);

  // OpenCV stores hue as degrees / 2 on a 0..179 scale
  return {true, std::make_pair(min_hue * 360.0 / 179.0, max_hue * 360.0 / 179.0)};
}

auto MetricsAnalyzer::DetectBacklit(const cv::Mat& gray) const -> bool {
  const int height = gray.rows;
  const int width  = gray.cols;

  cv::Range center_rows(static_cast<int>(height * 0.3), static_cast<int>(height * 0.7));
  cv::Range center_cols(static_cast<int>(width * 0.3), static_cast<int>(width * 0.7));
  const int edge     = static_cast<int>(std::min(height, width) * 0.2);
  if (center_rows.empty() || center_cols.empty() || edge <= 0) {
    return false;
  }

  const double center_brightness = MeanOf(gray(center_rows, center_cols));
  const double edge_brightness =
      (MeanOf(gray.rowRange(0, edge)) + MeanOf(gray.rowRange(height - edge, height)) +
       MeanOf(gray.colRange(0, edge)) + MeanOf(gray.colRange(width - edge, width))) /
      4.0;

  if (edge_brightness <= 0.0) {
    return false;
  }
  return edge_brightness / (center_brightness + 1e-6) > _config.backlit_ratio;
}

auto MetricsAnalyzer::DetectLowLight(const cv::Mat&                        gray,
                                     const std::optional<CaptureMetadata>& metadata) const
    -> bool {
  const double mean_luminance = MeanOf(gray) / 255.0;
  if (mean_luminance < _config.very_dark_mean) {
    return true;
  }

  bool high_iso     = false;
  bool slow_shutter = false;
  if (metadata) {
    high_iso     = metadata->iso && *metadata->iso > _config.high_iso;
    slow_shutter = metadata->exposure_time && *metadata->exposure_time > _config.slow_shutter_seconds;
  }
  return mean_luminance < _config.low_light_mean && (high_iso || slow_shutter);
}
};  // namespace photolift
