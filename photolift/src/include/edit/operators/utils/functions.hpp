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

#include <algorithm>
#include <opencv2/core.hpp>

namespace photolift {
// Rec.601 weights, in R, G, B order
constexpr float kLumaR = 0.299f;
constexpr float kLumaG = 0.587f;
constexpr float kLumaB = 0.114f;

inline auto Clamp(double x, double lo, double hi) -> double { return std::clamp(x, lo, hi); }

inline auto Clamp01(float x) -> float { return std::clamp(x, 0.0f, 1.0f); }

inline auto Luma(const cv::Vec3f& rgb) -> float {
  return kLumaR * rgb[0] + kLumaG * rgb[1] + kLumaB * rgb[2];
}

/**
 * @brief Luminance plane (CV_32FC1) of a CV_32FC3 RGB working image
 */
auto ComputeLuminance(const cv::Mat& rgb32f) -> cv::Mat;

/**
 * @brief CV_8UC3 -> CV_32FC3 in [0, 1]
 */
auto ToWorkingFloat(const cv::Mat& rgb8) -> cv::Mat;

/**
 * @brief CV_32FC3 -> CV_8UC3, clamped to [0, 255] and truncated toward zero
 */
auto ToPixelBuffer(const cv::Mat& rgb32f) -> cv::Mat;

/**
 * @brief Clamp every sample of a float image to [0, 1] in place
 */
void ClampToUnit(cv::Mat& img);

/**
 * @brief Percentage of pixels whose luminance is at or above 250/255
 */
auto HighlightClippingPercent(const cv::Mat& rgb32f) -> double;
};  // namespace photolift
