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

#include "edit/operators/utils/functions.hpp"

#include <algorithm>
#include <opencv2/imgproc.hpp>

namespace photolift {
auto ComputeLuminance(const cv::Mat& rgb32f) -> cv::Mat {
  cv::Mat luminance;
  cv::transform(rgb32f, luminance, cv::Matx13f(kLumaR, kLumaG, kLumaB));
  return luminance;
}

auto ToWorkingFloat(const cv::Mat& rgb8) -> cv::Mat {
  cv::Mat working;
  rgb8.convertTo(working, CV_32FC3, 1.0 / 255.0);
  return working;
}

auto ToPixelBuffer(const cv::Mat& rgb32f) -> cv::Mat {
  cv::Mat rgb8(rgb32f.size(), CV_8UC3);
  // convertTo would round, the fractional part is dropped instead
  rgb8.forEach<cv::Vec3b>([&](cv::Vec3b& out, const int* pos) {
    const cv::Vec3f& in = rgb32f.at<cv::Vec3f>(pos[0], pos[1]);
    for (int c = 0; c < 3; ++c) {
      out[c] = static_cast<uchar>(std::clamp(in[c] * 255.0f, 0.0f, 255.0f));
    }
  });
  return rgb8;
}

void ClampToUnit(cv::Mat& img) {
  cv::threshold(img, img, 1.0f, 1.0f, cv::THRESH_TRUNC);
  cv::threshold(img, img, 0.0f, 0.0f, cv::THRESH_TOZERO);
}

auto HighlightClippingPercent(const cv::Mat& rgb32f) -> double {
  if (rgb32f.empty()) {
    return 0.0;
  }
  cv::Mat   luminance = ComputeLuminance(rgb32f);
  const int clipped   = cv::countNonZero(luminance >= (250.0f / 255.0f));
  return static_cast<double>(clipped) / static_cast<double>(luminance.total()) * 100.0;
}
};  // namespace photolift
