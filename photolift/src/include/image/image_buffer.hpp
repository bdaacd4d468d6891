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

#include <cstdint>
#include <opencv2/core.hpp>
#include <vector>

#include "type/type.hpp"

namespace photolift {
/**
 * @brief Pixel container shared by the analysis and transform stages.
 *
 * Holds either an 8-bit RGB buffer (CV_8UC3) or the float working copy (CV_32FC3, [0,1]),
 * together with the color profile blob that travels from decode to encode untouched.
 */
class ImageBuffer {
 private:
  cv::Mat         _cpu_data;
  color_profile_t _color_profile;

 public:
  bool _cpu_data_valid = false;

  ImageBuffer()        = default;
  ImageBuffer(const cv::Mat& data);
  ImageBuffer(cv::Mat&& data);
  ImageBuffer(const ImageBuffer& other);
  ImageBuffer(ImageBuffer&& other) noexcept;

  ImageBuffer& operator=(const ImageBuffer& other);
  ImageBuffer& operator=(ImageBuffer&& other) noexcept;

  auto         GetCPUData() -> cv::Mat&;
  auto         GetCPUData() const -> const cv::Mat&;

  auto         Width() const -> int;
  auto         Height() const -> int;

  /**
   * @brief True for a non-empty 8-bit, 3-channel buffer
   */
  auto         IsValidPixelBuffer() const -> bool;

  void         SetColorProfile(color_profile_t profile);
  auto         GetColorProfile() const -> const color_profile_t&;
  auto         HasColorProfile() const -> bool;

  ImageBuffer  Clone() const;

  void         ReleaseCPUData();
};
};  // namespace photolift
