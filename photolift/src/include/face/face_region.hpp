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

#include <nlohmann/json.hpp>
#include <opencv2/core/types.hpp>
#include <vector>

namespace photolift {
/**
 * @brief Pixel rectangle of a face, always inside the buffer and non-empty
 */
struct FaceRegion {
  int  x      = 0;
  int  y      = 0;
  int  width  = 0;
  int  height = 0;

  auto ToRect() const -> cv::Rect { return {x, y, width, height}; }
  auto ToJson() const -> nlohmann::json { return {x, y, width, height}; }

  bool operator==(const FaceRegion& other) const = default;
};

/**
 * @brief Face area as stored in embedded metadata: center and extent as fractions of the
 * image size
 */
struct NormalizedFaceArea {
  double center_x = 0.0;
  double center_y = 0.0;
  double width    = 0.0;
  double height   = 0.0;

  bool   operator==(const NormalizedFaceArea& other) const = default;
};

/**
 * @brief Convert a normalized area to a pixel rectangle clamped to the image bounds.
 * The result is at least one pixel wide and high.
 */
auto ToPixelRegion(const NormalizedFaceArea& area, int image_width, int image_height) -> FaceRegion;

auto FaceRegionsToJson(const std::vector<FaceRegion>& regions) -> nlohmann::json;
};  // namespace photolift
