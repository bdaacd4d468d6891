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

#include "face/face_region.hpp"

#include <algorithm>

namespace photolift {
auto ToPixelRegion(const NormalizedFaceArea& area, int image_width, int image_height)
    -> FaceRegion {
  const double cx     = std::clamp(area.center_x, 0.0, 1.0);
  const double cy     = std::clamp(area.center_y, 0.0, 1.0);
  const double w      = std::clamp(area.width, 0.0, 1.0);
  const double h      = std::clamp(area.height, 0.0, 1.0);

  // Truncation toward zero, as the areas are specified in image fractions
  int          left   = static_cast<int>((cx - w / 2.0) * image_width);
  int          top    = static_cast<int>((cy - h / 2.0) * image_height);
  int          right  = static_cast<int>((cx + w / 2.0) * image_width);
  int          bottom = static_cast<int>((cy + h / 2.0) * image_height);

  left                = std::clamp(left, 0, std::max(image_width - 1, 0));
  top                 = std::clamp(top, 0, std::max(image_height - 1, 0));
  right               = std::clamp(right, left + 1, std::max(image_width, left + 1));
  bottom              = std::clamp(bottom, top + 1, std::max(image_height, top + 1));

  return {left, top, right - left, bottom - top};
}

auto FaceRegionsToJson(const std::vector<FaceRegion>& regions) -> nlohmann::json {
  nlohmann::json regions_json = nlohmann::json::array();
  for (const auto& region : regions) {
    regions_json.push_back(region.ToJson());
  }
  return regions_json;
}
};  // namespace photolift
