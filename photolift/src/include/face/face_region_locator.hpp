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
#include <vector>

#include "config/enhancer_config.hpp"
#include "face/face_detector.hpp"
#include "face/face_region.hpp"
#include "image/image_buffer.hpp"

namespace photolift {
/**
 * @brief Produces the face rectangles used by the relight stage.
 *
 * Embedded areas always win; the detector only runs when they yield no region.
 */
class FaceRegionLocator {
 private:
  LocatorConfig                  _config;
  std::unique_ptr<IFaceDetector> _detector;

  auto DetectFaces(const ImageBuffer& buffer) -> std::vector<FaceRegion>;

 public:
  FaceRegionLocator();
  FaceRegionLocator(LocatorConfig config, std::unique_ptr<IFaceDetector> detector);

  /**
   * @brief Convert embedded areas to pixel rectangles, deduplicated in first-seen order
   */
  auto FromEmbeddedAreas(const std::vector<NormalizedFaceArea>& areas, int width, int height) const
      -> std::vector<FaceRegion>;

  auto Locate(const ImageBuffer& buffer, const std::vector<NormalizedFaceArea>& embedded_areas)
      -> std::vector<FaceRegion>;
};
};  // namespace photolift
