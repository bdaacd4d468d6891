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

#include "face/face_region_locator.hpp"

#include <easy/profiler.h>

#include <algorithm>
#include <opencv2/imgproc.hpp>
#include <utility>

namespace photolift {
FaceRegionLocator::FaceRegionLocator()
    : _detector(std::make_unique<NullFaceDetector>()) {}

FaceRegionLocator::FaceRegionLocator(LocatorConfig config, std::unique_ptr<IFaceDetector> detector)
    : _config(std::move(config)), _detector(std::move(detector)) {
  if (!_detector) {
    _detector = std::make_unique<NullFaceDetector>();
  }
}

auto FaceRegionLocator::FromEmbeddedAreas(const std::vector<NormalizedFaceArea>& areas, int width,
                                          int height) const -> std::vector<FaceRegion> {
  std::vector<FaceRegion> regions;
  for (const auto& area : areas) {
    FaceRegion region = ToPixelRegion(area, width, height);
    if (std::find(regions.begin(), regions.end(), region) == regions.end()) {
      regions.push_back(region);
    }
  }
  return regions;
}

auto FaceRegionLocator::DetectFaces(const ImageBuffer& buffer) -> std::vector<FaceRegion> {
  EASY_FUNCTION();
  if (!_detector->IsAvailable()) {
    return {};
  }
  const cv::Mat& rgb    = buffer.GetCPUData();
  const int      width  = rgb.cols;
  const int      height = rgb.rows;

  cv::Mat        gray;
  cv::cvtColor(rgb, gray, cv::COLOR_RGB2GRAY);

  // Ratio of source to detection resolution
  const int max_side   = std::max(width, height);
  double    scale      = 1.0;
  cv::Mat   detect_img = gray;
  if (max_side > _config.max_detection_side) {
    scale               = static_cast<double>(max_side) / _config.max_detection_side;
    const int resized_w = std::max(1, static_cast<int>(width / scale));
    const int resized_h = std::max(1, static_cast<int>(height / scale));
    cv::resize(gray, detect_img, cv::Size(resized_w, resized_h), 0.0, 0.0, cv::INTER_AREA);
  }

  const int min_side = std::min(detect_img.cols, detect_img.rows);
  const int min_face =
      std::max(_config.min_face_pixels, static_cast<int>(min_side * _config.min_face_fraction));

  std::vector<FaceRegion> regions;
  for (const cv::Rect& face : _detector->Detect(detect_img, min_face)) {
    const cv::Rect mapped(static_cast<int>(face.x * scale), static_cast<int>(face.y * scale),
                          static_cast<int>(face.width * scale),
                          static_cast<int>(face.height * scale));
    const cv::Rect clipped = mapped & cv::Rect(0, 0, width, height);
    if (clipped.width <= 0 || clipped.height <= 0) continue;
    regions.push_back({clipped.x, clipped.y, clipped.width, clipped.height});
  }
  return regions;
}

auto FaceRegionLocator::Locate(const ImageBuffer&                     buffer,
                               const std::vector<NormalizedFaceArea>& embedded_areas)
    -> std::vector<FaceRegion> {
  if (!embedded_areas.empty()) {
    auto regions = FromEmbeddedAreas(embedded_areas, buffer.Width(), buffer.Height());
    if (!regions.empty()) {
      return regions;
    }
  }
  return DetectFaces(buffer);
}
};  // namespace photolift
