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
#include <optional>
#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>
#include <vector>

#include "type/type.hpp"

namespace photolift {
/**
 * @brief Face detection capability used when no embedded regions exist.
 *
 * Implementations may keep per-instance state, so each worker owns its own detector.
 */
class IFaceDetector {
 public:
  /**
   * @brief Detect faces on an 8-bit grayscale image
   *
   * @param gray CV_8UC1
   * @param min_size smallest face side, in pixels of the given image
   * @return std::vector<cv::Rect> in the coordinates of the given image
   */
  virtual auto Detect(const cv::Mat& gray, int min_size) -> std::vector<cv::Rect> = 0;

  virtual auto IsAvailable() const -> bool                                        = 0;

  virtual ~IFaceDetector()                                                        = default;
};

/**
 * @brief Haar cascade detector backed by cv::CascadeClassifier
 */
class CascadeFaceDetector : public IFaceDetector {
 private:
  cv::CascadeClassifier _classifier;
  double                _scale_factor  = 1.1;
  int                   _min_neighbors = 5;

 public:
  explicit CascadeFaceDetector(cv::CascadeClassifier&& classifier);

  auto Detect(const cv::Mat& gray, int min_size) -> std::vector<cv::Rect> override;
  auto IsAvailable() const -> bool override { return true; }
};

class NullFaceDetector : public IFaceDetector {
 public:
  auto Detect(const cv::Mat&, int) -> std::vector<cv::Rect> override { return {}; }
  auto IsAvailable() const -> bool override { return false; }
};

/**
 * @brief Build the detector for one worker.
 *
 * Loads the cascade from the given path, or from OpenCV's installed haarcascades when no path is
 * given. Falls back to NullFaceDetector when nothing loads.
 */
auto MakeFaceDetector(const std::optional<file_path_t>& cascade_path)
    -> std::unique_ptr<IFaceDetector>;
};  // namespace photolift
