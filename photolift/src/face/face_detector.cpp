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

#include "face/face_detector.hpp"

#include <array>
#include <filesystem>
#include <iostream>
#include <opencv2/core/utility.hpp>
#include <string>
#include <utility>

namespace photolift {
namespace {
constexpr const char* kCascadeFile = "haarcascade_frontalface_default.xml";

constexpr std::array<const char*, 4> kCascadeDirs = {
    "/usr/share/opencv4/haarcascades",
    "/usr/local/share/opencv4/haarcascades",
    "/usr/share/opencv/haarcascades",
    "/usr/local/share/opencv/haarcascades",
};

auto FindInstalledCascade() -> std::optional<file_path_t> {
  for (const char* dir : kCascadeDirs) {
    file_path_t candidate = file_path_t(dir) / kCascadeFile;
    std::error_code ec;
    if (std::filesystem::exists(candidate, ec)) {
      return candidate;
    }
  }
  const std::string found =
      cv::samples::findFile(std::string("haarcascades/") + kCascadeFile, false, true);
  if (!found.empty()) {
    return file_path_t(found);
  }
  return std::nullopt;
}

auto TryLoadCascade(const file_path_t& path) -> std::optional<cv::CascadeClassifier> {
  cv::CascadeClassifier classifier;
  try {
    if (!classifier.load(path.string()) || classifier.empty()) {
      return std::nullopt;
    }
  } catch (const cv::Exception& e) {
    std::cerr << "FaceDetector: failed to parse cascade '" << path.string() << "' (" << e.what()
              << ")" << std::endl;
    return std::nullopt;
  }
  return classifier;
}
}  // namespace

CascadeFaceDetector::CascadeFaceDetector(cv::CascadeClassifier&& classifier)
    : _classifier(std::move(classifier)) {}

auto CascadeFaceDetector::Detect(const cv::Mat& gray, int min_size) -> std::vector<cv::Rect> {
  std::vector<cv::Rect> faces;
  _classifier.detectMultiScale(gray, faces, _scale_factor, _min_neighbors, 0,
                               cv::Size(min_size, min_size));
  return faces;
}

auto MakeFaceDetector(const std::optional<file_path_t>& cascade_path)
    -> std::unique_ptr<IFaceDetector> {
  std::optional<file_path_t> path = cascade_path ? cascade_path : FindInstalledCascade();
  if (!path) {
    std::cerr << "FaceDetector: no Haar cascade found, face detection disabled" << std::endl;
    return std::make_unique<NullFaceDetector>();
  }

  auto classifier = TryLoadCascade(*path);
  if (!classifier) {
    std::cerr << "FaceDetector: cannot load cascade '" << path->string()
              << "', face detection disabled" << std::endl;
    return std::make_unique<NullFaceDetector>();
  }
  return std::make_unique<CascadeFaceDetector>(std::move(*classifier));
}
};  // namespace photolift
