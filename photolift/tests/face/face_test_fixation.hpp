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

#include <gtest/gtest.h>

#include <exiv2/exiv2.hpp>
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <string>
#include <utility>
#include <vector>

#include "face/face_detector.hpp"
#include "face/xmp_region_parser.hpp"

namespace photolift {
/**
 * @brief Detector returning a fixed set of rectangles and recording what it was asked
 */
class FixedFaceDetector : public IFaceDetector {
 public:
  std::vector<cv::Rect> faces_;
  int                   calls_         = 0;
  int                   last_min_size_ = 0;
  cv::Size              last_size_;

  explicit FixedFaceDetector(std::vector<cv::Rect> faces) : faces_(std::move(faces)) {}

  auto Detect(const cv::Mat& gray, int min_size) -> std::vector<cv::Rect> override {
    ++calls_;
    last_min_size_ = min_size;
    last_size_     = gray.size();
    return faces_;
  }
  auto IsAvailable() const -> bool override { return true; }
};

inline auto MakeRegionPacket(const std::vector<std::vector<std::string>>& areas) -> std::string {
  std::string packet =
      "<x:xmpmeta xmlns:x=\"adobe:ns:meta/\">"
      "<rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\">"
      "<rdf:Description rdf:about=\"\""
      " xmlns:mwg-rs=\"http://www.metadataworkinggroup.com/schemas/regions/\""
      " xmlns:stArea=\"http://ns.adobe.com/xmp/sType/Area#\">"
      "<mwg-rs:Regions rdf:parseType=\"Resource\">"
      "<mwg-rs:RegionList><rdf:Bag>";
  for (const auto& area : areas) {
    packet += "<rdf:li rdf:parseType=\"Resource\"><mwg-rs:Type>Face</mwg-rs:Type><mwg-rs:Area";
    const char* names[] = {"x", "y", "w", "h"};
    for (size_t i = 0; i < area.size() && i < 4; ++i) {
      packet += std::string(" stArea:") + names[i] + "=\"" + area[i] + "\"";
    }
    packet += " stArea:unit=\"normalized\"/></rdf:li>";
  }
  packet += "</rdf:Bag></mwg-rs:RegionList></mwg-rs:Regions></rdf:Description></rdf:RDF>"
            "</x:xmpmeta>";
  return packet;
}

class FaceTests : public ::testing::Test {
 protected:
  void SetUp() override {
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);
    cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_SILENT);
    XmpRegionParser::InitializeToolkit();
  }
};
};  // namespace photolift
