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

#include "io/image/image_loader.hpp"

#include <easy/profiler.h>

#include <fstream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>
#include <utility>

#include "image/metadata_extractor.hpp"

namespace photolift {
ImageLoader::ImageLoader(XmpRegionParser xmp_parser) : _xmp_parser(std::move(xmp_parser)) {}

auto ImageLoader::ReadBytes(const image_path_t& path) -> std::vector<uint8_t> {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    throw std::runtime_error("ImageLoader: cannot open " + path.string());
  }
  const std::streamsize file_size = file.tellg();
  if (file_size <= 0) {
    throw std::runtime_error("ImageLoader: empty file " + path.string());
  }
  file.seekg(0, std::ios::beg);
  std::vector<uint8_t> buffer(static_cast<size_t>(file_size));
  if (!file.read(reinterpret_cast<char*>(buffer.data()), file_size)) {
    throw std::runtime_error("ImageLoader: failed to read " + path.string());
  }
  return buffer;
}

auto ImageLoader::Decode(const std::vector<uint8_t>& bytes) const -> DecodedImage {
  EASY_FUNCTION();
  if (bytes.empty()) {
    throw std::runtime_error("ImageLoader: empty buffer");
  }

  // Open the datastream as a cv::Mat image
  cv::Mat encoded(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<uint8_t*>(bytes.data()));
  cv::Mat bgr;
  try {
    bgr = cv::imdecode(encoded, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
  } catch (const cv::Exception& e) {
    throw std::runtime_error(std::string("ImageLoader: decoder error: ") + e.what());
  }
  if (bgr.empty()) {
    throw std::runtime_error("ImageLoader: unsupported or corrupt image data");
  }

  cv::Mat rgb;
  cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);

  XmpRegionParser::InitializeToolkit();
  EmbeddedMetadata embedded = MetadataExtractor::ExtractFromBuffer(bytes.data(), bytes.size());

  DecodedImage     decoded;
  decoded.buffer_      = ImageBuffer(std::move(rgb));
  decoded.buffer_.SetColorProfile(std::move(embedded.icc_profile_));
  decoded.capture_     = std::move(embedded.capture_);
  decoded.orientation_ = embedded.orientation_;
  if (!embedded.xmp_packet_.empty()) {
    decoded.face_areas_ = _xmp_parser.Parse(embedded.xmp_packet_);
  }
  return decoded;
}

auto ImageLoader::LoadFromPath(const image_path_t& path) const -> DecodedImage {
  return Decode(ReadBytes(path));
}
};  // namespace photolift
