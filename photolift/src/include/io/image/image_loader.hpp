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
#include <optional>
#include <vector>

#include "face/face_region.hpp"
#include "face/xmp_region_parser.hpp"
#include "image/capture_metadata.hpp"
#include "image/image_buffer.hpp"
#include "type/type.hpp"

namespace photolift {
/**
 * @brief A decoded file: RGB pixels in stored orientation plus what the enhancer reads from
 * the container
 */
struct DecodedImage {
  ImageBuffer                     buffer_;
  std::optional<CaptureMetadata>  capture_;
  std::vector<NormalizedFaceArea> face_areas_;
  // EXIF orientation of the stored pixels, carried to the output untouched
  int                             orientation_ = 1;
};

class ImageLoader {
 private:
  XmpRegionParser _xmp_parser;

 public:
  ImageLoader() = default;
  explicit ImageLoader(XmpRegionParser xmp_parser);

  /**
   * @brief Read a whole file into memory
   *
   * @throws std::runtime_error if the file cannot be opened or read
   */
  static auto ReadBytes(const image_path_t& path) -> std::vector<uint8_t>;

  /**
   * @brief Decode an encoded buffer. Pixels are kept in their stored orientation so that
   * embedded face areas line up with them.
   *
   * @throws std::runtime_error if the buffer is not a decodable image
   */
  auto        Decode(const std::vector<uint8_t>& bytes) const -> DecodedImage;

  auto        LoadFromPath(const image_path_t& path) const -> DecodedImage;
};
};  // namespace photolift
