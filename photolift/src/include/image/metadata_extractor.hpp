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

#include <cstddef>
#include <cstdint>
#include <exiv2/exiv2.hpp>
#include <optional>
#include <string>

#include "image/capture_metadata.hpp"
#include "type/type.hpp"

namespace photolift {
/**
 * @brief Metadata blocks pulled out of an encoded file before decoding pixels
 */
struct EmbeddedMetadata {
  std::optional<CaptureMetadata> capture_;
  std::string                    xmp_packet_;
  color_profile_t                icc_profile_;
  // EXIF orientation (1-8) of the stored pixels, 1 when absent
  int                            orientation_ = 1;
};

class MetadataExtractor {
 public:
  /**
   * @brief Open an encoded buffer with Exiv2 and read its metadata
   *
   * @param buffer
   * @param size
   * @return Exiv2::Image::UniquePtr
   */
  static auto OpenBuffer(const uint8_t* buffer, size_t size) -> Exiv2::Image::UniquePtr;

  /**
   * @brief Map the EXIF tags the enhancer consumes onto a typed record
   *
   * @param exif_data
   * @return CaptureMetadata
   */
  static auto ExifToCaptureMetadata(const Exiv2::ExifData& exif_data) -> CaptureMetadata;

  /**
   * @brief Extract capture settings, the XMP packet and the ICC profile.
   * A buffer Exiv2 cannot parse yields an empty result.
   */
  static auto ExtractFromBuffer(const uint8_t* buffer, size_t size) -> EmbeddedMetadata;
};
};  // namespace photolift
