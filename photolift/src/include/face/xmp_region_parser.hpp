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

#include <string>
#include <vector>

#include "face/face_region.hpp"

namespace photolift {
/**
 * @brief Reads face areas (stArea:x/y/w/h records) out of an XMP packet.
 *
 * Incomplete or non-numeric records are skipped; a packet that is not valid XMP yields no
 * areas. Values whose magnitude exceeds the percent threshold are read as percentages.
 */
class XmpRegionParser {
 private:
  double _percent_threshold = 2.0;

 public:
  XmpRegionParser() = default;
  explicit XmpRegionParser(double percent_threshold);

  /**
   * @brief Initialize the Exiv2 XMP toolkit once per process, with a lock so that XMP can be
   * decoded from several threads. Must run before the first Exiv2 image is read.
   */
  static void InitializeToolkit();

  auto        Parse(const std::string& xmp_packet) const -> std::vector<NormalizedFaceArea>;
};
};  // namespace photolift
