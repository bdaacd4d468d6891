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

#include "image/image_buffer.hpp"
#include "type/type.hpp"

namespace photolift {
struct JpegWriteOptions {
  int quality_     = 100;
  // EXIF orientation written to the output, 1 for upright
  int orientation_ = 1;
};

class ImageWriter {
 public:
  /**
   * @brief Encode an 8-bit RGB buffer as JPEG.
   *
   * Metadata attributes of the source file are copied on a best-effort basis and the
   * buffer's ICC profile is embedded. If OpenImageIO cannot write the file, OpenCV is used
   * instead (pixels only). Missing parent directories are created.
   *
   * @param src_path The file the buffer was decoded from
   * @param dst_path
   * @param image_data CV_8UC3 RGB
   * @param options
   * @throws std::runtime_error when both encoders fail
   */
  static void WriteJpeg(const image_path_t& src_path, const image_path_t& dst_path,
                        const ImageBuffer& image_data, const JpegWriteOptions& options);
};
};  // namespace photolift
