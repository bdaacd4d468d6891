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

#include "io/image/image_writer.hpp"

#include <OpenImageIO/imageio.h>
#include <easy/profiler.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace photolift {
namespace {
OIIO_NAMESPACE_USING

auto PathToUtf8(const std::filesystem::path& path) -> std::string {
  auto u8 = path.u8string();
  return std::string(reinterpret_cast<const char*>(u8.data()), u8.size());
}

auto SetOrientation(ImageSpec& spec, int orientation) -> void {
  // Drop every spelling the reader may have produced so only one tag reaches the file
  spec.extra_attribs.remove("Exif:Orientation", TypeDesc::UNKNOWN, false);
  spec.extra_attribs.remove("EXIF:Orientation", TypeDesc::UNKNOWN, false);
  spec.extra_attribs.remove("exif:Orientation", TypeDesc::UNKNOWN, false);
  spec.extra_attribs.remove("tiff:Orientation", TypeDesc::UNKNOWN, false);
  spec.extra_attribs.remove("TIFF:Orientation", TypeDesc::UNKNOWN, false);
  spec.extra_attribs.remove("Orientation", TypeDesc::UNKNOWN, false);
  spec.attribute("Orientation", orientation);
}

auto CopySourceAttributes(const image_path_t& src_path, ImageSpec& spec) -> void {
  if (src_path.empty()) return;
  try {
    if (auto in = ImageInput::open(PathToUtf8(src_path))) {
      spec.extra_attribs = in->spec().extra_attribs;
      in->close();
    }
  } catch (const std::exception& e) {
    std::cerr << "ImageWriter: source metadata not copied (" << e.what() << ")" << std::endl;
  }
  // The decoded pixels carry no embedded thumbnail or alternate profile
  spec.extra_attribs.remove("ICCProfile", TypeDesc::UNKNOWN, false);
  spec.extra_attribs.remove("thumbnail_image", TypeDesc::UNKNOWN, false);
}

auto TryWriteWithOpenImageIO(const image_path_t& src_path, const image_path_t& dst_path,
                             const ImageBuffer& image_data, const JpegWriteOptions& options,
                             std::string& out_error) -> bool {
  const std::string dst    = PathToUtf8(dst_path);
  const cv::Mat&    rgb    = image_data.GetCPUData();
  const cv::Mat     pixels = rgb.isContinuous() ? rgb : rgb.clone();

  ImageSpec         outspec(pixels.cols, pixels.rows, 3, TypeDesc::UINT8);
  outspec.channelnames = {"R", "G", "B"};

  CopySourceAttributes(src_path, outspec);
  SetOrientation(outspec, options.orientation_);
  outspec.attribute("CompressionQuality", options.quality_);

  const color_profile_t& icc = image_data.GetColorProfile();
  if (!icc.empty()) {
    outspec.attribute("ICCProfile", TypeDesc(TypeDesc::UINT8, static_cast<int>(icc.size())),
                      icc.data());
  }

  std::unique_ptr<ImageOutput> out = ImageOutput::create(dst);
  if (!out) {
    out_error = "OpenImageIO: failed to create ImageOutput";
    return false;
  }

  if (!out->open(dst, outspec)) {
    out_error = "OpenImageIO: failed to open output: " + out->geterror();
    return false;
  }

  const stride_t xstride = static_cast<stride_t>(pixels.elemSize());
  const stride_t ystride = static_cast<stride_t>(pixels.step);
  if (!out->write_image(TypeDesc::UINT8, pixels.data, xstride, ystride, AutoStride)) {
    out_error = "OpenImageIO: failed to write image: " + out->geterror();
    out->close();
    return false;
  }

  out->close();
  return true;
}

auto TryWriteWithOpenCV(const image_path_t& dst_path, const ImageBuffer& image_data,
                        const JpegWriteOptions& options, std::string& out_error) -> bool {
  cv::Mat bgr;
  cv::cvtColor(image_data.GetCPUData(), bgr, cv::COLOR_RGB2BGR);

  const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, options.quality_};
  try {
    if (!cv::imwrite(dst_path.string(), bgr, params)) {
      out_error = "OpenCV: imwrite returned false";
      return false;
    }
    return true;
  } catch (const cv::Exception& e) {
    out_error = std::string("OpenCV: ") + e.what();
    return false;
  }
}
}  // namespace

void ImageWriter::WriteJpeg(const image_path_t& src_path, const image_path_t& dst_path,
                            const ImageBuffer& image_data, const JpegWriteOptions& options) {
  EASY_FUNCTION();
  if (dst_path.empty()) {
    throw std::runtime_error("ImageWriter: export path is empty");
  }
  if (!image_data.IsValidPixelBuffer()) {
    throw std::runtime_error("ImageWriter: expected a non-empty CV_8UC3 buffer");
  }
  if (options.quality_ < 0 || options.quality_ > 100) {
    throw std::runtime_error("ImageWriter: JPEG quality must be within [0, 100]");
  }

  if (dst_path.has_parent_path()) {
    std::filesystem::create_directories(dst_path.parent_path());
  }

  std::string oiio_err;
  try {
    if (TryWriteWithOpenImageIO(src_path, dst_path, image_data, options, oiio_err)) {
      return;
    }
  } catch (const std::exception& e) {
    oiio_err = e.what();
  }

  std::string cv_err;
  if (TryWriteWithOpenCV(dst_path, image_data, options, cv_err)) {
    std::cerr << "ImageWriter: wrote " << dst_path.string()
              << " without metadata (" << oiio_err << ")" << std::endl;
    return;
  }

  throw std::runtime_error("ImageWriter: export failed. OIIO: " + oiio_err +
                           " | OpenCV: " + cv_err);
}
};  // namespace photolift
