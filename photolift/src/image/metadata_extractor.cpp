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

#include "image/metadata_extractor.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

namespace photolift {
namespace {
auto RationalToDouble(const Exiv2::Rational& value) -> std::optional<double> {
  if (value.second == 0) {
    return std::nullopt;
  }
  return static_cast<double>(value.first) / static_cast<double>(value.second);
}

auto FindTag(const Exiv2::ExifData& exif_data, const char* key)
    -> std::optional<Exiv2::ExifData::const_iterator> {
  auto it = exif_data.findKey(Exiv2::ExifKey(key));
  if (it == exif_data.end() || it->count() == 0) {
    return std::nullopt;
  }
  return it;
}

auto ReadRational(const Exiv2::ExifData& exif_data, const char* key) -> std::optional<double> {
  auto it = FindTag(exif_data, key);
  if (!it) return std::nullopt;
  return RationalToDouble((*it)->toRational());
}

auto ReadInteger(const Exiv2::ExifData& exif_data, const char* key) -> std::optional<int64_t> {
  auto it = FindTag(exif_data, key);
  if (!it) return std::nullopt;
  return (*it)->toInt64();
}

auto MapSceneCaptureType(int64_t value) -> SceneType {
  switch (value) {
    case 0:
      return SceneType::STANDARD;
    case 1:
      return SceneType::LANDSCAPE;
    case 2:
      return SceneType::PORTRAIT;
    case 3:
      return SceneType::NIGHT;
    default:
      return SceneType::UNKNOWN;
  }
}

auto MapMeteringMode(int64_t value) -> MeteringMode {
  switch (value) {
    case 1:
      return MeteringMode::AVERAGE;
    case 2:
      return MeteringMode::CENTER_WEIGHTED_AVERAGE;
    case 3:
      return MeteringMode::SPOT;
    case 4:
      return MeteringMode::MULTI_SPOT;
    case 5:
      return MeteringMode::PATTERN;
    case 6:
      return MeteringMode::PARTIAL;
    case 255:
      return MeteringMode::OTHER;
    default:
      return MeteringMode::UNKNOWN;
  }
}
}  // namespace

auto MetadataExtractor::OpenBuffer(const uint8_t* buffer, size_t size) -> Exiv2::Image::UniquePtr {
  if (!buffer || size == 0) {
    throw std::runtime_error("MetadataExtractor: empty buffer");
  }
  Exiv2::Image::UniquePtr image =
      Exiv2::ImageFactory::open(reinterpret_cast<const Exiv2::byte*>(buffer), size);
  image->readMetadata();
  return image;
}

auto MetadataExtractor::ExifToCaptureMetadata(const Exiv2::ExifData& exif_data)
    -> CaptureMetadata {
  CaptureMetadata metadata;
  if (exif_data.empty()) {
    return metadata;
  }

  if (auto iso = ReadInteger(exif_data, "Exif.Photo.ISOSpeedRatings"); iso && *iso >= 0) {
    metadata.iso = static_cast<int>(*iso);
  }
  metadata.exposure_time         = ReadRational(exif_data, "Exif.Photo.ExposureTime");
  metadata.f_number              = ReadRational(exif_data, "Exif.Photo.FNumber");
  metadata.exposure_compensation = ReadRational(exif_data, "Exif.Photo.ExposureBiasValue");
  metadata.brightness_value      = ReadRational(exif_data, "Exif.Photo.BrightnessValue");

  // Bit 0 of the Flash tag is "flash fired"
  if (auto flash = ReadInteger(exif_data, "Exif.Photo.Flash")) {
    metadata.flash_fired = (*flash & 0x1) != 0;
  }
  if (auto scene = ReadInteger(exif_data, "Exif.Photo.SceneCaptureType")) {
    metadata.scene_type = MapSceneCaptureType(*scene);
  }
  if (auto metering = ReadInteger(exif_data, "Exif.Photo.MeteringMode")) {
    metadata.metering_mode = MapMeteringMode(*metering);
  }
  return metadata;
}

auto MetadataExtractor::ExtractFromBuffer(const uint8_t* buffer, size_t size)
    -> EmbeddedMetadata {
  EmbeddedMetadata embedded;
  try {
    auto image = OpenBuffer(buffer, size);
    if (!image) {
      return embedded;
    }
    if (!image->exifData().empty()) {
      CaptureMetadata capture = ExifToCaptureMetadata(image->exifData());
      if (!capture.IsEmpty()) {
        embedded.capture_ = std::move(capture);
      }
    }
    if (auto orientation = ReadInteger(image->exifData(), "Exif.Image.Orientation");
        orientation && *orientation >= 1 && *orientation <= 8) {
      embedded.orientation_ = static_cast<int>(*orientation);
    }
    embedded.xmp_packet_ = image->xmpPacket();
    if (image->iccProfileDefined()) {
      const Exiv2::DataBuf& icc = image->iccProfile();
      embedded.icc_profile_.assign(icc.c_data(), icc.c_data() + icc.size());
    }
  } catch (const std::exception& e) {
    std::cerr << "MetadataExtractor: metadata unavailable (" << e.what() << ")" << std::endl;
    return EmbeddedMetadata{};
  }
  return embedded;
}
};  // namespace photolift
