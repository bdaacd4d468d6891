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

#include <gtest/gtest.h>

#include <cstdint>
#include <exiv2/exiv2.hpp>
#include <nlohmann/json.hpp>

#include "image/capture_metadata.hpp"
#include "image/metadata_extractor.hpp"

using namespace photolift;

TEST(CaptureMetadataTest, DefaultIsEmpty) {
  CaptureMetadata metadata;
  EXPECT_TRUE(metadata.IsEmpty());
  EXPECT_TRUE(metadata.ToJson().empty());

  metadata.iso = 100;
  EXPECT_FALSE(metadata.IsEmpty());
}

TEST(CaptureMetadataTest, JsonKeepsPresentFieldsOnly) {
  CaptureMetadata metadata;
  metadata.iso           = 3200;
  metadata.exposure_time = 1.0 / 60.0;
  metadata.flash_fired   = true;
  metadata.scene_type    = SceneType::NIGHT;
  metadata.metering_mode = MeteringMode::SPOT;

  const nlohmann::json j = metadata.ToJson();
  EXPECT_EQ(j["ISO"], 3200);
  EXPECT_EQ(j["SceneType"], "night");
  EXPECT_EQ(j["MeteringMode"], "spot");
  EXPECT_FALSE(j.contains("FNumber"));

  CaptureMetadata restored;
  restored.FromJson(j);
  EXPECT_EQ(restored, metadata);
}

TEST(CaptureMetadataTest, UnknownEnumNamesFallBack) {
  EXPECT_EQ(SceneTypeFromString("underwater"), SceneType::UNKNOWN);
  EXPECT_EQ(MeteringModeFromString(""), MeteringMode::UNKNOWN);
  EXPECT_EQ(MeteringModeToString(MeteringMode::CENTER_WEIGHTED_AVERAGE),
            "center_weighted_average");
}

TEST(MetadataExtractorTest, ReadsCaptureSettingsFromExif) {
  Exiv2::ExifData exif;
  exif["Exif.Photo.ISOSpeedRatings"]  = uint16_t(1600);
  exif["Exif.Photo.ExposureTime"]     = Exiv2::URational(1, 50);
  exif["Exif.Photo.FNumber"]          = Exiv2::URational(28, 10);
  exif["Exif.Photo.Flash"]            = uint16_t(0x19);
  exif["Exif.Photo.SceneCaptureType"] = uint16_t(2);
  exif["Exif.Photo.MeteringMode"]     = uint16_t(5);

  const CaptureMetadata metadata = MetadataExtractor::ExifToCaptureMetadata(exif);
  ASSERT_TRUE(metadata.iso.has_value());
  EXPECT_EQ(*metadata.iso, 1600);
  EXPECT_NEAR(metadata.exposure_time.value(), 0.02, 1e-9);
  EXPECT_NEAR(metadata.f_number.value(), 2.8, 1e-9);
  EXPECT_TRUE(metadata.flash_fired.value());
  EXPECT_EQ(metadata.scene_type.value(), SceneType::PORTRAIT);
  EXPECT_EQ(metadata.metering_mode.value(), MeteringMode::PATTERN);
  EXPECT_FALSE(metadata.exposure_compensation.has_value());
}

TEST(MetadataExtractorTest, FlashBitZeroOnly) {
  Exiv2::ExifData exif;
  exif["Exif.Photo.Flash"] = uint16_t(0x10);
  EXPECT_FALSE(MetadataExtractor::ExifToCaptureMetadata(exif).flash_fired.value());
}

TEST(MetadataExtractorTest, GarbageBufferYieldsNothing) {
  Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);
  const uint8_t    garbage[] = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07};
  EmbeddedMetadata embedded = MetadataExtractor::ExtractFromBuffer(garbage, sizeof(garbage));
  EXPECT_FALSE(embedded.capture_.has_value());
  EXPECT_TRUE(embedded.xmp_packet_.empty());
  EXPECT_EQ(embedded.orientation_, 1);
}
