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

#include <cstdint>
#include <exiv2/exiv2.hpp>
#include <stdexcept>
#include <vector>

#include "app/service_test_fixation.hpp"
#include "face/face_test_fixation.hpp"
#include "io/image/image_writer.hpp"

using namespace photolift;

TEST_F(ServiceTests, DecodesPixelsAsRgb) {
  cv::Mat frame(24, 32, CV_8UC3, cv::Scalar(200, 30, 30));
  auto    path = WriteJpeg("red.jpg", frame);

  ImageLoader  loader;
  DecodedImage decoded = loader.LoadFromPath(path);
  ASSERT_TRUE(decoded.buffer_.IsValidPixelBuffer());
  EXPECT_EQ(decoded.buffer_.Width(), 32);
  EXPECT_EQ(decoded.buffer_.Height(), 24);

  const cv::Scalar mean = cv::mean(decoded.buffer_.GetCPUData());
  EXPECT_GT(mean[0], mean[2] + 100.0);
  EXPECT_FALSE(decoded.capture_.has_value());
  EXPECT_TRUE(decoded.face_areas_.empty());
  EXPECT_EQ(decoded.orientation_, 1);
}

TEST_F(ServiceTests, ReadsEmbeddedMetadata) {
  auto path  = WriteJpeg("tagged.jpg", cv::Mat(40, 60, CV_8UC3, cv::Scalar::all(90)));
  auto image = Exiv2::ImageFactory::open(path.string());
  image->readMetadata();
  image->exifData()["Exif.Photo.ISOSpeedRatings"] = uint16_t(3200);
  image->exifData()["Exif.Image.Orientation"]     = uint16_t(6);
  image->setXmpPacket(MakeRegionPacket({{"0.5", "0.5", "0.2", "0.3"}}));
  image->writeXmpFromPacket(true);
  image->writeMetadata();

  ImageLoader  loader;
  DecodedImage decoded = loader.LoadFromPath(path);

  ASSERT_TRUE(decoded.capture_.has_value());
  EXPECT_EQ(decoded.capture_->iso.value(), 3200);
  EXPECT_EQ(decoded.orientation_, 6);
  // Stored orientation, not rotated
  EXPECT_EQ(decoded.buffer_.Width(), 60);
  EXPECT_EQ(decoded.buffer_.Height(), 40);
  ASSERT_EQ(decoded.face_areas_.size(), 1u);
  EXPECT_DOUBLE_EQ(decoded.face_areas_[0].height, 0.3);
}

TEST_F(ServiceTests, UndecodableInputThrows) {
  ImageLoader loader;
  EXPECT_THROW(loader.LoadFromPath(work_dir_ / "missing.jpg"), std::runtime_error);

  auto text = WriteBytes("notes.jpg", "this is not an image");
  EXPECT_THROW(loader.LoadFromPath(text), std::runtime_error);

  auto empty = WriteBytes("empty.jpg", "");
  EXPECT_THROW(ImageLoader::ReadBytes(empty), std::runtime_error);
}

TEST_F(ServiceTests, WriterKeepsPixelsAndOrientation) {
  cv::Mat frame(30, 40, CV_8UC3, cv::Scalar(120, 80, 40));
  auto    source = WriteJpeg("source.jpg", frame);
  auto    target = work_dir_ / "nested" / "out.jpg";

  JpegWriteOptions options;
  options.quality_     = 95;
  options.orientation_ = 3;
  ImageWriter::WriteJpeg(source, target, ImageBuffer(frame), options);

  ASSERT_TRUE(std::filesystem::exists(target));
  cv::Mat reread = cv::imread(target.string(), cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
  ASSERT_FALSE(reread.empty());
  EXPECT_EQ(reread.size(), cv::Size(40, 30));
  EXPECT_EQ(ReadOrientation(target), 3);
}

TEST_F(ServiceTests, WriterRejectsBadRequests) {
  ImageBuffer      frame(cv::Mat(8, 8, CV_8UC3, cv::Scalar::all(10)));
  JpegWriteOptions options;
  EXPECT_THROW(ImageWriter::WriteJpeg({}, image_path_t{}, frame, options), std::runtime_error);

  options.quality_ = 101;
  EXPECT_THROW(ImageWriter::WriteJpeg({}, work_dir_ / "q.jpg", frame, options),
               std::runtime_error);

  options.quality_ = 90;
  EXPECT_THROW(ImageWriter::WriteJpeg({}, work_dir_ / "e.jpg", ImageBuffer(), options),
               std::runtime_error);
}
