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

#include <cmath>
#include <nlohmann/json.hpp>

#include "edit/operators/basic/contrast_op.hpp"
#include "edit/operators/basic/exposure_op.hpp"
#include "edit/operators/basic/highlight_op.hpp"
#include "edit/operators/basic/shadow_op.hpp"
#include "edit/operators/op_test_fixation.hpp"

using namespace photolift;

TEST_F(OperationTests, ExposureScalesByPowerOfTwo) {
  auto       img = MakeWorking(8, 8, 0.25f);
  ExposureOp op{1.0};
  EXPECT_FALSE(op.IsNoOp());
  op.Apply(img);
  EXPECT_NEAR(PixelAt(img, 3, 3)[0], 0.5f, 1e-6);

  auto       bright = MakeWorking(8, 8, 0.75f);
  op.Apply(bright);
  EXPECT_FLOAT_EQ(PixelAt(bright, 0, 0)[1], 1.0f);

  ExposureOp darken{-1.0};
  auto       mid = MakeWorking(4, 4, 0.5f);
  darken.Apply(mid);
  EXPECT_NEAR(PixelAt(mid, 1, 1)[2], 0.25f, 1e-6);
}

TEST_F(OperationTests, ExposureParamsAndSkip) {
  ExposureOp op{0.005};
  EXPECT_TRUE(op.IsNoOp());

  nlohmann::json params = op.GetParams();
  EXPECT_EQ(params.begin().key(), "exposure");

  params["exposure"] = 0.5;
  op.SetParams(params);
  EXPECT_FALSE(op.IsNoOp());
  EXPECT_DOUBLE_EQ(op.GetParams()["exposure"].get<double>(), 0.5);

  ExposureOp from_json{nlohmann::json{{"exposure", -0.3}}};
  EXPECT_DOUBLE_EQ(from_json.GetParams()["exposure"].get<double>(), -0.3);
  EXPECT_EQ(from_json.GetOperatorType(), OperatorType::EXPOSURE);
}

TEST_F(OperationTests, ContrastPivotsAroundMidGray) {
  ContrastOp op{1.2};
  auto       mid = MakeWorking(4, 4, 0.5f);
  op.Apply(mid);
  EXPECT_NEAR(PixelAt(mid, 0, 0)[0], 0.5f, 1e-6);

  auto light = MakeWorking(4, 4, 0.75f);
  op.Apply(light);
  EXPECT_NEAR(PixelAt(light, 0, 0)[0], 0.8f, 1e-5);

  auto dark = MakeWorking(4, 4, 0.25f);
  op.Apply(dark);
  EXPECT_NEAR(PixelAt(dark, 0, 0)[0], 0.2f, 1e-5);

  EXPECT_TRUE(ContrastOp{1.005}.IsNoOp());
  EXPECT_FALSE(ContrastOp{0.8}.IsNoOp());
}

TEST_F(OperationTests, ShadowLiftTouchesOnlyShadows) {
  cv::Mat pixels(2, 2, CV_8UC3, cv::Scalar::all(204));
  pixels.at<cv::Vec3b>(0, 0) = cv::Vec3b(26, 26, 26);

  auto        img            = MakeWorking(pixels);
  const float dark_before    = PixelAt(img, 0, 0)[0];
  const float light_before   = PixelAt(img, 1, 1)[0];

  ShadowLiftOp op{0.4};
  op.Apply(img);

  // (0.55 - L) / 0.55 raised to 1.8, scaled by the amount
  const float mask = std::pow((0.55f - dark_before) / 0.55f, 1.8f);
  EXPECT_NEAR(PixelAt(img, 0, 0)[0], dark_before * (1.0f + 0.4f * mask), 1e-5);
  EXPECT_FLOAT_EQ(PixelAt(img, 1, 1)[0], light_before);

  cv::Mat mask_out;
  ShadowLiftOp::GetMask(MakeWorking(2, 2, 0.6f)->GetCPUData(), mask_out);
  EXPECT_FLOAT_EQ(mask_out.at<float>(0, 0), 0.0f);

  EXPECT_TRUE(ShadowLiftOp{0.0}.IsNoOp());
}

TEST_F(OperationTests, HighlightRecoveryCompressesAboveKnee) {
  HighlightRecoveryOp op{1.0};
  auto                bright = MakeWorking(4, 4, 0.9f);
  op.Apply(bright);
  EXPECT_NEAR(PixelAt(bright, 2, 2)[0], 0.9f - 0.3f * 0.2f, 1e-5);

  auto mid = MakeWorking(4, 4, 0.5f);
  op.Apply(mid);
  EXPECT_FLOAT_EQ(PixelAt(mid, 2, 2)[0], 0.5f);
}

TEST_F(OperationTests, AutoHighlightRecoveryNeedsBrightening) {
  cv::Mat pixels(10, 10, CV_8UC3, cv::Scalar::all(100));
  pixels.rowRange(0, 5).setTo(cv::Scalar::all(255));
  auto                 img = MakeWorking(pixels);
  ApplierConfig        config;

  AdjustmentParameters neutral;
  EXPECT_DOUBLE_EQ(HighlightRecoveryOp::EstimateAutoRecovery(img->GetCPUData(), neutral, config),
                   0.0);

  AdjustmentParameters brighter;
  brighter.exposure_adjustment = 0.3;
  // 50% clipped, far past the trigger, so the recovery saturates
  EXPECT_DOUBLE_EQ(HighlightRecoveryOp::EstimateAutoRecovery(img->GetCPUData(), brighter, config),
                   config.auto_highlight_max);

  auto flat = MakeWorking(10, 10, 0.5f);
  EXPECT_DOUBLE_EQ(HighlightRecoveryOp::EstimateAutoRecovery(flat->GetCPUData(), brighter, config),
                   0.0);
}

TEST_F(OperationTests, PixelBufferConversionTruncates) {
  cv::Mat working(1, 4, CV_32FC3);
  working.at<cv::Vec3f>(0, 0) = cv::Vec3f(141.6f / 255.0f, 0.999f / 255.0f, 254.99f / 255.0f);
  working.at<cv::Vec3f>(0, 1) = cv::Vec3f(-0.2f, 1.3f, 1.0f);
  working.at<cv::Vec3f>(0, 2) = cv::Vec3f(0.0f, 0.5f, 128.0f / 255.0f);
  working.at<cv::Vec3f>(0, 3) = cv::Vec3f(10.9f / 255.0f, 99.5f / 255.0f, 200.2f / 255.0f);

  cv::Mat rgb8 = ToPixelBuffer(working);
  ASSERT_EQ(rgb8.type(), CV_8UC3);
  EXPECT_EQ(rgb8.at<cv::Vec3b>(0, 0), cv::Vec3b(141, 0, 254));
  EXPECT_EQ(rgb8.at<cv::Vec3b>(0, 1), cv::Vec3b(0, 255, 255));
  EXPECT_EQ(rgb8.at<cv::Vec3b>(0, 2), cv::Vec3b(0, 127, 128));
  EXPECT_EQ(rgb8.at<cv::Vec3b>(0, 3), cv::Vec3b(10, 99, 200));
}

TEST_F(OperationTests, EightBitRoundTripIsExact) {
  cv::Mat ramp(1, 256, CV_8UC3);
  for (int i = 0; i < 256; ++i) {
    ramp.at<cv::Vec3b>(0, i) = cv::Vec3b(i, 255 - i, i);
  }
  cv::Mat back = ToPixelBuffer(ToWorkingFloat(ramp));
  EXPECT_EQ(cv::norm(ramp, back, cv::NORM_INF), 0.0);
}
