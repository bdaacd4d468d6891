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

#include <opencv2/core.hpp>
#include <optional>

#include "analysis/analysis_test_fixation.hpp"
#include "analysis/metrics_analyzer.hpp"
#include "image/capture_metadata.hpp"

using namespace photolift;

TEST_F(AnalysisTests, UniformMidGrayIsFlat) {
  MetricsAnalyzer analyzer;
  ImageMetrics    metrics = analyzer.Analyze(MakeUniformBuffer(100, 100, 128), std::nullopt);

  EXPECT_LT(metrics.contrast_level, 0.1);
  EXPECT_LT(metrics.sharpness_score, 0.1);
  EXPECT_DOUBLE_EQ(metrics.shadow_clipping_percent, 0.0);
  EXPECT_DOUBLE_EQ(metrics.highlight_clipping_percent, 0.0);
  EXPECT_NEAR(metrics.exposure_level, 0.0, 0.05);
  EXPECT_NEAR(metrics.saturation_level, 0.0, 1e-9);
  EXPECT_FALSE(metrics.is_backlit);
  EXPECT_FALSE(metrics.is_low_light);
  EXPECT_FALSE(metrics.skin_tone_detected);
  EXPECT_FALSE(metrics.capture_metadata.has_value());
}

TEST_F(AnalysisTests, HalfBlackFrameClipsShadows) {
  cv::Mat pixels(100, 100, CV_8UC3, cv::Scalar::all(128));
  pixels.rowRange(0, 50).setTo(cv::Scalar::all(0));

  MetricsAnalyzer analyzer;
  ImageMetrics    metrics = analyzer.Analyze(ImageBuffer(pixels), std::nullopt);

  EXPECT_GT(metrics.shadow_clipping_percent, 40.0);
  EXPECT_LT(metrics.shadow_clipping_percent, 60.0);
  EXPECT_DOUBLE_EQ(metrics.highlight_clipping_percent, 0.0);
  EXPECT_GT(metrics.contrast_level, 0.4);
}

TEST_F(AnalysisTests, BlownHighlightsAreCounted) {
  cv::Mat pixels(100, 100, CV_8UC3, cv::Scalar::all(255));
  pixels.rowRange(50, 100).setTo(cv::Scalar::all(100));

  MetricsAnalyzer analyzer;
  ImageMetrics    metrics = analyzer.Analyze(ImageBuffer(pixels), std::nullopt);
  EXPECT_NEAR(metrics.highlight_clipping_percent, 50.0, 1e-9);
}

TEST_F(AnalysisTests, DarkSubjectOnBrightBackgroundIsBacklit) {
  cv::Mat pixels(100, 100, CV_8UC3, cv::Scalar::all(220));
  pixels(cv::Rect(30, 30, 40, 40)).setTo(cv::Scalar::all(40));

  MetricsAnalyzer analyzer;
  EXPECT_TRUE(analyzer.Analyze(ImageBuffer(pixels), std::nullopt).is_backlit);
}

TEST_F(AnalysisTests, BacklitRatioComesFromConfig) {
  cv::Mat pixels(100, 100, CV_8UC3, cv::Scalar::all(220));
  pixels(cv::Rect(30, 30, 40, 40)).setTo(cv::Scalar::all(40));

  AnalyzerConfig config;
  config.backlit_ratio = 10.0;
  MetricsAnalyzer analyzer(config);
  EXPECT_FALSE(analyzer.Analyze(ImageBuffer(pixels), std::nullopt).is_backlit);
}

TEST_F(AnalysisTests, SkinColoredFrameDetectsSkin) {
  ImageBuffer     skin(cv::Mat(64, 64, CV_8UC3, cv::Scalar(220, 160, 130)));

  MetricsAnalyzer analyzer;
  ImageMetrics    metrics = analyzer.Analyze(skin, std::nullopt);

  ASSERT_TRUE(metrics.skin_tone_detected);
  ASSERT_TRUE(metrics.skin_tone_hue_range.has_value());
  EXPECT_LE(metrics.skin_tone_hue_range->first, metrics.skin_tone_hue_range->second);
  EXPECT_GT(metrics.saturation_level, 0.0);
}

TEST_F(AnalysisTests, VeryDarkFrameIsLowLight) {
  MetricsAnalyzer analyzer;
  ImageMetrics    metrics = analyzer.Analyze(MakeUniformBuffer(80, 80, 20), std::nullopt);
  EXPECT_TRUE(metrics.is_low_light);
  EXPECT_LT(metrics.exposure_level, -1.0);
}

TEST_F(AnalysisTests, DimFrameNeedsCaptureEvidence) {
  ImageBuffer     dim = MakeUniformBuffer(80, 80, 65);
  MetricsAnalyzer analyzer;
  EXPECT_FALSE(analyzer.Analyze(dim, std::nullopt).is_low_light);

  CaptureMetadata metadata;
  metadata.iso = 1600;
  EXPECT_TRUE(analyzer.Analyze(dim, metadata).is_low_light);

  CaptureMetadata slow;
  slow.exposure_time = 0.25;
  EXPECT_TRUE(analyzer.Analyze(dim, slow).is_low_light);
}

TEST_F(AnalysisTests, HighIsoRaisesNoiseEstimate) {
  ImageBuffer     frame = MakeUniformBuffer(64, 64, 128);
  CaptureMetadata low;
  low.iso = 100;
  CaptureMetadata high;
  high.iso = 3200;

  MetricsAnalyzer analyzer;
  const double    noise_low  = analyzer.Analyze(frame, low).noise_level;
  const double    noise_high = analyzer.Analyze(frame, high).noise_level;
  EXPECT_GT(noise_high, noise_low);
  EXPECT_NEAR(noise_high, 0.4, 1e-9);
}

TEST_F(AnalysisTests, ExposureCompensationShiftsEstimate) {
  ImageBuffer     frame = MakeUniformBuffer(64, 64, 128);
  CaptureMetadata metadata;
  metadata.exposure_compensation = 1.0;

  MetricsAnalyzer analyzer;
  const double    plain       = analyzer.Analyze(frame, std::nullopt).exposure_level;
  const double    compensated = analyzer.Analyze(frame, metadata).exposure_level;
  EXPECT_NEAR(compensated - plain, 1.0, 1e-9);

  ImageMetrics metrics = analyzer.Analyze(frame, metadata);
  ASSERT_TRUE(metrics.capture_metadata.has_value());
  EXPECT_DOUBLE_EQ(metrics.capture_metadata->exposure_compensation.value(), 1.0);
}
