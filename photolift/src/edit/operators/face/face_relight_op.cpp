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

#include "edit/operators/face/face_relight_op.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include "edit/operators/utils/functions.hpp"

namespace photolift {
namespace {
constexpr double kFaceBrightLimit     = 0.62;
constexpr double kBrightReferenceMin  = 0.72;
constexpr double kSceneGapTrigger     = 0.05;
constexpr double kBrightGapTrigger    = 0.18;
constexpr double kAutoStrengthMax     = 0.45;

constexpr float  kDarkPivot           = 0.75f;
constexpr float  kHighlightGuardStart = 0.95f;
constexpr float  kHighlightGuardWidth = 0.2f;
constexpr float  kGainScale           = 0.9f;

/**
 * @brief Linearly interpolated quantile, matching the usual "linear" definition
 */
auto Quantile(const cv::Mat& plane, double q) -> double {
  std::vector<float> values;
  values.reserve(plane.total());
  for (int r = 0; r < plane.rows; ++r) {
    const float* row = plane.ptr<float>(r);
    values.insert(values.end(), row, row + plane.cols);
  }
  if (values.empty()) {
    return 0.0;
  }

  const double position = q * static_cast<double>(values.size() - 1);
  const size_t lower    = static_cast<size_t>(std::floor(position));
  const double fraction = position - static_cast<double>(lower);

  std::nth_element(values.begin(), values.begin() + lower, values.end());
  const double lower_value = values[lower];
  if (fraction <= 0.0 || lower + 1 >= values.size()) {
    return lower_value;
  }
  // Everything after the nth element is >= it; the next order statistic is their minimum
  const double upper_value = *std::min_element(values.begin() + lower + 1, values.end());
  return lower_value + (upper_value - lower_value) * fraction;
}
}  // namespace

FaceRelightOp::FaceRelightOp(double strength, std::vector<FaceRegion> regions, int min_face_size)
    : _strength(strength), _regions(std::move(regions)), _min_face_size(min_face_size) {}

FaceRelightOp::FaceRelightOp(const nlohmann::json& params) { SetParams(params); }

auto FaceRelightOp::EstimateAutoStrength(const cv::Mat&                 working,
                                         const std::vector<FaceRegion>& regions) -> double {
  if (regions.empty() || working.empty()) {
    return 0.0;
  }

  cv::Mat      luminance  = ComputeLuminance(working);
  const double scene_mean = cv::mean(luminance)[0];
  const double bright_ref = Quantile(luminance, 0.90);

  const cv::Rect bounds(0, 0, luminance.cols, luminance.rows);
  double         face_sum   = 0.0;
  int            face_count = 0;
  for (const auto& region : regions) {
    if (region.width <= 0 || region.height <= 0) continue;
    const cv::Rect roi = region.ToRect() & bounds;
    if (roi.empty()) continue;
    face_sum += cv::mean(luminance(roi))[0];
    ++face_count;
  }
  if (face_count == 0) {
    return 0.0;
  }

  const double face_mean = face_sum / face_count;
  if (face_mean >= kFaceBrightLimit || bright_ref < kBrightReferenceMin) {
    return 0.0;
  }

  const double scene_gap  = std::max(0.0, scene_mean - face_mean);
  const double bright_gap = std::max(0.0, bright_ref - face_mean);
  if (scene_gap < kSceneGapTrigger && bright_gap < kBrightGapTrigger) {
    return 0.0;
  }

  return Clamp(0.14 + scene_gap * 0.9 + bright_gap * 0.35, 0.0, kAutoStrengthMax);
}

auto FaceRelightOp::BuildMask(const cv::Size& size, const std::vector<FaceRegion>& regions,
                              int min_face_size) -> cv::Mat {
  cv::Mat mask = cv::Mat::zeros(size, CV_32FC1);

  for (const auto& region : regions) {
    if (region.width < min_face_size || region.height < min_face_size) continue;

    const double center_x = region.x + region.width * 0.5;
    const double center_y = region.y + region.height * 0.52;
    const double radius_x = std::max(4.0, region.width * 0.95);
    const double radius_y = std::max(4.0, region.height * 1.20);

    const int    left     = std::max(0, static_cast<int>(center_x - radius_x * 1.6));
    const int    right    = std::min(size.width, static_cast<int>(center_x + radius_x * 1.6));
    const int    top      = std::max(0, static_cast<int>(center_y - radius_y * 1.4));
    const int    bottom   = std::min(size.height, static_cast<int>(center_y + radius_y * 1.4));
    if (left >= right || top >= bottom) continue;

    for (int y = top; y < bottom; ++y) {
      float*       row = mask.ptr<float>(y);
      const double dy  = (y - center_y) / radius_y;
      for (int x = left; x < right; ++x) {
        const double dx      = (x - center_x) / radius_x;
        const double falloff = std::clamp(1.0 - (dx * dx + dy * dy), 0.0, 1.0);
        const float  weight  = static_cast<float>(std::pow(falloff, 1.5));
        row[x]               = std::max(row[x], weight);
      }
    }
  }
  return mask;
}

void FaceRelightOp::Apply(std::shared_ptr<ImageBuffer> input) {
  cv::Mat& img      = input->GetCPUData();

  cv::Mat  mask     = BuildMask(img.size(), _regions, _min_face_size);
  double   mask_max = 0.0;
  cv::minMaxLoc(mask, nullptr, &mask_max);
  if (mask_max <= 0.0) {
    return;
  }

  const float strength = static_cast<float>(_strength);
  img.forEach<cv::Vec3f>([&](cv::Vec3f& pixel, const int* pos) {
    const float weight = mask.at<float>(pos[0], pos[1]);
    if (weight <= 0.0f) {
      return;
    }
    const float luminance = Luma(pixel);
    const float dark      = std::pow(Clamp01((kDarkPivot - luminance) / kDarkPivot), 0.8f);
    const float guard     = Clamp01((kHighlightGuardStart - luminance) / kHighlightGuardWidth);
    const float gain      = 1.0f + strength * weight * dark * guard * kGainScale;
    pixel[0]              = Clamp01(pixel[0] * gain);
    pixel[1]              = Clamp01(pixel[1] * gain);
    pixel[2]              = Clamp01(pixel[2] * gain);
  });
}

auto FaceRelightOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  nlohmann::json inner;

  inner["strength"]      = _strength;
  inner["regions"]       = FaceRegionsToJson(_regions);
  inner["min_face_size"] = _min_face_size;

  o[_script_name]        = inner;
  return o;
}

void FaceRelightOp::SetParams(const nlohmann::json& params) {
  _strength = 0.0;
  _regions.clear();
  if (!params.contains(_script_name)) {
    return;
  }
  const nlohmann::json& inner = params[_script_name];
  if (inner.contains("strength")) {
    _strength = inner["strength"].get<double>();
  }
  if (inner.contains("min_face_size")) {
    _min_face_size = inner["min_face_size"].get<int>();
  }
  if (inner.contains("regions")) {
    for (const auto& r : inner["regions"]) {
      _regions.push_back({r.at(0).get<int>(), r.at(1).get<int>(), r.at(2).get<int>(),
                          r.at(3).get<int>()});
    }
  }
}

auto FaceRelightOp::IsNoOp() const -> bool { return _regions.empty() || _strength <= 0.0; }
};  // namespace photolift
