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

#include <opencv2/core.hpp>
#include <string_view>
#include <vector>

#include "edit/operators/op_base.hpp"
#include "face/face_region.hpp"
#include "type/type.hpp"

namespace photolift {
/**
 * @brief Local brightening of dark faces in backlit scenes.
 *
 * Each face gets an elliptical falloff centered slightly below the middle of its rectangle.
 * The gain is weighted toward dark pixels and fades out before the highlights, so the lit
 * background is left alone.
 */
class FaceRelightOp : public OperatorBase<FaceRelightOp> {
 private:
  double                  _strength      = 0.0;
  std::vector<FaceRegion> _regions;
  // Faces narrower or shorter than this are ignored
  int                     _min_face_size = 8;

 public:
  static constexpr std::string_view _script_name   = "face_relight";
  static constexpr OperatorType     _operator_type = OperatorType::FACE_RELIGHT;

  FaceRelightOp()                                   = default;
  FaceRelightOp(double strength, std::vector<FaceRegion> regions, int min_face_size = 8);
  explicit FaceRelightOp(const nlohmann::json& params);

  /**
   * @brief Conservative strength for faces much darker than the rest of the scene.
   *
   * Compares the mean face luminance against the scene mean and the 90th percentile of the
   * luminance. Returns 0 for bright faces (mean >= 0.62), dim scenes (reference < 0.72) or
   * small gaps.
   *
   * @return double in [0, 0.45]
   */
  static auto EstimateAutoStrength(const cv::Mat& working, const std::vector<FaceRegion>& regions)
      -> double;

  /**
   * @brief Per-pixel maximum of the elliptical falloff of every face large enough to relight
   *
   * @return CV_32FC1 mask in [0, 1] of the given size
   */
  static auto BuildMask(const cv::Size& size, const std::vector<FaceRegion>& regions,
                        int min_face_size) -> cv::Mat;

  auto        GetStrength() const -> double { return _strength; }
  auto        GetRegions() const -> const std::vector<FaceRegion>& { return _regions; }

  void        Apply(std::shared_ptr<ImageBuffer> input) override;
  auto        GetParams() const -> nlohmann::json override;
  void        SetParams(const nlohmann::json& params) override;
  auto        IsNoOp() const -> bool override;
};
};  // namespace photolift
