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

#include <memory>
#include <nlohmann/json.hpp>
#include <vector>

#include "config/enhancer_config.hpp"
#include "edit/operators/op_base.hpp"
#include "edit/params/adjustment_params.hpp"
#include "face/face_region.hpp"
#include "image/image_buffer.hpp"

namespace photolift {
struct ApplyResult {
  ImageBuffer          enhanced_;
  /**
   * @brief The parameters as actually applied: highlight recovery includes the automatic
   * boost, face relight strength is the re-estimated value or 0 when the stage did not run
   */
  AdjustmentParameters effective_params_;
  // GetParams() of every stage that ran, in order
  nlohmann::json       applied_stages_ = nlohmann::json::array();
};

/**
 * @brief Runs the eight enhancement stages over an 8-bit RGB buffer.
 *
 * The order is fixed: exposure, contrast, shadow lift, highlight recovery, face relight,
 * saturation, noise reduction, sharpen. The work happens on a float copy in [0, 1] that is
 * clamped and rounded back to 8 bits at the end. The caller's buffer and parameters are
 * never modified.
 */
class TransformApplier {
 private:
  ApplierConfig _config;

  static void   RunStage(IOperatorBase& op, const std::shared_ptr<ImageBuffer>& working,
                         nlohmann::json& applied_stages);

 public:
  TransformApplier() = default;
  explicit TransformApplier(ApplierConfig config);

  /**
   * @brief Apply the adjustment vector
   *
   * @param input CV_8UC3 RGB buffer
   * @param params
   * @param face_regions Faces from the locator, may be empty
   * @return ApplyResult
   * @throws std::invalid_argument when the input is not an 8-bit, 3-channel buffer
   */
  auto Apply(const ImageBuffer& input, const AdjustmentParameters& params,
             const std::vector<FaceRegion>& face_regions) const -> ApplyResult;

  auto GetConfig() const -> const ApplierConfig& { return _config; }
};
};  // namespace photolift
