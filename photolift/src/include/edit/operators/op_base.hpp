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
#include <string>

#include "image/image_buffer.hpp"
#include "type/type.hpp"

namespace photolift {
enum class OperatorType : int {
  EXPOSURE,
  CONTRAST,
  SHADOWS,
  HIGHLIGHTS,
  FACE_RELIGHT,
  SATURATION,
  NOISE_REDUCTION,
  SHARPEN,
  UNKNOWN
};

class IOperatorBase {
 public:
  /**
   * @brief Apply the adjustment from the operator in place.
   *
   * The buffer holds the CV_32FC3 working copy with samples in [0, 1]; every operator leaves
   * it in that range.
   *
   * @param input
   */
  virtual void Apply(std::shared_ptr<ImageBuffer> input)    = 0;
  /**
   * @brief Get JSON parameter for this operator
   *
   * @return nlohmann::json
   */
  virtual auto GetParams() const -> nlohmann::json          = 0;
  /**
   * @brief Set the parameters of this operator from JSON
   *
   * @param params
   */
  virtual void SetParams(const nlohmann::json&)             = 0;

  /**
   * @brief True when the current parameters leave the image unchanged and the stage is skipped
   */
  virtual auto IsNoOp() const -> bool                       = 0;

  virtual auto GetScriptName() const -> std::string         = 0;

  virtual auto GetOperatorType() const -> OperatorType      = 0;

  virtual ~IOperatorBase()                                  = default;
};
/**
 * @brief A base class for all operators
 *
 * @tparam Derived CRTP derived class
 */
template <typename Derived>
class OperatorBase : public IOperatorBase {
 public:
  /**
   * @brief Get the script name of the operator (for JSON serialization)
   *
   * @return std::string
   */
  auto GetScriptName() const -> std::string override { return std::string(Derived::_script_name); }

  auto GetOperatorType() const -> OperatorType override { return Derived::_operator_type; }
};

// Changes below this magnitude are skipped
constexpr double kStageSkipEpsilon = 0.01;
};  // namespace photolift
