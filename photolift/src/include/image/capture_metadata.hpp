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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace photolift {
enum class SceneType : int { STANDARD, LANDSCAPE, PORTRAIT, NIGHT, UNKNOWN };

enum class MeteringMode : int {
  UNKNOWN,
  AVERAGE,
  CENTER_WEIGHTED_AVERAGE,
  SPOT,
  MULTI_SPOT,
  PATTERN,
  PARTIAL,
  OTHER
};

auto SceneTypeToString(SceneType type) -> std::string;
auto SceneTypeFromString(const std::string& name) -> SceneType;
auto MeteringModeToString(MeteringMode mode) -> std::string;
auto MeteringModeFromString(const std::string& name) -> MeteringMode;

/**
 * @brief Typed capture settings decoded from EXIF at the boundary.
 *
 * Every field is optional; an absent tag stays absent and is never read as zero.
 */
class CaptureMetadata {
 public:
  std::optional<int>          iso;
  // Seconds
  std::optional<double>       exposure_time;
  std::optional<double>       f_number;
  // EV
  std::optional<double>       exposure_compensation;
  std::optional<bool>         flash_fired;
  std::optional<SceneType>    scene_type;
  std::optional<double>       brightness_value;
  std::optional<MeteringMode> metering_mode;

  CaptureMetadata() = default;

  auto IsEmpty() const -> bool;

  auto ToJson() const -> nlohmann::json;
  void FromJson(const nlohmann::json& metadata_json);

  bool operator==(const CaptureMetadata& other) const = default;
};
};  // namespace photolift
