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

#include "image/capture_metadata.hpp"

#include <array>
#include <utility>

namespace photolift {
namespace {
constexpr std::array<std::pair<SceneType, const char*>, 5> kSceneTypeNames = {{
    {SceneType::STANDARD, "standard"},
    {SceneType::LANDSCAPE, "landscape"},
    {SceneType::PORTRAIT, "portrait"},
    {SceneType::NIGHT, "night"},
    {SceneType::UNKNOWN, "unknown"},
}};

constexpr std::array<std::pair<MeteringMode, const char*>, 8> kMeteringModeNames = {{
    {MeteringMode::UNKNOWN, "unknown"},
    {MeteringMode::AVERAGE, "average"},
    {MeteringMode::CENTER_WEIGHTED_AVERAGE, "center_weighted_average"},
    {MeteringMode::SPOT, "spot"},
    {MeteringMode::MULTI_SPOT, "multi_spot"},
    {MeteringMode::PATTERN, "pattern"},
    {MeteringMode::PARTIAL, "partial"},
    {MeteringMode::OTHER, "other"},
}};

template <typename T>
void ReadOptional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    out.reset();
    return;
  }
  out = it->template get<T>();
}
}  // namespace

auto SceneTypeToString(SceneType type) -> std::string {
  for (const auto& [value, name] : kSceneTypeNames) {
    if (value == type) return name;
  }
  return "unknown";
}

auto SceneTypeFromString(const std::string& name) -> SceneType {
  for (const auto& [value, value_name] : kSceneTypeNames) {
    if (name == value_name) return value;
  }
  return SceneType::UNKNOWN;
}

auto MeteringModeToString(MeteringMode mode) -> std::string {
  for (const auto& [value, name] : kMeteringModeNames) {
    if (value == mode) return name;
  }
  return "unknown";
}

auto MeteringModeFromString(const std::string& name) -> MeteringMode {
  for (const auto& [value, value_name] : kMeteringModeNames) {
    if (name == value_name) return value;
  }
  return MeteringMode::UNKNOWN;
}

auto CaptureMetadata::IsEmpty() const -> bool {
  return !iso && !exposure_time && !f_number && !exposure_compensation && !flash_fired &&
         !scene_type && !brightness_value && !metering_mode;
}

auto CaptureMetadata::ToJson() const -> nlohmann::json {
  nlohmann::json metadata_json = nlohmann::json::object();
  if (iso) metadata_json["ISO"] = *iso;
  if (exposure_time) metadata_json["ExposureTime"] = *exposure_time;
  if (f_number) metadata_json["FNumber"] = *f_number;
  if (exposure_compensation) metadata_json["ExposureCompensation"] = *exposure_compensation;
  if (flash_fired) metadata_json["FlashFired"] = *flash_fired;
  if (scene_type) metadata_json["SceneType"] = SceneTypeToString(*scene_type);
  if (brightness_value) metadata_json["BrightnessValue"] = *brightness_value;
  if (metering_mode) metadata_json["MeteringMode"] = MeteringModeToString(*metering_mode);
  return metadata_json;
}

void CaptureMetadata::FromJson(const nlohmann::json& metadata_json) {
  ReadOptional(metadata_json, "ISO", iso);
  ReadOptional(metadata_json, "ExposureTime", exposure_time);
  ReadOptional(metadata_json, "FNumber", f_number);
  ReadOptional(metadata_json, "ExposureCompensation", exposure_compensation);
  ReadOptional(metadata_json, "FlashFired", flash_fired);
  ReadOptional(metadata_json, "BrightnessValue", brightness_value);

  std::optional<std::string> scene_name;
  ReadOptional(metadata_json, "SceneType", scene_name);
  scene_type.reset();
  if (scene_name) scene_type = SceneTypeFromString(*scene_name);

  std::optional<std::string> metering_name;
  ReadOptional(metadata_json, "MeteringMode", metering_name);
  metering_mode.reset();
  if (metering_name) metering_mode = MeteringModeFromString(*metering_name);
}
};  // namespace photolift
