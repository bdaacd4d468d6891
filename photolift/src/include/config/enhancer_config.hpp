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

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>

#include "edit/params/adjustment_params.hpp"
#include "type/type.hpp"

namespace photolift {
struct AnalyzerConfig {
  // Luminance on the 8-bit scale
  int    shadow_clip_level      = 5;
  int    highlight_clip_level   = 250;

  // Skin mask on OpenCV's 0-179 hue scale
  int    skin_hue_min           = 0;
  int    skin_hue_max           = 25;
  int    skin_saturation_min    = 20;
  int    skin_saturation_max    = 170;
  int    skin_value_min         = 50;
  double skin_min_percent       = 5.0;

  double backlit_ratio          = 1.5;

  double low_light_mean         = 0.3;
  double very_dark_mean         = 0.2;
  int    high_iso               = 800;
  double slow_shutter_seconds   = 1.0 / 30.0;

  double contrast_normalizer    = 128.0;
  double sharpness_normalizer   = 1000.0;
  double noise_normalizer       = 20.0;
  double iso_noise_reference    = 3200.0;

  auto   ToJson() const -> nlohmann::json;
  void   FromJson(const nlohmann::json& j);
};

struct LocatorConfig {
  int    max_detection_side  = 1280;
  double min_face_fraction   = 0.04;
  int    min_face_pixels     = 24;
  // Embedded area values above this magnitude are percentages
  double percent_threshold   = 2.0;

  auto   ToJson() const -> nlohmann::json;
  void   FromJson(const nlohmann::json& j);
};

struct ApplierConfig {
  double auto_highlight_trigger_percent = 0.7;
  double auto_highlight_base            = 0.10;
  double auto_highlight_slope           = 0.04;
  double auto_highlight_max             = 0.45;

  double face_relight_min_trigger       = 0.08;
  double face_relight_max               = 0.6;
  int    min_face_size                  = 8;

  auto   ToJson() const -> nlohmann::json;
  void   FromJson(const nlohmann::json& j);
};

/**
 * @brief Immutable settings shared by every component of one enhancer instance.
 *
 * Missing keys in a JSON document keep their defaults. An out-of-range quality or a
 * negative threshold throws std::invalid_argument.
 */
struct EnhancerConfig {
  static constexpr int          kDefaultQuality = 100;

  AnalyzerConfig                analyzer_;
  LocatorConfig                 locator_;
  ApplierConfig                 applier_;
  StylePreferences              style_;

  // Unset until a config file or the command line names one, see OutputQuality()
  std::optional<int>            quality_;
  bool                          no_overwrite_   = false;
  // 0 picks std::thread::hardware_concurrency()
  size_t                        worker_count_   = 0;
  std::optional<file_path_t>    cascade_path_;

  auto                          ToJson() const -> nlohmann::json;
  void                          FromJson(const nlohmann::json& j);

  void                          Validate() const;
  auto                          OutputQuality() const -> int;
  auto                          ResolvedWorkerCount() const -> size_t;

  static auto                   LoadFromFile(const file_path_t& path) -> EnhancerConfig;
};

auto IsValidQuality(int quality) -> bool;

/**
 * @brief Resolve the output JPEG quality.
 *
 * A valid explicit value wins, then a valid PHOTOLIFT_QUALITY environment value, then 100.
 */
auto ResolveOutputQuality(std::optional<int> requested) -> int;
};  // namespace photolift
