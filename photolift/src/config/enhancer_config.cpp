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

#include "config/enhancer_config.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

namespace photolift {
namespace {
auto ParseQuality(std::string_view text) -> std::optional<int> {
  int         value = 0;
  const char* begin = text.data();
  const char* end   = text.data() + text.size();
  auto [ptr, ec]    = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || !IsValidQuality(value)) {
    return std::nullopt;
  }
  return value;
}

auto QualityFromEnv() -> std::optional<int> {
  const char* env = std::getenv(PHOTOLIFT_QUALITY_ENV);
  if (env == nullptr) {
    return std::nullopt;
  }
  return ParseQuality(env);
}

void RequirePositive(double value, const char* name) {
  if (!(value > 0.0)) {
    throw std::invalid_argument(std::string("EnhancerConfig: ") + name + " must be positive");
  }
}

void RequireNonNegative(double value, const char* name) {
  if (!(value >= 0.0)) {
    throw std::invalid_argument(std::string("EnhancerConfig: ") + name + " must be non-negative");
  }
}
}  // namespace

auto IsValidQuality(int quality) -> bool { return quality >= 0 && quality <= 100; }

auto ResolveOutputQuality(std::optional<int> requested) -> int {
  if (requested && IsValidQuality(*requested)) {
    return *requested;
  }
  return QualityFromEnv().value_or(EnhancerConfig::kDefaultQuality);
}

auto AnalyzerConfig::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["shadow_clip_level"]    = shadow_clip_level;
  j["highlight_clip_level"] = highlight_clip_level;
  j["skin_hue_min"]         = skin_hue_min;
  j["skin_hue_max"]         = skin_hue_max;
  j["skin_saturation_min"]  = skin_saturation_min;
  j["skin_saturation_max"]  = skin_saturation_max;
  j["skin_value_min"]       = skin_value_min;
  j["skin_min_percent"]     = skin_min_percent;
  j["backlit_ratio"]        = backlit_ratio;
  j["low_light_mean"]       = low_light_mean;
  j["very_dark_mean"]       = very_dark_mean;
  j["high_iso"]             = high_iso;
  j["slow_shutter_seconds"] = slow_shutter_seconds;
  j["contrast_normalizer"]  = contrast_normalizer;
  j["sharpness_normalizer"] = sharpness_normalizer;
  j["noise_normalizer"]     = noise_normalizer;
  j["iso_noise_reference"]  = iso_noise_reference;
  return j;
}

void AnalyzerConfig::FromJson(const nlohmann::json& j) {
  const AnalyzerConfig d;
  shadow_clip_level    = j.value("shadow_clip_level", d.shadow_clip_level);
  highlight_clip_level = j.value("highlight_clip_level", d.highlight_clip_level);
  skin_hue_min         = j.value("skin_hue_min", d.skin_hue_min);
  skin_hue_max         = j.value("skin_hue_max", d.skin_hue_max);
  skin_saturation_min  = j.value("skin_saturation_min", d.skin_saturation_min);
  skin_saturation_max  = j.value("skin_saturation_max", d.skin_saturation_max);
  skin_value_min       = j.value("skin_value_min", d.skin_value_min);
  skin_min_percent     = j.value("skin_min_percent", d.skin_min_percent);
  backlit_ratio        = j.value("backlit_ratio", d.backlit_ratio);
  low_light_mean       = j.value("low_light_mean", d.low_light_mean);
  very_dark_mean       = j.value("very_dark_mean", d.very_dark_mean);
  high_iso             = j.value("high_iso", d.high_iso);
  slow_shutter_seconds = j.value("slow_shutter_seconds", d.slow_shutter_seconds);
  contrast_normalizer  = j.value("contrast_normalizer", d.contrast_normalizer);
  sharpness_normalizer = j.value("sharpness_normalizer", d.sharpness_normalizer);
  noise_normalizer     = j.value("noise_normalizer", d.noise_normalizer);
  iso_noise_reference  = j.value("iso_noise_reference", d.iso_noise_reference);
}

auto LocatorConfig::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["max_detection_side"] = max_detection_side;
  j["min_face_fraction"]  = min_face_fraction;
  j["min_face_pixels"]    = min_face_pixels;
  j["percent_threshold"]  = percent_threshold;
  return j;
}

void LocatorConfig::FromJson(const nlohmann::json& j) {
  const LocatorConfig d;
  max_detection_side = j.value("max_detection_side", d.max_detection_side);
  min_face_fraction  = j.value("min_face_fraction", d.min_face_fraction);
  min_face_pixels    = j.value("min_face_pixels", d.min_face_pixels);
  percent_threshold  = j.value("percent_threshold", d.percent_threshold);
}

auto ApplierConfig::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["auto_highlight_trigger_percent"] = auto_highlight_trigger_percent;
  j["auto_highlight_base"]            = auto_highlight_base;
  j["auto_highlight_slope"]           = auto_highlight_slope;
  j["auto_highlight_max"]             = auto_highlight_max;
  j["face_relight_min_trigger"]       = face_relight_min_trigger;
  j["face_relight_max"]               = face_relight_max;
  j["min_face_size"]                  = min_face_size;
  return j;
}

void ApplierConfig::FromJson(const nlohmann::json& j) {
  const ApplierConfig d;
  auto_highlight_trigger_percent =
      j.value("auto_highlight_trigger_percent", d.auto_highlight_trigger_percent);
  auto_highlight_base      = j.value("auto_highlight_base", d.auto_highlight_base);
  auto_highlight_slope     = j.value("auto_highlight_slope", d.auto_highlight_slope);
  auto_highlight_max       = j.value("auto_highlight_max", d.auto_highlight_max);
  face_relight_min_trigger = j.value("face_relight_min_trigger", d.face_relight_min_trigger);
  face_relight_max         = j.value("face_relight_max", d.face_relight_max);
  min_face_size            = j.value("min_face_size", d.min_face_size);
}

auto EnhancerConfig::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["analyzer"]     = analyzer_.ToJson();
  j["locator"]      = locator_.ToJson();
  j["applier"]      = applier_.ToJson();
  j["style"]        = style_.ToJson();
  if (quality_) {
    j["quality"] = *quality_;
  }
  j["no_overwrite"] = no_overwrite_;
  j["workers"]      = worker_count_;
  if (cascade_path_) {
    j["cascade_path"] = cascade_path_->string();
  }
  return j;
}

void EnhancerConfig::FromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("EnhancerConfig: configuration must be a JSON object");
  }
  if (j.contains("analyzer")) analyzer_.FromJson(j.at("analyzer"));
  if (j.contains("locator")) locator_.FromJson(j.at("locator"));
  if (j.contains("applier")) applier_.FromJson(j.at("applier"));
  if (j.contains("style")) style_.FromJson(j.at("style"));

  quality_.reset();
  if (auto it = j.find("quality"); it != j.end() && !it->is_null()) {
    if (!it->is_number_integer()) {
      throw std::invalid_argument("EnhancerConfig: quality must be an integer");
    }
    quality_ = it->get<int>();
  }
  no_overwrite_ = j.value("no_overwrite", false);

  const int64_t workers = j.value("workers", int64_t{0});
  if (workers < 0) {
    throw std::invalid_argument("EnhancerConfig: workers must be non-negative");
  }
  worker_count_ = static_cast<size_t>(workers);

  cascade_path_.reset();
  if (auto it = j.find("cascade_path"); it != j.end() && it->is_string()) {
    cascade_path_ = file_path_t(it->get<std::string>());
  }
  Validate();
}

void EnhancerConfig::Validate() const {
  if (quality_ && !IsValidQuality(*quality_)) {
    throw std::invalid_argument("EnhancerConfig: quality must be within [0, 100], got " +
                                std::to_string(*quality_));
  }
  RequirePositive(analyzer_.contrast_normalizer, "analyzer.contrast_normalizer");
  RequirePositive(analyzer_.sharpness_normalizer, "analyzer.sharpness_normalizer");
  RequirePositive(analyzer_.noise_normalizer, "analyzer.noise_normalizer");
  RequirePositive(analyzer_.iso_noise_reference, "analyzer.iso_noise_reference");
  RequirePositive(analyzer_.backlit_ratio, "analyzer.backlit_ratio");
  RequirePositive(locator_.max_detection_side, "locator.max_detection_side");
  RequirePositive(locator_.min_face_pixels, "locator.min_face_pixels");
  RequireNonNegative(locator_.min_face_fraction, "locator.min_face_fraction");
  RequireNonNegative(applier_.auto_highlight_max, "applier.auto_highlight_max");
  RequireNonNegative(applier_.face_relight_min_trigger, "applier.face_relight_min_trigger");
  RequireNonNegative(applier_.face_relight_max, "applier.face_relight_max");
  RequireNonNegative(applier_.min_face_size, "applier.min_face_size");
}

auto EnhancerConfig::OutputQuality() const -> int { return ResolveOutputQuality(quality_); }

auto EnhancerConfig::ResolvedWorkerCount() const -> size_t {
  if (worker_count_ > 0) {
    return worker_count_;
  }
  const unsigned int hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : hw;
}

auto EnhancerConfig::LoadFromFile(const file_path_t& path) -> EnhancerConfig {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("EnhancerConfig: cannot open " + path.string());
  }
  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument("EnhancerConfig: malformed JSON in " + path.string() + ": " +
                                e.what());
  }
  EnhancerConfig config;
  config.FromJson(j);
  return config;
}
};  // namespace photolift
