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
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "analysis/image_metrics.hpp"
#include "app/photo_enhancer.hpp"
#include "config/enhancer_config.hpp"
#include "edit/params/adjustment_params.hpp"
#include "io/file/path_validator.hpp"
#include "io/image/image_loader.hpp"
#include "type/type.hpp"

namespace photolift {
enum class ConversionStatus : int { SUCCESS, FAILED, SKIPPED };

auto ConversionStatusToString(ConversionStatus status) -> std::string;

struct ConversionResult {
  image_path_t                        input_path_;
  std::optional<image_path_t>         output_path_;
  ConversionStatus                    status_             = ConversionStatus::FAILED;
  std::string                         error_message_;
  std::optional<ImageMetrics>         metrics_;
  std::optional<AdjustmentParameters> params_;
  double                              processing_seconds_ = 0.0;

  auto IsSuccess() const -> bool { return status_ == ConversionStatus::SUCCESS; }
  auto ToJson() const -> nlohmann::json;
};

struct BatchSummary {
  size_t total_         = 0;
  size_t successful_    = 0;
  size_t failed_        = 0;
  size_t skipped_       = 0;
  double total_seconds_ = 0.0;

  // Percentage of successful files, 0 for an empty batch
  auto   SuccessRate() const -> double;
  auto   ToJson() const -> nlohmann::json;
};

struct BatchResults {
  // Same order as the input list
  std::vector<ConversionResult> results_;
  BatchSummary                  summary_;
};

struct BatchProgress {
  size_t total_     = 0;
  size_t completed_ = 0;
  size_t succeeded_ = 0;
  size_t failed_    = 0;
  size_t skipped_   = 0;
};

using BatchProgressCallback = std::function<void(const BatchProgress&, const ConversionResult&)>;

/**
 * @brief File level front end: decode, enhance and encode one file or a batch of files.
 *
 * Per-file failures never escape. They come back as a FAILED ConversionResult.
 */
class EnhanceService {
 private:
  EnhancerConfig _config;
  ImageLoader    _loader;
  PathValidator  _validator;

  auto           ConvertWith(PhotoEnhancer& enhancer, const image_path_t& input,
                             const image_path_t& output) const -> ConversionResult;

 public:
  explicit EnhanceService(EnhancerConfig config);

  /**
   * @brief Default output location: <output_dir or the input's directory>/<stem>.jpg
   */
  static auto OutputPathFor(const image_path_t&                input,
                            const std::optional<image_path_t>& output_dir) -> image_path_t;

  /**
   * @brief Plan one output path per input. Inputs that would land on the same file get a
   * suffix derived from a hash of their source path, so every planned path is distinct.
   */
  static auto PlanOutputPaths(const std::vector<image_path_t>&   inputs,
                              const std::optional<image_path_t>& output_dir)
      -> std::vector<image_path_t>;

  auto        ConvertFile(const image_path_t& input, const image_path_t& output) const
      -> ConversionResult;
  auto        ConvertFile(PhotoEnhancer& enhancer, const image_path_t& input,
                          const image_path_t& output) const -> ConversionResult;

  /**
   * @brief Convert every input on a pool of worker threads.
   *
   * @param inputs
   * @param output_dir Directory for the outputs, each input's own directory if empty
   * @param progress Called once per finished file, from a worker thread
   * @return BatchResults in input order
   */
  auto        ConvertBatch(const std::vector<image_path_t>&   inputs,
                           const std::optional<image_path_t>& output_dir,
                           BatchProgressCallback progress = nullptr) const -> BatchResults;

  auto        GetConfig() const -> const EnhancerConfig& { return _config; }
};
};  // namespace photolift
