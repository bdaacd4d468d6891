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

#include "app/enhance_service.hpp"

#include <easy/profiler.h>
#include <xxhash.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <future>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <utility>

#include "concurrency/thread_pool.hpp"
#include "io/image/image_writer.hpp"

namespace photolift {
namespace {
using Clock = std::chrono::steady_clock;

auto SecondsSince(Clock::time_point start) -> double {
  return std::chrono::duration<double>(Clock::now() - start).count();
}

auto SourceKey(const image_path_t& input) -> std::string {
  std::error_code ec;
  auto            resolved = std::filesystem::weakly_canonical(input, ec);
  if (ec) {
    resolved = std::filesystem::absolute(input, ec);
  }
  return ec ? input.string() : resolved.string();
}

/**
 * @brief <stem>_<8 hex digits of the source hash>[_index].jpg next to the base path
 */
auto WithCollisionSuffix(const image_path_t& base, const image_path_t& input, size_t index)
    -> image_path_t {
  const std::string key  = SourceKey(input);
  const uint64_t    hash = XXH3_64bits(key.data(), key.size());
  char              hex[9];
  std::snprintf(hex, sizeof(hex), "%08x", static_cast<unsigned int>(hash & 0xFFFFFFFFu));

  std::string name = base.stem().string() + "_" + hex;
  if (index > 0) {
    name += "_" + std::to_string(index);
  }
  name += base.extension().string();
  return base.parent_path() / name;
}
}  // namespace

auto ConversionStatusToString(ConversionStatus status) -> std::string {
  switch (status) {
    case ConversionStatus::SUCCESS:
      return "success";
    case ConversionStatus::FAILED:
      return "failed";
    case ConversionStatus::SKIPPED:
      return "skipped";
  }
  return "unknown";
}

auto ConversionResult::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["input_path"]         = input_path_.string();
  j["output_path"]        = output_path_ ? nlohmann::json(output_path_->string()) : nullptr;
  j["status"]             = ConversionStatusToString(status_);
  j["error_message"]      = error_message_.empty() ? nlohmann::json(nullptr)
                                                   : nlohmann::json(error_message_);
  j["metrics"]            = metrics_ ? metrics_->ToJson() : nlohmann::json(nullptr);
  j["params"]             = params_ ? params_->ToJson() : nlohmann::json(nullptr);
  j["processing_seconds"] = processing_seconds_;
  return j;
}

auto BatchSummary::SuccessRate() const -> double {
  if (total_ == 0) return 0.0;
  return static_cast<double>(successful_) / static_cast<double>(total_) * 100.0;
}

auto BatchSummary::ToJson() const -> nlohmann::json {
  return {{"total", total_},
          {"successful", successful_},
          {"failed", failed_},
          {"skipped", skipped_},
          {"total_seconds", total_seconds_},
          {"success_rate", SuccessRate()}};
}

EnhanceService::EnhanceService(EnhancerConfig config)
    : _config(std::move(config)), _loader(XmpRegionParser(_config.locator_.percent_threshold)) {
  _config.Validate();
  XmpRegionParser::InitializeToolkit();
}

auto EnhanceService::OutputPathFor(const image_path_t&                input,
                                   const std::optional<image_path_t>& output_dir)
    -> image_path_t {
  image_path_t name = input.stem();
  name += ".jpg";
  if (output_dir.has_value() && !output_dir->empty()) {
    return *output_dir / name;
  }
  return input.parent_path() / name;
}

auto EnhanceService::PlanOutputPaths(const std::vector<image_path_t>&   inputs,
                                     const std::optional<image_path_t>& output_dir)
    -> std::vector<image_path_t> {
  std::vector<image_path_t> planned;
  planned.reserve(inputs.size());
  std::set<image_path_t> used;

  for (const auto& input : inputs) {
    const image_path_t base   = OutputPathFor(input, output_dir).lexically_normal();
    image_path_t       output = base;
    size_t             index  = 0;
    while (used.count(output) > 0) {
      output = WithCollisionSuffix(base, input, index++);
    }
    if (output != base) {
      std::cerr << "EnhanceService: output path collision for " << input.filename().string()
                << ", using " << output.filename().string() << " instead of "
                << base.filename().string() << std::endl;
    }
    used.insert(output);
    planned.push_back(std::move(output));
  }
  return planned;
}

auto EnhanceService::ConvertFile(const image_path_t& input, const image_path_t& output) const
    -> ConversionResult {
  const auto start = Clock::now();
  try {
    PhotoEnhancer enhancer(_config);
    return ConvertWith(enhancer, input, output);
  } catch (const std::exception& e) {
    // Detector construction is the only thing left outside ConvertWith
    ConversionResult result;
    result.input_path_         = input;
    result.status_             = ConversionStatus::FAILED;
    result.error_message_      = std::string("Conversion failed: ") + e.what();
    result.processing_seconds_ = SecondsSince(start);
    std::cerr << "EnhanceService: " << input.string() << ": " << result.error_message_
              << std::endl;
    return result;
  }
}

auto EnhanceService::ConvertFile(PhotoEnhancer& enhancer, const image_path_t& input,
                                 const image_path_t& output) const -> ConversionResult {
  return ConvertWith(enhancer, input, output);
}

auto EnhanceService::ConvertWith(PhotoEnhancer& enhancer, const image_path_t& input,
                                 const image_path_t& output) const -> ConversionResult {
  EASY_FUNCTION();
  const auto       start = Clock::now();
  ConversionResult result;
  result.input_path_ = input;

  if (auto input_check = _validator.ValidateInput(input); !input_check.valid_) {
    result.status_             = ConversionStatus::FAILED;
    result.error_message_      = std::move(input_check.error_message_);
    result.processing_seconds_ = SecondsSince(start);
    std::cerr << "EnhanceService: " << input.string() << ": " << result.error_message_
              << std::endl;
    return result;
  }

  std::error_code ec;
  if (_config.no_overwrite_ && std::filesystem::exists(output, ec)) {
    result.output_path_        = output;
    result.status_             = ConversionStatus::SKIPPED;
    result.error_message_      = "Output file already exists (no-overwrite enabled)";
    result.processing_seconds_ = SecondsSince(start);
    return result;
  }

  if (auto output_check = _validator.ValidateOutput(output); !output_check.valid_) {
    result.status_             = ConversionStatus::FAILED;
    result.error_message_      = std::move(output_check.error_message_);
    result.processing_seconds_ = SecondsSince(start);
    std::cerr << "EnhanceService: " << output.string() << ": " << result.error_message_
              << std::endl;
    return result;
  }

  try {
    DecodedImage  decoded  = _loader.LoadFromPath(input);
    EnhanceResult enhanced = enhancer.Enhance(decoded.buffer_, decoded.capture_,
                                              decoded.face_areas_);

    JpegWriteOptions options;
    options.quality_     = _config.OutputQuality();
    options.orientation_ = decoded.orientation_;
    ImageWriter::WriteJpeg(input, output, enhanced.enhanced_, options);

    result.output_path_ = output;
    result.status_      = ConversionStatus::SUCCESS;
    result.metrics_     = std::move(enhanced.metrics_);
    result.params_      = enhanced.params_;
  } catch (const std::exception& e) {
    result.output_path_.reset();
    result.status_        = ConversionStatus::FAILED;
    result.error_message_ = std::string("Conversion failed: ") + e.what();
    std::cerr << "EnhanceService: " << input.string() << ": " << result.error_message_
              << std::endl;
  }
  result.processing_seconds_ = SecondsSince(start);
  return result;
}

auto EnhanceService::ConvertBatch(const std::vector<image_path_t>&   inputs,
                                  const std::optional<image_path_t>& output_dir,
                                  BatchProgressCallback progress) const -> BatchResults {
  EASY_FUNCTION();
  const auto   start = Clock::now();
  BatchResults batch;
  batch.summary_.total_ = inputs.size();
  if (inputs.empty()) {
    return batch;
  }

  const std::vector<image_path_t> outputs = PlanOutputPaths(inputs, output_dir);
  batch.results_.resize(inputs.size());

  const size_t  total = inputs.size();
  std::mutex    progress_lock;
  BatchProgress tally;
  tally.total_ = total;

  {
    ThreadPool                                 pool(std::min(_config.ResolvedWorkerCount(), total));
    std::vector<std::future<ConversionResult>> pending;
    pending.reserve(total);

    for (size_t i = 0; i < total; ++i) {
      pending.push_back(pool.Submit([&, i]() {
        ConversionResult result = ConvertFile(inputs[i], outputs[i]);

        std::lock_guard<std::mutex> lock(progress_lock);
        ++tally.completed_;
        switch (result.status_) {
          case ConversionStatus::SUCCESS:
            ++tally.succeeded_;
            break;
          case ConversionStatus::SKIPPED:
            ++tally.skipped_;
            break;
          case ConversionStatus::FAILED:
            ++tally.failed_;
            break;
        }
        if (progress) {
          try {
            progress(tally, result);
          } catch (const std::exception& e) {
            std::cerr << "EnhanceService: progress callback threw: " << e.what() << std::endl;
          }
        }
        return result;
      }));
    }

    // Results keep input order regardless of completion order
    for (size_t i = 0; i < total; ++i) {
      batch.results_[i] = pending[i].get();
    }
  }

  batch.summary_.successful_    = tally.succeeded_;
  batch.summary_.failed_        = tally.failed_;
  batch.summary_.skipped_       = tally.skipped_;
  batch.summary_.total_seconds_ = SecondsSince(start);

  std::cerr << "EnhanceService: batch finished, " << batch.summary_.successful_ << " succeeded, "
            << batch.summary_.failed_ << " failed, " << batch.summary_.skipped_ << " skipped in "
            << batch.summary_.total_seconds_ << "s" << std::endl;
  return batch;
}
};  // namespace photolift
