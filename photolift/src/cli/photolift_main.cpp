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

#include <CLI/CLI.hpp>
#include <exiv2/exiv2.hpp>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/enhance_service.hpp"
#include "config/enhancer_config.hpp"
#include "type/type.hpp"

using namespace photolift;

namespace {
auto BuildConfig(const std::optional<std::string>& config_path, const std::optional<int>& quality,
                 bool no_overwrite, const std::optional<size_t>& workers,
                 const std::optional<std::string>& cascade) -> EnhancerConfig {
  EnhancerConfig config;
  if (config_path) {
    config = EnhancerConfig::LoadFromFile(*config_path);
  }

  // --quality beats the file; without either, OutputQuality() reads PHOTOLIFT_QUALITY, then 100
  if (quality) config.quality_ = *quality;
  if (no_overwrite) config.no_overwrite_ = true;
  if (workers) config.worker_count_ = *workers;
  if (cascade) config.cascade_path_ = file_path_t(*cascade);

  config.Validate();
  return config;
}

void PrintResult(const BatchProgress& progress, const ConversionResult& result) {
  std::cout << "[" << progress.completed_ << "/" << progress.total_ << "] "
            << ConversionStatusToString(result.status_) << " " << result.input_path_.string();
  if (result.output_path_) {
    std::cout << " -> " << result.output_path_->string();
  }
  if (!result.error_message_.empty()) {
    std::cout << " (" << result.error_message_ << ")";
  }
  std::cout << " " << std::fixed << std::setprecision(2) << result.processing_seconds_ << "s"
            << std::endl;
}

void PrintSummary(const BatchSummary& summary) {
  std::cout << "Processed " << summary.total_ << " file(s): " << summary.successful_
            << " succeeded, " << summary.failed_ << " failed, " << summary.skipped_
            << " skipped in " << std::fixed << std::setprecision(2) << summary.total_seconds_
            << "s (" << std::setprecision(1) << summary.SuccessRate() << "% success)"
            << std::endl;
}
}  // namespace

int main(int argc, char* argv[]) {
  CLI::App                   app{"photolift: automatic photo enhancement to JPEG"};

  std::vector<std::string>   files;
  std::optional<std::string> config_path;
  std::optional<int>         quality;
  std::optional<std::string> output_dir;
  std::optional<size_t>      workers;
  std::optional<std::string> cascade;
  bool                       no_overwrite = false;
  bool                       metrics_json = false;
  bool                       verbose      = false;

  app.add_option("files", files, "Images to enhance")->required()->check(CLI::ExistingFile);
  app.add_option("-c,--config", config_path, "JSON configuration file")
      ->check(CLI::ExistingFile);
  app.add_option("-q,--quality", quality, "JPEG quality")->check(CLI::Range(0, 100));
  app.add_option("-o,--output-dir", output_dir, "Output directory");
  app.add_option("-w,--workers", workers, "Worker threads, 0 for one per core");
  app.add_option("--cascade", cascade, "Haar cascade for face detection")
      ->check(CLI::ExistingFile);
  app.add_flag("--no-overwrite", no_overwrite, "Skip files whose output already exists");
  app.add_flag("--metrics-json", metrics_json, "Print each result as a JSON line");
  app.add_flag("-v,--verbose", verbose, "Keep Exiv2 warnings");

  CLI11_PARSE(app, argc, argv);

  if (!verbose) {
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::error);
  }

  EnhancerConfig config;
  try {
    config = BuildConfig(config_path, quality, no_overwrite, workers, cascade);
  } catch (const std::exception& e) {
    std::cerr << "photolift: " << e.what() << std::endl;
    return 2;
  }

  std::vector<image_path_t> inputs(files.begin(), files.end());
  std::optional<image_path_t> out_dir;
  if (output_dir) out_dir = image_path_t(*output_dir);

  EnhanceService service(config);
  BatchResults   batch = service.ConvertBatch(
      inputs, out_dir, [metrics_json](const BatchProgress& progress, const ConversionResult& r) {
        if (metrics_json) {
          std::cout << r.ToJson().dump() << std::endl;
        } else {
          PrintResult(progress, r);
        }
      });

  if (metrics_json) {
    std::cout << nlohmann::json{{"summary", batch.summary_.ToJson()}}.dump() << std::endl;
  } else {
    PrintSummary(batch.summary_);
  }
  return batch.summary_.failed_ > 0 ? 1 : 0;
}
