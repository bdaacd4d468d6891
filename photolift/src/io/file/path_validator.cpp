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

#include "io/file/path_validator.hpp"

#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <system_error>

#include "type/supported_file_type.hpp"

namespace photolift {
PathValidator::PathValidator(uintmax_t max_input_bytes) : _max_input_bytes(max_input_bytes) {}

auto PathValidator::HasTraversal(const image_path_t& path) -> bool {
  for (const auto& part : path) {
    if (part == "..") return true;
  }
  return false;
}

auto PathValidator::ValidateInput(const image_path_t& path) const -> ValidationResult {
  if (HasTraversal(path)) {
    return ValidationResult::Fail("Path traversal detected: path contains '..'");
  }

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return ValidationResult::Fail("Input file not found: " + path.string());
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    return ValidationResult::Fail("Path is not a file: " + path.string());
  }
  if (::access(path.c_str(), R_OK) != 0) {
    return ValidationResult::Fail("File is not readable: " + path.string());
  }
  if (!is_supported_file(path)) {
    return ValidationResult::Fail("Invalid file extension: " + path.extension().string());
  }

  const uintmax_t size = std::filesystem::file_size(path, ec);
  if (ec) {
    return ValidationResult::Fail("Cannot read file size: " + ec.message());
  }
  if (size > _max_input_bytes) {
    char message[96];
    std::snprintf(message, sizeof(message), "File too large: %.1fMB (maximum: %.0fMB)",
                  static_cast<double>(size) / (1024.0 * 1024.0),
                  static_cast<double>(_max_input_bytes) / (1024.0 * 1024.0));
    return ValidationResult::Fail(message);
  }
  return ValidationResult::Ok();
}

auto PathValidator::ValidateOutput(const image_path_t& path) const -> ValidationResult {
  if (HasTraversal(path)) {
    return ValidationResult::Fail("Path traversal detected in output path: contains '..'");
  }
  if (path.empty() || !path.has_filename()) {
    return ValidationResult::Fail("Invalid output path: " + path.string());
  }

  std::error_code ec;
  image_path_t    parent = std::filesystem::absolute(path, ec).parent_path();
  if (ec) {
    return ValidationResult::Fail("Invalid output path: " + ec.message());
  }
  if (std::filesystem::is_directory(parent, ec)) {
    if (::access(parent.c_str(), W_OK) != 0) {
      return ValidationResult::Fail("Output directory is not writable: " + parent.string());
    }
    return ValidationResult::Ok();
  }

  // Parent will be created on write, so the closest existing ancestor has to be writable
  image_path_t ancestor = parent;
  while (!std::filesystem::exists(ancestor, ec) && ancestor != ancestor.parent_path()) {
    ancestor = ancestor.parent_path();
  }
  if (!std::filesystem::is_directory(ancestor, ec) || ::access(ancestor.c_str(), W_OK) != 0) {
    return ValidationResult::Fail("Cannot create output directory: " + parent.string() +
                                  " (no write permission)");
  }
  return ValidationResult::Ok();
}
};  // namespace photolift
