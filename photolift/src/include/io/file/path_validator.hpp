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

#include <cstdint>
#include <string>
#include <utility>

#include "type/type.hpp"

namespace photolift {
struct ValidationResult {
  bool        valid_ = true;
  std::string error_message_;

  static auto Ok() -> ValidationResult { return {}; }
  static auto Fail(std::string message) -> ValidationResult { return {false, std::move(message)}; }
};

/**
 * @brief Checks run on every path before the service touches it.
 *
 * Inputs must be readable regular files with a supported extension and at most
 * max_input_bytes long. Outputs must land in a writable directory, or one that can be created
 * under a writable ancestor. Paths containing a ".." component are rejected either way.
 */
class PathValidator {
 private:
  uintmax_t _max_input_bytes;

 public:
  static constexpr uintmax_t kMaxInputBytes = 500ull * 1024 * 1024;

  explicit PathValidator(uintmax_t max_input_bytes = kMaxInputBytes);

  auto ValidateInput(const image_path_t& path) const -> ValidationResult;
  auto ValidateOutput(const image_path_t& path) const -> ValidationResult;

  static auto HasTraversal(const image_path_t& path) -> bool;
};
};  // namespace photolift
