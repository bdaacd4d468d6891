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

#include <filesystem>
#include <string>

#include "app/service_test_fixation.hpp"
#include "type/supported_file_type.hpp"

using namespace photolift;

namespace {
auto StartsWith(const std::string& text, const std::string& prefix) -> bool {
  return text.rfind(prefix, 0) == 0;
}
}  // namespace

TEST(SupportedFileTypeTest, ExtensionsCompareCaseInsensitively) {
  EXPECT_TRUE(is_supported_file("IMG_0001.HEIC"));
  EXPECT_TRUE(is_supported_file("/photos/a.heif"));
  EXPECT_TRUE(is_supported_file("b.JpEg"));
  EXPECT_FALSE(is_supported_file("notes.txt"));
  EXPECT_FALSE(is_supported_file("no_extension"));
}

TEST_F(ServiceTests, AcceptsReadableSupportedInput) {
  auto          input = WriteJpeg("IMG_0001.jpg", BacklitFrame(32));
  PathValidator validator;
  auto          check = validator.ValidateInput(input);
  EXPECT_TRUE(check.valid_) << check.error_message_;
}

TEST_F(ServiceTests, RejectsBadInputs) {
  PathValidator validator;

  auto traversal = validator.ValidateInput(work_dir_ / ".." / "IMG_0001.jpg");
  EXPECT_FALSE(traversal.valid_);
  EXPECT_TRUE(StartsWith(traversal.error_message_, "Path traversal detected"));

  auto missing = validator.ValidateInput(work_dir_ / "missing.heic");
  EXPECT_FALSE(missing.valid_);
  EXPECT_TRUE(StartsWith(missing.error_message_, "Input file not found"));

  std::filesystem::create_directories(work_dir_ / "folder.jpg");
  auto directory = validator.ValidateInput(work_dir_ / "folder.jpg");
  EXPECT_FALSE(directory.valid_);
  EXPECT_TRUE(StartsWith(directory.error_message_, "Path is not a file"));

  auto text      = WriteBytes("notes.txt", "hello");
  auto extension = validator.ValidateInput(text);
  EXPECT_FALSE(extension.valid_);
  EXPECT_EQ(extension.error_message_, "Invalid file extension: .txt");
}

TEST_F(ServiceTests, RejectsOversizedInput) {
  auto          input = WriteBytes("large.heic", std::string(2048, 'x'));
  PathValidator strict(1024);
  auto          check = strict.ValidateInput(input);
  EXPECT_FALSE(check.valid_);
  EXPECT_TRUE(StartsWith(check.error_message_, "File too large"));

  PathValidator relaxed(4096);
  EXPECT_TRUE(relaxed.ValidateInput(input).valid_);
}

TEST_F(ServiceTests, ValidatesOutputLocations) {
  PathValidator validator;
  EXPECT_TRUE(validator.ValidateOutput(work_dir_ / "out.jpg").valid_);
  // Missing parents are fine when an existing ancestor is writable
  EXPECT_TRUE(validator.ValidateOutput(work_dir_ / "a" / "b" / "out.jpg").valid_);

  auto traversal = validator.ValidateOutput(work_dir_ / ".." / "out.jpg");
  EXPECT_FALSE(traversal.valid_);
  EXPECT_TRUE(StartsWith(traversal.error_message_, "Path traversal detected in output path"));
}

TEST_F(ServiceTests, RejectsReadOnlyOutputDirectory) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "permission bits do not apply to root";
  }
  const auto locked = work_dir_ / "locked";
  std::filesystem::create_directories(locked);
  std::filesystem::permissions(locked, std::filesystem::perms::owner_read |
                                           std::filesystem::perms::owner_exec);

  PathValidator validator;
  auto          existing = validator.ValidateOutput(locked / "out.jpg");
  auto          nested   = validator.ValidateOutput(locked / "sub" / "out.jpg");
  std::filesystem::permissions(locked, std::filesystem::perms::owner_all);

  EXPECT_FALSE(existing.valid_);
  EXPECT_TRUE(StartsWith(existing.error_message_, "Output directory is not writable"));
  EXPECT_FALSE(nested.valid_);
  EXPECT_TRUE(StartsWith(nested.error_message_, "Cannot create output directory"));
}
