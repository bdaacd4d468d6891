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

#include "image/image_buffer.hpp"

#include <stdexcept>
#include <utility>

namespace photolift {
ImageBuffer::ImageBuffer(const cv::Mat& data) : _cpu_data_valid(!data.empty()) {
  data.copyTo(_cpu_data);
}

ImageBuffer::ImageBuffer(cv::Mat&& data)
    : _cpu_data(std::move(data)), _cpu_data_valid(!_cpu_data.empty()) {}

ImageBuffer::ImageBuffer(const ImageBuffer& other)
    : _color_profile(other._color_profile), _cpu_data_valid(other._cpu_data_valid) {
  other._cpu_data.copyTo(_cpu_data);
}

ImageBuffer::ImageBuffer(ImageBuffer&& other) noexcept
    : _cpu_data(std::move(other._cpu_data)),
      _color_profile(std::move(other._color_profile)),
      _cpu_data_valid(other._cpu_data_valid) {
  other._cpu_data_valid = false;
}

ImageBuffer& ImageBuffer::operator=(const ImageBuffer& other) {
  if (this != &other) {
    other._cpu_data.copyTo(_cpu_data);
    _color_profile  = other._color_profile;
    _cpu_data_valid = other._cpu_data_valid;
  }
  return *this;
}

ImageBuffer& ImageBuffer::operator=(ImageBuffer&& other) noexcept {
  if (this != &other) {
    _cpu_data             = std::move(other._cpu_data);
    _color_profile        = std::move(other._color_profile);
    _cpu_data_valid       = other._cpu_data_valid;
    other._cpu_data_valid = false;
  }
  return *this;
}

auto ImageBuffer::GetCPUData() -> cv::Mat& {
  if (!_cpu_data_valid) {
    throw std::runtime_error("ImageBuffer: No valid image data to be returned");
  }
  return _cpu_data;
}

auto ImageBuffer::GetCPUData() const -> const cv::Mat& {
  if (!_cpu_data_valid) {
    throw std::runtime_error("ImageBuffer: No valid image data to be returned");
  }
  return _cpu_data;
}

auto ImageBuffer::Width() const -> int { return _cpu_data.cols; }

auto ImageBuffer::Height() const -> int { return _cpu_data.rows; }

auto ImageBuffer::IsValidPixelBuffer() const -> bool {
  return _cpu_data_valid && !_cpu_data.empty() && _cpu_data.type() == CV_8UC3;
}

void ImageBuffer::SetColorProfile(color_profile_t profile) { _color_profile = std::move(profile); }

auto ImageBuffer::GetColorProfile() const -> const color_profile_t& { return _color_profile; }

auto ImageBuffer::HasColorProfile() const -> bool { return !_color_profile.empty(); }

ImageBuffer ImageBuffer::Clone() const {
  ImageBuffer copy;
  if (_cpu_data_valid) {
    copy._cpu_data       = _cpu_data.clone();
    copy._cpu_data_valid = true;
  }
  copy._color_profile = _color_profile;
  return copy;
}

void ImageBuffer::ReleaseCPUData() {
  _cpu_data.release();
  _cpu_data_valid = false;
}
};  // namespace photolift
