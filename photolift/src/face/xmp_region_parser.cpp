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

#include "face/xmp_region_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <exiv2/exiv2.hpp>
#include <iostream>
#include <mutex>
#include <optional>

namespace photolift {
namespace {
constexpr const char* kAreaPrefix = "stArea:";

// One rdf:li (or nested Area) record, keyed by its property path
struct AreaRecord {
  std::string           path_;
  std::optional<double> x_;
  std::optional<double> y_;
  std::optional<double> w_;
  std::optional<double> h_;

  auto IsComplete() const -> bool { return x_ && y_ && w_ && h_; }
};

auto ParseNumber(const std::string& text) -> std::optional<double> {
  size_t begin = 0;
  size_t end   = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  if (begin == end) {
    return std::nullopt;
  }
  const std::string trimmed = text.substr(begin, end - begin);
  char*             parsed_end = nullptr;
  const double      value      = std::strtod(trimmed.c_str(), &parsed_end);
  if (parsed_end != trimmed.c_str() + trimmed.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

auto FindOrAddRecord(std::vector<AreaRecord>& records, const std::string& path) -> AreaRecord& {
  auto it = std::find_if(records.begin(), records.end(),
                         [&](const AreaRecord& record) { return record.path_ == path; });
  if (it != records.end()) {
    return *it;
  }
  records.push_back(AreaRecord{path, {}, {}, {}, {}});
  return records.back();
}

std::once_flag toolkit_once;
std::mutex     toolkit_mutex;

// Exiv2 serializes XMP namespace registration through this callback
void XmpToolkitLock(void* lock_data, bool lock_unlock) {
  auto* mtx = static_cast<std::mutex*>(lock_data);
  if (lock_unlock) {
    mtx->lock();
  } else {
    mtx->unlock();
  }
}
}  // namespace

XmpRegionParser::XmpRegionParser(double percent_threshold)
    : _percent_threshold(percent_threshold) {}

void XmpRegionParser::InitializeToolkit() {
  std::call_once(toolkit_once,
                 [] { Exiv2::XmpParser::initialize(XmpToolkitLock, &toolkit_mutex); });
}

auto XmpRegionParser::Parse(const std::string& xmp_packet) const
    -> std::vector<NormalizedFaceArea> {
  std::vector<NormalizedFaceArea> areas;
  if (xmp_packet.empty()) {
    return areas;
  }

  InitializeToolkit();
  Exiv2::XmpData xmp_data;
  try {
    if (Exiv2::XmpParser::decode(xmp_data, xmp_packet) != 0) {
      return areas;
    }
  } catch (const std::exception& e) {
    std::cerr << "XmpRegionParser: malformed XMP packet (" << e.what() << ")" << std::endl;
    return areas;
  }

  // Keys look like Xmp.mwg-rs.Regions/mwg-rs:RegionList[1]/mwg-rs:Area/stArea:x
  std::vector<AreaRecord> records;
  for (const auto& datum : xmp_data) {
    const std::string key   = datum.key();
    const size_t      slash = key.rfind('/');
    if (slash == std::string::npos) continue;

    const std::string leaf = key.substr(slash + 1);
    if (leaf.size() != std::char_traits<char>::length(kAreaPrefix) + 1 ||
        leaf.compare(0, leaf.size() - 1, kAreaPrefix) != 0) {
      continue;
    }

    AreaRecord& record = FindOrAddRecord(records, key.substr(0, slash));
    const auto  value  = ParseNumber(datum.toString());
    switch (leaf.back()) {
      case 'x':
        record.x_ = value;
        break;
      case 'y':
        record.y_ = value;
        break;
      case 'w':
        record.w_ = value;
        break;
      case 'h':
        record.h_ = value;
        break;
      default:
        break;
    }
  }

  for (const auto& record : records) {
    if (!record.IsComplete()) continue;
    NormalizedFaceArea area{*record.x_, *record.y_, *record.w_, *record.h_};
    const double       magnitude = std::max({std::abs(area.center_x), std::abs(area.center_y),
                                             std::abs(area.width), std::abs(area.height)});
    if (magnitude > _percent_threshold) {
      area.center_x /= 100.0;
      area.center_y /= 100.0;
      area.width /= 100.0;
      area.height /= 100.0;
    }
    areas.push_back(area);
  }
  return areas;
}
};  // namespace photolift
