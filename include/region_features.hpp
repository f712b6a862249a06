#pragma once

#include "image_hash.hpp"

#include <opencv2/core.hpp>

#include <map>
#include <string>
#include <vector>

namespace pdfclassify {

// Fingerprint of one region of an input page, computed once per file.
struct RegionFeatures {
  // Canonical square resize of the region; kept so hashes of other sizes can be derived.
  cv::Mat tile;
  std::map<HashKind, ImageHash> hashes;
  // 256-bin histogram of the region before resizing.
  std::vector<float> histogram;
};

using RegionSet = std::map<std::string, RegionFeatures>;

} // namespace pdfclassify
