#include "detection_cache.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace pdfclassify {

CacheKey CacheKey::forFile(const std::string& path, const std::string& purpose) {
  CacheKey key;
  key.path = path;
  key.purpose = purpose;
  std::error_code ec;
  auto mtime = std::filesystem::last_write_time(path, ec);
  if (!ec) {
    key.mtime = static_cast<std::int64_t>(mtime.time_since_epoch().count());
  }
  return key;
}

cv::Mat DetectionCache::raster(const CacheKey& key) const {
  auto it = rasters_.find(key);
  if (it == rasters_.end()) return cv::Mat();
  return it->second;
}

void DetectionCache::storeRaster(const CacheKey& key, const cv::Mat& image) {
  if (image.empty()) return;
  rasters_[key] = image;
}

std::optional<RegionSet> DetectionCache::regions(const CacheKey& key) const {
  auto it = regionSets_.find(key);
  if (it == regionSets_.end()) return std::nullopt;
  return it->second;
}

void DetectionCache::storeRegions(const CacheKey& key, RegionSet regions) {
  regionSets_[key] = std::move(regions);
}

void DetectionCache::clear() {
  rasters_.clear();
  regionSets_.clear();
  database_.reset();
}

} // namespace pdfclassify
