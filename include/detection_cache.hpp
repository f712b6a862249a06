#pragma once

#include "region_features.hpp"
#include "signature.hpp"

#include <opencv2/core.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>

namespace pdfclassify {

struct CacheKey {
  std::string path;
  std::int64_t mtime = 0;
  std::string purpose;

  // Reads the file's modification time; an unreadable file keys with mtime 0.
  static CacheKey forFile(const std::string& path, const std::string& purpose);

  bool operator<(const CacheKey& other) const {
    return std::tie(path, mtime, purpose) < std::tie(other.path, other.mtime, other.purpose);
  }
  bool operator==(const CacheKey& other) const {
    return path == other.path && mtime == other.mtime && purpose == other.purpose;
  }
};

// In-memory memoization for one classifier. No eviction; not thread-safe.
class DetectionCache {
public:
  // Returns an empty Mat when nothing is stored under `key`.
  cv::Mat raster(const CacheKey& key) const;
  void storeRaster(const CacheKey& key, const cv::Mat& image);

  std::optional<RegionSet> regions(const CacheKey& key) const;
  void storeRegions(const CacheKey& key, RegionSet regions);

  // Single slot, independent of the directory the database came from.
  TemplateDatabasePtr templateDatabase() const { return database_; }
  void storeTemplateDatabase(TemplateDatabasePtr db) { database_ = std::move(db); }

  size_t rasterCount() const { return rasters_.size(); }
  size_t regionSetCount() const { return regionSets_.size(); }

  void clear();

private:
  std::map<CacheKey, cv::Mat> rasters_;
  std::map<CacheKey, RegionSet> regionSets_;
  TemplateDatabasePtr database_;
};

} // namespace pdfclassify
