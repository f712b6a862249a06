#include "visual_detector.hpp"
#include "page_raster.hpp"

#include <opencv2/imgproc.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pdfclassify {

namespace {

struct HashWeight {
  HashKind kind;
  double weight;
};

const HashWeight kHashWeights[] = {
  {HashKind::Perceptual, 0.35},
  {HashKind::Difference, 0.30},
  {HashKind::Average, 0.20},
  {HashKind::Wavelet, 0.15},
};

// Weight for a region name outside the fixed layout.
constexpr double kFallbackRegionWeight = 0.10;

std::vector<float> grayHistogram(const cv::Mat& gray) {
  cv::Mat hist;
  int channels[] = {0};
  int histSize[] = {kHistogramBins};
  float range[] = {0.0f, 256.0f};
  const float* ranges[] = {range};
  cv::calcHist(&gray, 1, channels, cv::Mat(), hist, 1, histSize, ranges);
  return std::vector<float>(hist.begin<float>(), hist.end<float>());
}

const ImageHash* inputHashFor(const RegionFeatures& input, HashKind kind, size_t width, ImageHash& scratch) {
  auto it = input.hashes.find(kind);
  if (it != input.hashes.end() && it->second.size() == width) return &it->second;
  if (input.tile.empty()) return nullptr;
  auto size = hashSizeForBits(width);
  if (!size) return nullptr;
  scratch = computeHash(kind, input.tile, *size);
  return &scratch;
}

} // namespace

const std::vector<RegionLayout>& pageRegions() {
  static const std::vector<RegionLayout> regions = {
    {"header", {0.0, 0.0, 1.0, 0.25}, 0.40},
    {"main_table", {0.1, 0.25, 0.9, 0.65}, 0.35},
    {"payment_info", {0.0, 0.70, 1.0, 0.95}, 0.15},
  };
  return regions;
}

std::map<std::string, cv::Mat> extractRegions(const cv::Mat& page) {
  std::map<std::string, cv::Mat> regions;
  if (page.empty()) return regions;
  for (const RegionLayout& layout : pageRegions()) {
    cv::Rect rect = normalizedRect(layout.bbox, page.size());
    if (rect.area() > 0) regions.emplace(layout.name, page(rect));
  }
  return regions;
}

RegionFeatures computeRegionFeatures(const cv::Mat& region) {
  RegionFeatures features;
  features.tile = resizeGray(region, cv::Size(kCanonicalTileSize, kCanonicalTileSize));
  for (const HashWeight& hw : kHashWeights) {
    features.hashes.emplace(hw.kind, computeHash(hw.kind, features.tile, defaultHashSize(hw.kind)));
  }
  features.histogram = grayHistogram(region);
  return features;
}

RegionSet computeRegionSet(const cv::Mat& page) {
  RegionSet set;
  for (const auto& kv : extractRegions(page)) {
    set.emplace(kv.first, computeRegionFeatures(kv.second));
  }
  return set;
}

double histogramSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != static_cast<size_t>(kHistogramBins) || b.size() != static_cast<size_t>(kHistogramBins)) {
    return 0.0;
  }
  cv::Mat ha(a, true);
  cv::Mat hb(b, true);
  ha /= (cv::sum(ha)[0] + 1e-10);
  hb /= (cv::sum(hb)[0] + 1e-10);
  double correlation = cv::compareHist(ha, hb, cv::HISTCMP_CORREL);
  return std::max(0.0, correlation);
}

double hashSimilarity(const RegionFeatures& input, const RegionSignature& stored) {
  double weighted = 0.0;
  double totalWeight = 0.0;

  for (const HashWeight& hw : kHashWeights) {
    auto it = stored.hashes.find(hw.kind);
    if (it == stored.hashes.end() || it->second.empty()) continue;

    const ImageHash& reference = it->second;
    ImageHash scratch;
    const ImageHash* candidate = inputHashFor(input, hw.kind, reference.size(), scratch);
    if (!candidate) continue;

    double maxDistance = static_cast<double>(reference.size());
    double similarity = 1.0 - candidate->distance(reference) / maxDistance;
    weighted += std::clamp(similarity, 0.0, 1.0) * hw.weight;
    totalWeight += hw.weight;
  }

  return totalWeight > 0.0 ? weighted / totalWeight : 0.0;
}

double compareRegion(const RegionFeatures& input, const RegionSignature& stored) {
  double hashScore = hashSimilarity(input, stored);
  double histScore = histogramSimilarity(input.histogram, stored.histogram);
  return hashScore * kHashShare + histScore * kHistogramShare;
}

double calculateVisualConfidence(const ScoreMap& regionScores) {
  double total = 0.0;
  double totalWeight = 0.0;
  for (const auto& kv : regionScores) {
    double weight = kFallbackRegionWeight;
    for (const RegionLayout& layout : pageRegions()) {
      if (layout.name == kv.first) weight = layout.weight;
    }
    total += kv.second * weight;
    totalWeight += weight;
  }
  return totalWeight > 0.0 ? total / totalWeight : 0.0;
}

VisualResult scoreVisual(const RegionSet& input, const TemplateDatabase& db) {
  VisualResult result;
  for (const auto& kv : db) {
    const auto& visual = kv.second.visual;
    if (!visual || visual->regions.empty()) continue;

    ScoreMap regionScores;
    for (const RegionLayout& layout : pageRegions()) {
      auto in = input.find(layout.name);
      auto ref = visual->regions.find(layout.name);
      if (in == input.end() || ref == visual->regions.end()) continue;
      regionScores[layout.name] = compareRegion(in->second, ref->second);
    }

    result.scores[kv.first] = calculateVisualConfidence(regionScores);
    result.regionScores[kv.first] = std::move(regionScores);
  }
  return result;
}

VisualResult detectByVisual(const std::string& pdfPath, const TemplateDatabase& db, PdfSource& pdf,
                            int dpi, DetectionCache* cache) {
  RegionSet input;
  try {
    CacheKey key = CacheKey::forFile(pdfPath, "regions@" + std::to_string(dpi));
    std::optional<RegionSet> cached = cache ? cache->regions(key) : std::nullopt;
    if (cached) {
      input = std::move(*cached);
    } else {
      input = computeRegionSet(renderAndPreprocess(pdfPath, pdf, dpi, cache));
      if (cache) cache->storeRegions(key, input);
    }
  } catch (const std::exception& ex) {
    spdlog::warn("Visual detection unavailable for {}: {}", pdfPath, ex.what());
    VisualResult failed;
    failed.warnings.push_back(std::string("Visual detection unavailable: ") + ex.what());
    return failed;
  }

  return scoreVisual(input, db);
}

} // namespace pdfclassify
