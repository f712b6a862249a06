#pragma once

#include "detection_cache.hpp"
#include "pdf_source.hpp"
#include "region_features.hpp"
#include "signature.hpp"

#include <opencv2/core.hpp>

#include <map>
#include <string>
#include <vector>

namespace pdfclassify {

// Fixed page regions for this layout family, as normalized [x0, y0, x1, y1].
struct RegionLayout {
  std::string name;
  BBoxNorm bbox;
  double weight;
};

const std::vector<RegionLayout>& pageRegions();

constexpr int kCanonicalTileSize = 512;

// Share of a region score carried by hashes and by the histogram. The
// remaining 0.15 is reserved for a feature-matching term that is not computed,
// so an exact match scores 0.85.
constexpr double kHashShare = 0.60;
constexpr double kHistogramShare = 0.25;

struct VisualResult {
  ScoreMap scores;
  // Per template, per region scores behind `scores`.
  std::map<std::string, ScoreMap> regionScores;
  std::vector<std::string> warnings;
};

// Crops the named regions out of a page raster. Empty crops are left out.
std::map<std::string, cv::Mat> extractRegions(const cv::Mat& page);

// Canonical tile, default-size hashes and histogram of one region.
RegionFeatures computeRegionFeatures(const cv::Mat& region);

RegionSet computeRegionSet(const cv::Mat& page);

double histogramSimilarity(const std::vector<float>& a, const std::vector<float>& b);

// Weighted hash agreement, renormalized over the hash kinds the stored signature carries.
double hashSimilarity(const RegionFeatures& input, const RegionSignature& stored);

double compareRegion(const RegionFeatures& input, const RegionSignature& stored);

// Weighted mean over the regions present in `regionScores`; 0 when none are.
double calculateVisualConfidence(const ScoreMap& regionScores);

// Scores every template carrying a visual signature against precomputed input regions.
VisualResult scoreVisual(const RegionSet& input, const TemplateDatabase& db);

// Renders, preprocesses and fingerprints page 1 (through `cache` when given),
// then scores. A render failure yields an empty score map and a warning.
VisualResult detectByVisual(const std::string& pdfPath, const TemplateDatabase& db, PdfSource& pdf,
                            int dpi, DetectionCache* cache);

} // namespace pdfclassify
