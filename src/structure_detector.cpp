#include "structure_detector.hpp"
#include "page_raster.hpp"

#include <opencv2/imgproc.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>

namespace pdfclassify {

namespace {

constexpr int kInkThreshold = 200;
constexpr double kSectionInkFraction = 0.001;
constexpr double kColumnBalanceTolerance = 0.1;
constexpr int kLineKernelLength = 40;

const BBoxNorm kMainTableBBox = {0.1, 0.25, 0.9, 0.65};

double inkFraction(const cv::Mat& gray) {
  if (gray.empty()) return 0.0;
  cv::Mat ink = gray < kInkThreshold;
  return static_cast<double>(cv::countNonZero(ink)) / static_cast<double>(gray.total());
}

int countLinePixels(const cv::Mat& edges, cv::Size kernelSize) {
  cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, kernelSize);
  cv::Mat lines;
  cv::morphologyEx(edges, lines, cv::MORPH_OPEN, kernel, cv::Point(-1, -1), 2);
  return cv::countNonZero(lines);
}

// Linear falloff by relative difference, full credit on an exact match.
double relativeMatch(int a, int b) {
  if (a == b) return 1.0;
  double maxValue = std::max({a, b, 1});
  return std::max(0.0, 1.0 - std::abs(a - b) / maxValue);
}

} // namespace

const std::map<std::string, BBoxNorm>& sectionLayout() {
  static const std::map<std::string, BBoxNorm> sections = {
    {"header", {0.0, 0.0, 1.0, 0.25}},
    {"consumption_table", {0.1, 0.25, 0.9, 0.65}},
    {"payment_info", {0.1, 0.70, 0.9, 0.95}},
  };
  return sections;
}

TableLayout detectTables(const cv::Mat& gray) {
  cv::Mat edges;
  cv::Canny(gray, edges, 50, 150);

  int horizontal = countLinePixels(edges, cv::Size(kLineKernelLength, 1)) / 1000;
  int vertical = countLinePixels(edges, cv::Size(1, kLineKernelLength)) / 1000;

  TableLayout tables;
  tables.count = std::max(1, std::min(horizontal, vertical) / 10);
  tables.mainConsumption.rows = std::max(3, horizontal / 5);
  tables.mainConsumption.cols = std::max(3, vertical / 5);
  tables.mainConsumption.bboxNorm = kMainTableBBox;
  return tables;
}

std::map<std::string, SectionInfo> detectSections(const cv::Mat& gray) {
  std::map<std::string, SectionInfo> sections;
  for (const auto& kv : sectionLayout()) {
    SectionInfo info;
    info.bboxNorm = kv.second;
    cv::Rect rect = normalizedRect(kv.second, gray.size());
    info.present = rect.area() > 0 && inkFraction(gray(rect)) >= kSectionInkFraction;
    sections.emplace(kv.first, info);
  }
  return sections;
}

std::string detectColumnLayout(const cv::Mat& gray) {
  int mid = gray.cols / 2;
  double left = inkFraction(gray(cv::Rect(0, 0, mid, gray.rows)));
  double right = inkFraction(gray(cv::Rect(mid, 0, gray.cols - mid, gray.rows)));
  return std::abs(left - right) < kColumnBalanceTolerance ? "two_column" : "single_column";
}

StructuralSignature buildStructure(const PageInfo& info, const cv::Mat& gray) {
  double width = info.widthPt;
  double height = info.heightPt;
  if (width <= 0.0 || height <= 0.0) {
    width = gray.cols;
    height = gray.rows;
  }

  StructuralSignature s;
  s.numPages = info.pageCount;
  s.pageDimensions = {static_cast<int>(width), static_cast<int>(height)};
  s.aspectRatio = height > 0.0 ? width / height : 0.0;
  s.orientation = height > width ? "portrait" : "landscape";
  s.tables = detectTables(gray);
  s.sections = detectSections(gray);
  s.columnLayout = detectColumnLayout(gray);
  return s;
}

std::optional<StructuralSignature> extractStructuralFeatures(const std::string& pdfPath, PdfSource& pdf,
                                                             int dpi, DetectionCache* cache,
                                                             std::string* error) {
  try {
    PageInfo info = pdf.inspect(pdfPath);
    if (info.pageCount <= 0) {
      if (error) *error = "document has no pages";
      return std::nullopt;
    }
    cv::Mat gray = renderFirstPage(pdfPath, pdf, dpi, cache);
    if (gray.cols < 2 || gray.rows < 2) {
      if (error) *error = "page raster is too small";
      return std::nullopt;
    }
    return buildStructure(info, gray);
  } catch (const std::exception& ex) {
    spdlog::warn("Structural feature extraction failed for {}: {}", pdfPath, ex.what());
    if (error) *error = ex.what();
    return std::nullopt;
  }
}

double comparePageStructure(const StructuralSignature& input, const StructuralSignature& stored) {
  double score = input.numPages == stored.numPages ? 0.5 : 0.0;

  double a = input.aspectRatio;
  double b = stored.aspectRatio;
  if (a > 0.0 && b > 0.0) {
    double ratioDiff = std::abs(a - b) / std::max(a, b);
    score += (1.0 - ratioDiff) * 0.5;
  }
  return score;
}

double compareTableStructure(const StructuralSignature& input, const StructuralSignature& stored) {
  double score = 0.0;

  int countDiff = std::abs(input.tables.count - stored.tables.count);
  score += std::max(0.0, 0.30 - countDiff * 0.1);

  const MainTable& in = input.tables.mainConsumption;
  const MainTable& ref = stored.tables.mainConsumption;
  score += 0.35 * relativeMatch(in.rows, ref.rows);
  score += 0.35 * relativeMatch(in.cols, ref.cols);
  return score;
}

double compareSections(const StructuralSignature& input, const StructuralSignature& stored) {
  auto presence = [](const StructuralSignature& s, const std::string& name) {
    auto it = s.sections.find(name);
    return it != s.sections.end() && it->second.present;
  };

  const auto& names = sectionLayout();
  int agreeing = 0;
  for (const auto& kv : names) {
    if (presence(input, kv.first) == presence(stored, kv.first)) agreeing++;
  }
  return static_cast<double>(agreeing) / static_cast<double>(names.size());
}

double compareLayout(const StructuralSignature& input, const StructuralSignature& stored) {
  return input.columnLayout == stored.columnLayout ? 1.0 : 0.0;
}

double compareStructures(const StructuralSignature& input, const StructuralSignature& stored) {
  double total = comparePageStructure(input, stored) * StructureWeights::page +
                 compareTableStructure(input, stored) * StructureWeights::table +
                 compareSections(input, stored) * StructureWeights::section +
                 compareLayout(input, stored) * StructureWeights::layout;
  double weightSum = StructureWeights::page + StructureWeights::table +
                     StructureWeights::section + StructureWeights::layout;
  return total / weightSum;
}

ScoreMap scoreStructure(const StructuralSignature& input, const TemplateDatabase& db) {
  ScoreMap scores;
  for (const auto& kv : db) {
    if (!kv.second.structural) continue;
    const StructuralSignature& stored = *kv.second.structural;

    if (input.numPages != stored.numPages) {
      scores[kv.first] = 0.0;
      continue;
    }
    scores[kv.first] = compareStructures(input, stored);
  }
  return scores;
}

StructureResult detectByStructure(const std::string& pdfPath, const TemplateDatabase& db, PdfSource& pdf,
                                  int dpi, DetectionCache* cache) {
  StructureResult result;
  std::string error;
  std::optional<StructuralSignature> input = extractStructuralFeatures(pdfPath, pdf, dpi, cache, &error);
  if (!input) {
    result.warnings.push_back("Structural detection unavailable: " + error);
    return result;
  }
  result.scores = scoreStructure(*input, db);
  return result;
}

} // namespace pdfclassify
