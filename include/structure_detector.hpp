#pragma once

#include "detection_cache.hpp"
#include "pdf_source.hpp"
#include "signature.hpp"

#include <opencv2/core.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pdfclassify {

struct StructureResult {
  ScoreMap scores;
  std::vector<std::string> warnings;
};

// Component weights of compareStructures.
struct StructureWeights {
  static constexpr double page = 0.20;
  static constexpr double table = 0.50;
  static constexpr double section = 0.25;
  static constexpr double layout = 0.05;
};

// Named sections checked by compareSections, with their fixed page positions.
const std::map<std::string, BBoxNorm>& sectionLayout();

// Line-density estimate of table count and main table grid. A fingerprint,
// not a cell-accurate reading of the table.
TableLayout detectTables(const cv::Mat& gray);

// A section is present when at least 0.1% of its area is ink.
std::map<std::string, SectionInfo> detectSections(const cv::Mat& gray);

// "two_column" when left and right halves carry similar ink, else "single_column".
std::string detectColumnLayout(const cv::Mat& gray);

StructuralSignature buildStructure(const PageInfo& info, const cv::Mat& gray);

// nullopt when the page cannot be inspected or rendered.
std::optional<StructuralSignature> extractStructuralFeatures(const std::string& pdfPath, PdfSource& pdf,
                                                             int dpi, DetectionCache* cache,
                                                             std::string* error = nullptr);

double comparePageStructure(const StructuralSignature& input, const StructuralSignature& stored);
double compareTableStructure(const StructuralSignature& input, const StructuralSignature& stored);
double compareSections(const StructuralSignature& input, const StructuralSignature& stored);
double compareLayout(const StructuralSignature& input, const StructuralSignature& stored);
double compareStructures(const StructuralSignature& input, const StructuralSignature& stored);

// A template whose page count differs from the input scores 0 without further
// comparison but stays in the map. Templates without a structural signature are left out.
ScoreMap scoreStructure(const StructuralSignature& input, const TemplateDatabase& db);

StructureResult detectByStructure(const std::string& pdfPath, const TemplateDatabase& db, PdfSource& pdf,
                                  int dpi, DetectionCache* cache);

} // namespace pdfclassify
