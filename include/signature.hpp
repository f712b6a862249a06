#pragma once

#include "image_hash.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pdfclassify {

// Normalized [x0, y0, x1, y1] as fractions of page width and height.
using BBoxNorm = std::array<double, 4>;
using BBoxPixels = std::array<int, 4>;

constexpr int kHistogramBins = 256;

struct RegionSignature {
  BBoxNorm bboxNorm{};
  BBoxPixels bboxPixels{};
  std::map<HashKind, ImageHash> hashes;
  std::vector<float> histogram;
};

struct VisualSignature {
  std::map<std::string, RegionSignature> regions;
  std::array<int, 2> pageDimensions{};
};

struct MainTable {
  int rows = 0;
  int cols = 0;
  BBoxNorm bboxNorm{};
};

struct TableLayout {
  int count = 0;
  MainTable mainConsumption;
};

struct SectionInfo {
  bool present = false;
  BBoxNorm bboxNorm{};
};

// Used both for a template's stored structure and for features extracted from an input.
struct StructuralSignature {
  int numPages = 0;
  std::array<int, 2> pageDimensions{};
  double aspectRatio = 0.0;
  std::string orientation;
  TableLayout tables;
  std::map<std::string, SectionInfo> sections;
  std::string columnLayout;
};

struct TextSignature {
  std::vector<std::string> exclusionKeywords;
  std::vector<std::string> uniqueTextPatterns;
};

struct TemplateSignature {
  std::string templateId;
  std::string templateFile;
  std::optional<VisualSignature> visual;
  std::optional<StructuralSignature> structural;
  TextSignature text;
};

// Keyed and iterated by template id.
using TemplateDatabase = std::map<std::string, TemplateSignature>;
using TemplateDatabasePtr = std::shared_ptr<const TemplateDatabase>;

// Template id -> similarity in [0, 1]. A template with no entry was not scored,
// which is different from a score of 0.
using ScoreMap = std::map<std::string, double>;

// nlohmann/json conversions for the signature document schema.
// from_json throws nlohmann::json::exception on a malformed document.
void to_json(nlohmann::json& j, const RegionSignature& r);
void from_json(const nlohmann::json& j, RegionSignature& r);
void to_json(nlohmann::json& j, const VisualSignature& v);
void from_json(const nlohmann::json& j, VisualSignature& v);
void to_json(nlohmann::json& j, const StructuralSignature& s);
void from_json(const nlohmann::json& j, StructuralSignature& s);
void to_json(nlohmann::json& j, const TextSignature& t);
void from_json(const nlohmann::json& j, TextSignature& t);
void to_json(nlohmann::json& j, const TemplateSignature& t);
void from_json(const nlohmann::json& j, TemplateSignature& t);

} // namespace pdfclassify
