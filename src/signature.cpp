#include "signature.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

namespace pdfclassify {

namespace {

using nlohmann::json;

const HashKind kHashKinds[] = {HashKind::Perceptual, HashKind::Difference, HashKind::Average,
                               HashKind::Wavelet};

bool isEmptyObject(const json& j) {
  return j.is_null() || (j.is_object() && j.empty());
}

} // namespace

void to_json(json& j, const RegionSignature& r) {
  json hashes = json::object();
  for (const auto& kv : r.hashes) hashes[hashKindName(kv.first)] = kv.second.toHex();
  j = json{{"bbox_norm", r.bboxNorm},
           {"bbox_pixels", r.bboxPixels},
           {"hashes", hashes},
           {"histogram", r.histogram}};
}

void from_json(const json& j, RegionSignature& r) {
  r.bboxNorm = j.value("bbox_norm", BBoxNorm{});
  r.bboxPixels = j.value("bbox_pixels", BBoxPixels{});
  r.histogram = j.value("histogram", std::vector<float>{});

  r.hashes.clear();
  const json hashes = j.value("hashes", json::object());
  for (HashKind kind : kHashKinds) {
    auto it = hashes.find(hashKindName(kind));
    if (it == hashes.end() || it->is_null()) continue;
    std::string hex = it->get<std::string>();
    if (hex.empty()) continue;
    auto parsed = ImageHash::fromHex(hex);
    if (!parsed) {
      spdlog::warn("Ignoring malformed {} value '{}'", hashKindName(kind), hex);
      continue;
    }
    r.hashes.emplace(kind, std::move(*parsed));
  }
}

void to_json(json& j, const VisualSignature& v) {
  j = json{{"regions", v.regions}, {"page_dimensions", v.pageDimensions}};
}

void from_json(const json& j, VisualSignature& v) {
  v.regions.clear();
  const json regions = j.value("regions", json::object());
  for (auto it = regions.begin(); it != regions.end(); ++it) {
    v.regions.emplace(it.key(), it.value().get<RegionSignature>());
  }
  v.pageDimensions = j.value("page_dimensions", std::array<int, 2>{});
}

void to_json(json& j, const StructuralSignature& s) {
  json sections = json::object();
  for (const auto& kv : s.sections) {
    sections[kv.first] = json{{"present", kv.second.present}, {"bbox_norm", kv.second.bboxNorm}};
  }
  j = json{
    {"num_pages", s.numPages},
    {"page_dimensions", s.pageDimensions},
    {"aspect_ratio", s.aspectRatio},
    {"orientation", s.orientation},
    {"tables", {
      {"count", s.tables.count},
      {"main_consumption", {
        {"rows", s.tables.mainConsumption.rows},
        {"cols", s.tables.mainConsumption.cols},
        {"bbox_norm", s.tables.mainConsumption.bboxNorm},
      }},
    }},
    {"sections", sections},
    {"layout", {{"column_layout", s.columnLayout}}},
  };
}

void from_json(const json& j, StructuralSignature& s) {
  s.numPages = j.value("num_pages", 0);
  s.pageDimensions = j.value("page_dimensions", std::array<int, 2>{});
  s.aspectRatio = j.value("aspect_ratio", 0.0);
  s.orientation = j.value("orientation", std::string());

  const json tables = j.value("tables", json::object());
  s.tables.count = tables.value("count", 0);
  const json main = tables.value("main_consumption", json::object());
  s.tables.mainConsumption.rows = main.value("rows", 0);
  s.tables.mainConsumption.cols = main.value("cols", 0);
  s.tables.mainConsumption.bboxNorm = main.value("bbox_norm", BBoxNorm{});

  s.sections.clear();
  const json sections = j.value("sections", json::object());
  for (auto it = sections.begin(); it != sections.end(); ++it) {
    SectionInfo info;
    info.present = it.value().value("present", false);
    info.bboxNorm = it.value().value("bbox_norm", BBoxNorm{});
    s.sections.emplace(it.key(), info);
  }

  s.columnLayout = j.value("layout", json::object()).value("column_layout", std::string());
}

void to_json(json& j, const TextSignature& t) {
  j = json{{"exclusion_keywords", t.exclusionKeywords}, {"unique_text_patterns", t.uniqueTextPatterns}};
}

void from_json(const json& j, TextSignature& t) {
  t.exclusionKeywords = j.value("exclusion_keywords", std::vector<std::string>{});
  t.uniqueTextPatterns = j.value("unique_text_patterns", std::vector<std::string>{});
}

void to_json(json& j, const TemplateSignature& t) {
  json signatures = json::object();
  if (t.visual) signatures["visual"] = *t.visual;
  if (t.structural) signatures["structural"] = *t.structural;
  signatures["text"] = t.text;
  j = json{{"template_id", t.templateId}, {"template_file", t.templateFile}, {"signatures", signatures}};
}

void from_json(const json& j, TemplateSignature& t) {
  t.templateId = j.at("template_id").get<std::string>();
  t.templateFile = j.value("template_file", std::string());

  const json signatures = j.value("signatures", json::object());
  t.visual.reset();
  t.structural.reset();

  auto visual = signatures.find("visual");
  if (visual != signatures.end() && !isEmptyObject(*visual)) {
    VisualSignature v = visual->get<VisualSignature>();
    if (!v.regions.empty()) t.visual = std::move(v);
  }
  auto structural = signatures.find("structural");
  if (structural != signatures.end() && !isEmptyObject(*structural)) {
    t.structural = structural->get<StructuralSignature>();
  }
  t.text = signatures.value("text", TextSignature{});
}

} // namespace pdfclassify
