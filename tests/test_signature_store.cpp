#include <catch2/catch_all.hpp>

#include "config.hpp"
#include "signature_store.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <string>

using namespace pdfclassify;
using nlohmann::json;

namespace {

json minimalSignature(const std::string& id) {
  return json{
    {"template_id", id},
    {"template_file", id + ".pdf"},
    {"signatures", {
      {"visual", {
        {"page_dimensions", {2480, 3508}},
        {"regions", {
          {"header", {
            {"bbox_norm", {0.0, 0.0, 1.0, 0.25}},
            {"bbox_pixels", {0, 0, 2480, 877}},
            {"hashes", {{"phash", std::string(64, 'a')}, {"dhash", "00ff00ff00ff00ff"}, {"ahash", "not-hex"}}},
            {"histogram", json::array()},
          }},
        }},
      }},
      {"structural", {
        {"num_pages", 1},
        {"page_dimensions", {595, 842}},
        {"aspect_ratio", 0.7066},
        {"orientation", "portrait"},
        {"tables", {{"count", 1}, {"main_consumption", {{"rows", 12}, {"cols", 5}, {"bbox_norm", {0.1, 0.25, 0.9, 0.65}}}}}},
        {"sections", {{"header", {{"present", true}, {"bbox_norm", {0.0, 0.0, 1.0, 0.25}}}}}},
        {"layout", {{"column_layout", "single_column"}}},
      }},
      {"text", {{"exclusion_keywords", json::array({"Gas Bill"})}, {"unique_text_patterns", json::array({"invoice\\s+no"})}}},
    }},
  };
}

} // namespace

TEST_CASE("a signature document parses into typed signatures", "[store]") {
  TemplateSignature sig = parseTemplateSignature(minimalSignature("electric_a").dump());

  REQUIRE(sig.templateId == "electric_a");
  REQUIRE(sig.templateFile == "electric_a.pdf");
  REQUIRE(sig.visual);
  REQUIRE(sig.visual->pageDimensions[1] == 3508);

  const RegionSignature& header = sig.visual->regions.at("header");
  REQUIRE(header.hashes.at(HashKind::Perceptual).size() == 256);
  REQUIRE(header.hashes.at(HashKind::Difference).toHex() == "00ff00ff00ff00ff");
  // An unparseable hash drops only that hash type.
  REQUIRE(header.hashes.count(HashKind::Average) == 0);
  REQUIRE(header.histogram.empty());

  REQUIRE(sig.structural);
  REQUIRE(sig.structural->tables.mainConsumption.rows == 12);
  REQUIRE(sig.structural->sections.at("header").present);
  REQUIRE(sig.structural->columnLayout == "single_column");

  REQUIRE(sig.text.exclusionKeywords == std::vector<std::string>{"Gas Bill"});
  REQUIRE(sig.text.uniqueTextPatterns.size() == 1);
}

TEST_CASE("absent or empty signature blocks stay empty", "[store]") {
  json doc{{"template_id", "bare"}, {"signatures", {{"visual", json::object()}, {"structural", json::object()}}}};
  TemplateSignature sig = parseTemplateSignature(doc.dump());
  REQUIRE_FALSE(sig.visual);
  REQUIRE_FALSE(sig.structural);
  REQUIRE(sig.text.exclusionKeywords.empty());
}

TEST_CASE("malformed documents are rejected", "[store]") {
  REQUIRE_THROWS(parseTemplateSignature("{ not json"));
  REQUIRE_THROWS(parseTemplateSignature("[1, 2, 3]"));
  REQUIRE_THROWS(parseTemplateSignature(R"({"template_file": "x.pdf"})"));
  REQUIRE_THROWS(parseTemplateSignature(R"({"template_id": ""})"));
  REQUIRE_THROWS(parseTemplateSignature(R"({"template_id": 42})"));
}

TEST_CASE("loading skips bad files and keeps the first duplicate", "[store]") {
  testsupport::TempDir dir;
  dir.writeJson("a_gas.json", minimalSignature("gas"));
  dir.writeJson("b_electric.json", minimalSignature("electric"));
  json duplicate = minimalSignature("gas");
  duplicate["template_file"] = "other.pdf";
  dir.writeJson("c_gas_copy.json", duplicate);
  dir.write("d_broken.json", "{\"template_id\": ");
  dir.write("notes.txt", "not a signature");

  LoadReport report;
  TemplateDatabasePtr db = loadTemplateDatabase(dir.str(), &report);

  REQUIRE(db->size() == 2);
  REQUIRE(db->at("gas").templateFile == "gas.pdf");
  REQUIRE(db->count("electric") == 1);
  REQUIRE((report.loadedFiles == std::vector<std::string>{"a_gas.json", "b_electric.json"}));
  REQUIRE(report.skipped.size() == 2);
}

TEST_CASE("an empty directory loads an empty database", "[store]") {
  testsupport::TempDir dir;
  REQUIRE(loadTemplateDatabase(dir.str())->empty());
}

TEST_CASE("a missing directory is a configuration error", "[store]") {
  testsupport::TempDir dir;
  REQUIRE_THROWS_AS(loadTemplateDatabase((dir.path() / "absent").string()), ConfigurationError);
}

TEST_CASE("signatures survive a write and reload", "[store]") {
  testsupport::FakeDocument doc;
  doc.page = testsupport::drawBillPage(6, 4, 3);
  TemplateSignature generated = testsupport::signatureFromPage("water", doc.page, doc.info);

  testsupport::TempDir dir;
  dir.writeJson("water.json", json(generated));
  TemplateDatabasePtr db = loadTemplateDatabase(dir.str());

  const TemplateSignature& loaded = db->at("water");
  REQUIRE(loaded.visual->regions.size() == generated.visual->regions.size());
  const RegionSignature& a = generated.visual->regions.at("main_table");
  const RegionSignature& b = loaded.visual->regions.at("main_table");
  REQUIRE(a.hashes == b.hashes);
  REQUIRE(b.histogram.size() == static_cast<size_t>(kHistogramBins));
  REQUIRE(loaded.structural->tables.mainConsumption.rows == generated.structural->tables.mainConsumption.rows);
}
