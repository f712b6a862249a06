#include <catch2/catch_all.hpp>

#include "test_support.hpp"
#include "text_detector.hpp"

#include <string>

using namespace pdfclassify;

namespace {

TemplateDatabase databaseWithText() {
  TemplateDatabase db;
  TemplateSignature gas;
  gas.templateId = "gas";
  gas.text.exclusionKeywords = {"Electricity"};
  db.emplace(gas.templateId, gas);

  TemplateSignature electric;
  electric.templateId = "electric";
  electric.text.exclusionKeywords = {"\xd9\x85\xd8\xb5\xd8\xb1\xd9\x81 \xda\xaf\xd8\xa7\xd8\xb2"};  // "masraf gaz"
  electric.text.uniqueTextPatterns = {"subscriber\\s+no\\.?\\s*\\d{6}"};
  db.emplace(electric.templateId, electric);

  TemplateSignature water;
  water.templateId = "water";
  water.text.uniqueTextPatterns = {"([unclosed"};
  db.emplace(water.templateId, water);
  return db;
}

} // namespace

TEST_CASE("normalization lowercases and collapses whitespace", "[text]") {
  REQUIRE(normalizeText("  Monthly\tBILL \n\n Total  ") == "monthly bill total");
  REQUIRE(normalizeText("") == "");
  REQUIRE(normalizeText(" \t\n") == "");
}

TEST_CASE("normalization folds Arabic letters and digits", "[text]") {
  // Arabic yeh and kaf become their Persian forms.
  REQUIRE(normalizeText("\xd9\x8a") == "\xdb\x8c");
  REQUIRE(normalizeText("\xd9\x83") == "\xda\xa9");
  // Persian and Arabic-Indic digits become ASCII.
  REQUIRE(normalizeText("\xdb\xb1\xdb\xb2\xdb\xb3") == "123");
  REQUIRE(normalizeText("\xd9\xa4\xd9\xa5") == "45");
}

TEST_CASE("normalization maps special spaces and drops zero-width marks", "[text]") {
  // no-break space and zero-width non-joiner
  REQUIRE(normalizeText("a\xc2\xa0" "b") == "a b");
  REQUIRE(normalizeText("a\xe2\x80\x8c" "b") == "ab");
  REQUIRE(normalizeText("\xef\xbb\xbftotal") == "total");
}

TEST_CASE("invalid UTF-8 bytes pass through", "[text]") {
  std::string raw = "ab\xff" "C";
  REQUIRE(normalizeText(raw) == "ab\xff" "c");
}

TEST_CASE("keywords and patterns exclude templates", "[text]") {
  TemplateDatabase db = databaseWithText();

  TextExclusionResult result = findExcludedTemplates(normalizeText("ELECTRICITY usage summary"), db);
  REQUIRE(result.excluded == std::set<std::string>{"gas"});

  result = findExcludedTemplates(normalizeText("Subscriber No. 123456"), db);
  REQUIRE(result.excluded == std::set<std::string>{"electric"});
}

TEST_CASE("keywords match across Arabic and Persian letter forms", "[text]") {
  TemplateDatabase db = databaseWithText();
  // Page words separated by a no-break space.
  std::string page = "\xd9\x85\xd8\xb5\xd8\xb1\xd9\x81\xc2\xa0\xda\xaf\xd8\xa7\xd8\xb2";
  REQUIRE(findExcludedTemplates(normalizeText(page), db).excluded.count("electric") == 1);

  // Keyword stored with Persian kaf and yeh, page typed with the Arabic letters.
  TemplateSignature heating;
  heating.templateId = "heating";
  heating.text.exclusionKeywords = {"\xda\xa9\xdb\x8c"};
  db.emplace(heating.templateId, heating);
  REQUIRE(findExcludedTemplates(normalizeText("\xd9\x83\xd9\x8a"), db).excluded.count("heating") == 1);
}

TEST_CASE("patterns match Persian text letter by letter", "[text]") {
  auto excludedBy = [](const std::string& pattern, const std::string& page) {
    TemplateDatabase db;
    TemplateSignature t;
    t.templateId = "t";
    t.text.uniqueTextPatterns = {pattern};
    db.emplace(t.templateId, t);
    return findExcludedTemplates(normalizeText(page), db).excluded.count("t") == 1;
  };

  const std::string gaz = "\xda\xaf\xd8\xa7\xd8\xb2";
  // Persian kaf and gaf share their first UTF-8 byte.
  REQUIRE_FALSE(excludedBy("[\xda\xa9]", gaz));
  REQUIRE(excludedBy("[\xda\xaf]", gaz));

  REQUIRE(excludedBy("^.$", "\xd8\xb2"));
  REQUIRE_FALSE(excludedBy("^.$", gaz));
  REQUIRE(excludedBy("^...$", gaz));

  const std::string shomare = "\xd8\xb4\xd9\x85\xd8\xa7\xd8\xb1\xd9\x87";
  REQUIRE(excludedBy(shomare + " ...$", shomare + " " + gaz));
  REQUIRE_FALSE(excludedBy(shomare + " ....$", shomare + " " + gaz));
}

TEST_CASE("an invalid pattern is reported and skipped", "[text]") {
  TemplateDatabase db = databaseWithText();
  TextExclusionResult result = findExcludedTemplates("nothing to see", db);
  REQUIRE(result.excluded.empty());
  REQUIRE(result.warnings.size() == 1);
  REQUIRE_THAT(result.warnings.front(), Catch::Matchers::ContainsSubstring("water"));
}

TEST_CASE("text detection degrades when extraction fails", "[text]") {
  TemplateDatabase db = databaseWithText();
  testsupport::FakePdfSource pdf;

  TextExclusionResult result = detectByText("missing.pdf", db, pdf);
  REQUIRE(result.excluded.empty());
  REQUIRE(result.warnings.size() == 1);

  testsupport::FakeDocument doc;
  doc.text = "Electricity";
  pdf.add("bill.pdf", doc);
  REQUIRE(detectByText("bill.pdf", db, pdf).excluded.count("gas") == 1);
}
