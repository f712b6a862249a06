#pragma once

#include "pdf_source.hpp"
#include "signature.hpp"

#include <set>
#include <string>
#include <vector>

namespace pdfclassify {

struct TextExclusionResult {
  std::set<std::string> excluded;
  std::vector<std::string> warnings;
};

// First-page text, or an empty string if extraction fails for any reason.
std::string extractFirstPageText(const std::string& pdfPath, PdfSource& pdf);

// Lowercases ASCII, folds Arabic letter and digit variants to their Persian or
// ASCII forms, maps Unicode spaces to ' ', drops zero-width marks, collapses
// whitespace runs and trims.
std::string normalizeText(const std::string& utf8);

// Templates the normalized text rules out. Never selects a template.
// Keywords match as normalized substrings; patterns are ECMAScript regexes
// matched per code point.
TextExclusionResult findExcludedTemplates(const std::string& normalizedText, const TemplateDatabase& db);

TextExclusionResult detectByText(const std::string& pdfPath, const TemplateDatabase& db, PdfSource& pdf);

} // namespace pdfclassify
