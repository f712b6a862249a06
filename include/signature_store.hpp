#pragma once

#include "signature.hpp"

#include <string>
#include <vector>

namespace pdfclassify {

struct LoadReport {
  std::vector<std::string> loadedFiles;
  // One entry per skipped file: "<file>: <reason>".
  std::vector<std::string> skipped;
};

// Parses a single signature document. Throws std::runtime_error (including
// nlohmann::json exceptions) when the document is malformed.
TemplateSignature parseTemplateSignature(const std::string& jsonText);

// Reads every *.json file in `signaturesDir` in filename order. Malformed files
// are skipped and recorded in `report`; the first file to declare an id wins.
// Throws ConfigurationError when the directory is missing or unreadable.
TemplateDatabasePtr loadTemplateDatabase(const std::string& signaturesDir, LoadReport* report = nullptr);

} // namespace pdfclassify
