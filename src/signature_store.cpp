#include "signature_store.hpp"
#include "config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace pdfclassify {

namespace {

std::string readFile(const std::filesystem::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("cannot open file");
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

std::vector<std::filesystem::path> listSignatureFiles(const std::string& signaturesDir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(signaturesDir, ec)) {
    throw ConfigurationError("signatures directory not found: " + signaturesDir);
  }

  std::vector<std::filesystem::path> files;
  std::filesystem::directory_iterator it(signaturesDir, ec);
  if (ec) {
    throw ConfigurationError("cannot read signatures directory " + signaturesDir + ": " + ec.message());
  }
  for (const auto& entry : it) {
    if (entry.is_regular_file(ec) && entry.path().extension() == ".json") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end(), [](const std::filesystem::path& a, const std::filesystem::path& b) {
    return a.filename().string() < b.filename().string();
  });
  return files;
}

} // namespace

TemplateSignature parseTemplateSignature(const std::string& jsonText) {
  nlohmann::json doc = nlohmann::json::parse(jsonText);
  if (!doc.is_object()) {
    throw std::runtime_error("signature document is not a JSON object");
  }
  TemplateSignature sig = doc.get<TemplateSignature>();
  if (sig.templateId.empty()) {
    throw std::runtime_error("template_id is empty");
  }
  return sig;
}

TemplateDatabasePtr loadTemplateDatabase(const std::string& signaturesDir, LoadReport* report) {
  auto db = std::make_shared<TemplateDatabase>();

  for (const auto& path : listSignatureFiles(signaturesDir)) {
    const std::string name = path.filename().string();
    try {
      TemplateSignature sig = parseTemplateSignature(readFile(path));
      if (db->count(sig.templateId) != 0) {
        spdlog::warn("Skipping {}: duplicate template_id '{}'", name, sig.templateId);
        if (report) report->skipped.push_back(name + ": duplicate template_id " + sig.templateId);
        continue;
      }
      std::string id = sig.templateId;
      db->emplace(id, std::move(sig));
      if (report) report->loadedFiles.push_back(name);
    } catch (const std::exception& ex) {
      // nlohmann::json::exception derives from std::exception.
      spdlog::warn("Skipping malformed signature file {}: {}", name, ex.what());
      if (report) report->skipped.push_back(name + ": " + ex.what());
    }
  }

  spdlog::info("Loaded {} template signature(s) from {}", db->size(), signaturesDir);
  return db;
}

} // namespace pdfclassify
