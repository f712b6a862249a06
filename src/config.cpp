#include "config.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace pdfclassify {

bool ClassifierConfig::validate(std::string& error, bool requireSignaturesDir) const {
  if (renderDpi < 36 || renderDpi > 1200) {
    error = "renderDpi must be between 36 and 1200";
    return false;
  }
  if (!requireSignaturesDir) return true;

  if (signaturesDir.empty()) {
    error = "signaturesDir is required";
    return false;
  }
  std::error_code ec;
  if (!std::filesystem::exists(signaturesDir, ec)) {
    error = "signatures directory not found: " + signaturesDir;
    return false;
  }
  if (!std::filesystem::is_directory(signaturesDir, ec)) {
    error = "signatures path is not a directory: " + signaturesDir;
    return false;
  }
  return true;
}

} // namespace pdfclassify
