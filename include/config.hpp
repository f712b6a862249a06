#pragma once

#include <stdexcept>
#include <string>

namespace pdfclassify {

// The only failure that escapes detection: a classifier that cannot be configured.
class ConfigurationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct FusionWeights {
  double visual = 0.6;
  double structure = 0.4;
};

struct ClassifierConfig {
  std::string signaturesDir;
  int renderDpi = 300;
  bool useCache = true;

  // Fills `error` and returns false when the configuration cannot be used.
  // The directory check is skipped for a classifier handed a loaded database.
  bool validate(std::string& error, bool requireSignaturesDir = true) const;
};

// Per-call options, one per keyword of the detection entry point.
struct DetectOptions {
  double confidenceThreshold = 0.5;
  bool useTextExclusion = true;
  bool useVisual = true;
  bool useStructure = true;
  FusionWeights weights;
};

} // namespace pdfclassify
