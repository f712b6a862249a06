#pragma once

#include "config.hpp"
#include "detection_cache.hpp"
#include "fusion.hpp"
#include "pdf_source.hpp"
#include "signature.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace pdfclassify {

struct DetectionStats {
  size_t total = 0;
  size_t successful = 0;
  // Every non-error detection that ended in unknown_template.
  size_t unknown = 0;
  // The part of `unknown` that had a candidate, just under the threshold.
  size_t lowConfidence = 0;
  size_t errors = 0;
};

// Owns the template database, the cache and the PDF backend used by detect().
// Loading the database is synchronized; concurrent detect() calls on one
// instance are not.
class TemplateClassifier {
public:
  // Loads signatures from config.signaturesDir. Throws ConfigurationError when
  // the configuration is invalid or the directory cannot be read.
  explicit TemplateClassifier(ClassifierConfig config, std::shared_ptr<PdfSource> pdf = nullptr);

  // Uses an already loaded database; config.signaturesDir is ignored.
  TemplateClassifier(TemplateDatabasePtr db, std::shared_ptr<PdfSource> pdf = nullptr,
                     ClassifierConfig config = ClassifierConfig());

  // Never throws for a per-document failure: the result is unknown_template
  // with the reason in details.warnings.
  DetectionResult detect(const std::string& pdfPath, const DetectOptions& options = DetectOptions());

  // Loaded once and kept until clearCache(), also when config.useCache is off.
  TemplateDatabasePtr database();
  DetectionStats statistics() const;
  const DetectionCache& cache() const { return cache_; }
  const ClassifierConfig& config() const { return config_; }

  // Drops rasters, region features and the database slot. The database is
  // reloaded on next use.
  void clearCache();

private:
  DetectionResult runDetection(const std::string& pdfPath, const DetectOptions& options);
  void record(const DetectionResult& result, bool failed);

  ClassifierConfig config_;
  std::shared_ptr<PdfSource> pdf_;
  TemplateDatabasePtr suppliedDb_;
  DetectionCache cache_;
  DetectionStats stats_;
  mutable std::mutex mutex_;
};

// One-shot detection against the signatures in `signaturesDir`, rendered with
// poppler-utils. Throws ConfigurationError for a bad directory.
DetectionResult detectTemplate(const std::string& pdfPath, const std::string& signaturesDir,
                               const DetectOptions& options = DetectOptions());

DetectionResult detectTemplate(const std::string& pdfPath, TemplateDatabasePtr db,
                               const DetectOptions& options = DetectOptions());

} // namespace pdfclassify
