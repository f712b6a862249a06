#include "classifier.hpp"
#include "signature_store.hpp"
#include "structure_detector.hpp"
#include "text_detector.hpp"
#include "visual_detector.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <set>
#include <utility>
#include <vector>

namespace pdfclassify {

namespace {

std::shared_ptr<PdfSource> orDefaultSource(std::shared_ptr<PdfSource> pdf) {
  if (pdf) return pdf;
  return std::make_shared<PopplerUtilsSource>();
}

void appendWarnings(std::vector<std::string>& out, const std::vector<std::string>& in) {
  out.insert(out.end(), in.begin(), in.end());
}

} // namespace

TemplateClassifier::TemplateClassifier(ClassifierConfig config, std::shared_ptr<PdfSource> pdf)
  : config_(std::move(config)), pdf_(orDefaultSource(std::move(pdf))) {
  std::string error;
  if (!config_.validate(error)) {
    throw ConfigurationError(error);
  }
  database();
}

TemplateClassifier::TemplateClassifier(TemplateDatabasePtr db, std::shared_ptr<PdfSource> pdf,
                                       ClassifierConfig config)
  : config_(std::move(config)), pdf_(orDefaultSource(std::move(pdf))), suppliedDb_(std::move(db)) {
  std::string error;
  if (!config_.validate(error, false)) {
    throw ConfigurationError(error);
  }
  if (!suppliedDb_) {
    throw ConfigurationError("template database is null");
  }
  cache_.storeTemplateDatabase(suppliedDb_);
}

TemplateDatabasePtr TemplateClassifier::database() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (suppliedDb_) {
    if (!cache_.templateDatabase()) cache_.storeTemplateDatabase(suppliedDb_);
    return suppliedDb_;
  }
  TemplateDatabasePtr db = cache_.templateDatabase();
  if (!db) {
    db = loadTemplateDatabase(config_.signaturesDir);
    cache_.storeTemplateDatabase(db);
  }
  return db;
}

DetectionStats TemplateClassifier::statistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void TemplateClassifier::clearCache() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.clear();
}

DetectionResult TemplateClassifier::runDetection(const std::string& pdfPath, const DetectOptions& options) {
  TemplateDatabasePtr db = database();

  // Without the shared cache a call still renders once, through a cache of its own.
  DetectionCache callCache;
  DetectionCache* cache = config_.useCache ? &cache_ : &callCache;

  std::vector<std::string> warnings;
  std::set<std::string> excluded;
  if (options.useTextExclusion) {
    TextExclusionResult text = detectByText(pdfPath, *db, *pdf_);
    excluded = std::move(text.excluded);
    appendWarnings(warnings, text.warnings);
  }

  VisualResult visual;
  if (options.useVisual) {
    visual = detectByVisual(pdfPath, *db, *pdf_, config_.renderDpi, cache);
    appendWarnings(warnings, visual.warnings);
  }

  StructureResult structure;
  if (options.useStructure) {
    structure = detectByStructure(pdfPath, *db, *pdf_, config_.renderDpi, cache);
    appendWarnings(warnings, structure.warnings);
  }

  DetectionResult result = fuseResults(visual.scores, structure.scores, excluded,
                                       options.confidenceThreshold, options.weights, warnings);

  auto regions = visual.regionScores.find(result.details.bestCandidate);
  if (regions != visual.regionScores.end()) {
    result.details.regionScores = regions->second;
  }
  return result;
}

void TemplateClassifier::record(const DetectionResult& result, bool failed) {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_.total++;
  if (failed) {
    stats_.errors++;
  } else if (result.matched()) {
    stats_.successful++;
  } else {
    stats_.unknown++;
    if (result.confidence > 0.0) stats_.lowConfidence++;
  }
}

DetectionResult TemplateClassifier::detect(const std::string& pdfPath, const DetectOptions& options) {
  auto start = std::chrono::steady_clock::now();

  DetectionResult result;
  bool failed = false;
  try {
    result = runDetection(pdfPath, options);
  } catch (const std::exception& ex) {
    spdlog::error("Template detection failed for {}: {}", pdfPath, ex.what());
    result = DetectionResult();
    result.details.warnings.push_back(std::string("Detection failed: ") + ex.what());
    failed = true;
  }

  std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
  result.details.processingSeconds = elapsed.count();
  record(result, failed);

  spdlog::info("Detected {} for {} (confidence {:.3f}, {:.1f} ms, {} warning(s))", result.templateId, pdfPath,
               result.confidence, elapsed.count() * 1000.0, result.details.warnings.size());
  for (const std::string& warning : result.details.warnings) {
    spdlog::debug("  {}", warning);
  }
  return result;
}

DetectionResult detectTemplate(const std::string& pdfPath, const std::string& signaturesDir,
                               const DetectOptions& options) {
  ClassifierConfig config;
  config.signaturesDir = signaturesDir;
  TemplateClassifier classifier(config);
  return classifier.detect(pdfPath, options);
}

DetectionResult detectTemplate(const std::string& pdfPath, TemplateDatabasePtr db, const DetectOptions& options) {
  TemplateClassifier classifier(std::move(db));
  return classifier.detect(pdfPath, options);
}

} // namespace pdfclassify
