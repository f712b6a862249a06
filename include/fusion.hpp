#pragma once

#include "config.hpp"
#include "signature.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace pdfclassify {

inline const std::string kUnknownTemplate = "unknown_template";

// Ambiguity is reported when the runner-up is closer than this to the winner.
constexpr double kAmbiguityGap = 0.15;
constexpr size_t kTopCandidateCount = 3;

struct Candidate {
  std::string templateId;
  double score = 0.0;
};

struct DetectionDetails {
  // Highest ranked candidate, reported even when it falls under the threshold.
  std::string bestCandidate;
  double visualScore = 0.0;
  double structureScore = 0.0;
  std::vector<std::string> excludedTemplates;
  std::vector<std::string> warnings;
  // Filled only when more than one candidate was ranked.
  std::vector<Candidate> topCandidates;
  ScoreMap regionScores;
  double processingSeconds = 0.0;
};

struct DetectionResult {
  std::string templateId = kUnknownTemplate;
  double confidence = 0.0;
  DetectionDetails details;

  bool matched() const { return templateId != kUnknownTemplate; }
};

// Candidates are the scored ids minus `excluded`, ranked by fused score and
// then by id. Below `threshold` the result is unknown_template carrying the
// best score as its confidence.
DetectionResult fuseResults(const ScoreMap& visual, const ScoreMap& structure,
                            const std::set<std::string>& excluded, double threshold = 0.5,
                            const FusionWeights& weights = FusionWeights(),
                            const std::vector<std::string>& upstreamWarnings = {});

std::vector<Candidate> rankCandidates(const ScoreMap& visual, const ScoreMap& structure,
                                      const std::set<std::string>& excluded,
                                      const FusionWeights& weights);

void to_json(nlohmann::json& j, const Candidate& c);
void to_json(nlohmann::json& j, const DetectionDetails& d);

nlohmann::json toJson(const DetectionResult& result);

} // namespace pdfclassify
