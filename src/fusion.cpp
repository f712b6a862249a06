#include "fusion.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>

namespace pdfclassify {

namespace {

double scoreOf(const ScoreMap& scores, const std::string& id) {
  auto it = scores.find(id);
  return it == scores.end() ? 0.0 : it->second;
}

} // namespace

std::vector<Candidate> rankCandidates(const ScoreMap& visual, const ScoreMap& structure,
                                      const std::set<std::string>& excluded,
                                      const FusionWeights& weights) {
  std::set<std::string> ids;
  for (const auto& kv : visual) ids.insert(kv.first);
  for (const auto& kv : structure) ids.insert(kv.first);

  std::vector<Candidate> ranked;
  for (const std::string& id : ids) {
    if (excluded.count(id) != 0) continue;
    double fused = scoreOf(visual, id) * weights.visual + scoreOf(structure, id) * weights.structure;
    ranked.push_back({id, fused});
  }

  std::sort(ranked.begin(), ranked.end(), [](const Candidate& a, const Candidate& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.templateId < b.templateId;
  });
  return ranked;
}

DetectionResult fuseResults(const ScoreMap& visual, const ScoreMap& structure,
                            const std::set<std::string>& excluded, double threshold,
                            const FusionWeights& weights,
                            const std::vector<std::string>& upstreamWarnings) {
  DetectionResult result;
  DetectionDetails& details = result.details;
  details.excludedTemplates.assign(excluded.begin(), excluded.end());
  details.warnings = upstreamWarnings;

  std::vector<Candidate> ranked = rankCandidates(visual, structure, excluded, weights);
  if (ranked.empty()) {
    details.warnings.push_back(visual.empty() && structure.empty()
                                 ? "No templates scored"
                                 : "All scored templates excluded by text detection");
    return result;
  }

  const Candidate& best = ranked.front();
  details.bestCandidate = best.templateId;
  details.visualScore = scoreOf(visual, best.templateId);
  details.structureScore = scoreOf(structure, best.templateId);

  if (ranked.size() > 1) {
    const Candidate& second = ranked[1];
    if (best.score - second.score < kAmbiguityGap) {
      details.warnings.push_back(fmt::format("Ambiguous detection: {} ({:.3f}) vs {} ({:.3f})",
                                             best.templateId, best.score, second.templateId, second.score));
    }
    size_t n = std::min(kTopCandidateCount, ranked.size());
    details.topCandidates.assign(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(n));
  }

  result.confidence = best.score;
  if (best.score < threshold) {
    details.warnings.push_back(fmt::format("Confidence {:.3f} below threshold {:.3f} (best: {})",
                                           best.score, threshold, best.templateId));
    spdlog::debug("Best candidate {} scored {:.3f}, under threshold {:.3f}", best.templateId, best.score,
                  threshold);
    return result;
  }

  result.templateId = best.templateId;
  return result;
}

void to_json(nlohmann::json& j, const Candidate& c) {
  j = nlohmann::json{{"template_id", c.templateId}, {"score", c.score}};
}

void to_json(nlohmann::json& j, const DetectionDetails& d) {
  j = nlohmann::json{
    {"best_candidate", d.bestCandidate},
    {"visual_score", d.visualScore},
    {"structure_score", d.structureScore},
    {"excluded_templates", d.excludedTemplates},
    {"warnings", d.warnings},
    {"processing_time", d.processingSeconds},
  };
  if (!d.topCandidates.empty()) j["top_candidates"] = d.topCandidates;
  if (!d.regionScores.empty()) j["region_scores"] = d.regionScores;
}

nlohmann::json toJson(const DetectionResult& result) {
  return nlohmann::json{
    {"template_id", result.templateId},
    {"confidence", result.confidence},
    {"details", result.details},
  };
}

} // namespace pdfclassify
