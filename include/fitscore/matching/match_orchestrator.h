#pragma once

#include "fitscore/config/engine_config.h"
#include "fitscore/core/clock.h"
#include "fitscore/core/result.h"
#include "fitscore/domain/candidate_profile.h"
#include "fitscore/domain/match_result.h"
#include "fitscore/domain/position_profile.h"
#include "fitscore/matching/match_error.h"
#include "fitscore/matching/synonym_expander.h"
#include "fitscore/matching/threshold_resolver.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fitscore::matching {

struct ScreeningOptions {
  std::optional<std::size_t> top_k;  // keep only the best k hits
  std::size_t workers{0};            // 0 = std::thread::hardware_concurrency()
};

struct ScreeningHit {
  std::string candidate_id;  // NOLINT(readability-identifier-naming)
  double similarity{0.0};    // raw whole-profile cosine
  double percent{0.0};       // similarity clamped to [0, 1], scaled to one-decimal percent
};

struct ScreeningRejection {
  std::string candidate_id;  // NOLINT(readability-identifier-naming)
  MatchError error;          // NOLINT(readability-identifier-naming)
};

struct ScreeningResult {
  std::vector<ScreeningHit> hits;            // similarity desc, candidate_id asc
  std::vector<ScreeningRejection> rejected;  // candidate_id asc
};

// MatchOrchestrator exposes the two evaluation stages over one immutable configuration.
//
// - screen(): fast stage. One cosine per candidate over whole-profile vectors, fanned out
//   over a bounded pool of worker threads, then sorted. No penalties, no explanation.
// - evaluate(): detailed stage. Sections, experience, credentials, penalties, aggregation
//   and grading with full per-item evidence.
//
// Both stages are const and side-effect free; the only non-input value in a MatchResult is
// calculated_at, taken from the caller's clock. The overall category of evaluate() is
// computed by the same function as the screen() similarity, so the two agree exactly.
class MatchOrchestrator {
 public:
  explicit MatchOrchestrator(std::shared_ptr<const config::EngineConfig> config);

  // Disable copy/move (members reference each other)
  MatchOrchestrator(const MatchOrchestrator&) = delete;
  MatchOrchestrator& operator=(const MatchOrchestrator&) = delete;
  MatchOrchestrator(MatchOrchestrator&&) = delete;
  MatchOrchestrator& operator=(MatchOrchestrator&&) = delete;
  ~MatchOrchestrator() = default;

  [[nodiscard]] ScreeningResult screen(const domain::PositionProfile& position,
                                       const std::vector<domain::CandidateProfile>& candidates,
                                       const ScreeningOptions& options = {}) const;

  [[nodiscard]] core::Result<domain::MatchResult, MatchError> evaluate(
      const domain::CandidateProfile& candidate, const domain::PositionProfile& position,
      core::IClock& clock) const;

  // overall_similarity is the overall category score: cosine of the whole-profile vectors.
  // An empty vector on either side scores 0; differing non-empty dimensions are an error.
  [[nodiscard]] static core::Result<double, MatchError> overall_similarity(
      const domain::PositionProfile& position, const domain::CandidateProfile& candidate);

  [[nodiscard]] const config::EngineConfig& config() const { return *config_; }

 private:
  std::shared_ptr<const config::EngineConfig> config_;
  ThresholdResolver resolver_;
  SynonymExpander expander_;
};

}  // namespace fitscore::matching
