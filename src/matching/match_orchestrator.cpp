#include "fitscore/matching/match_orchestrator.h"

#include "fitscore/matching/credential_matcher.h"
#include "fitscore/matching/experience_matcher.h"
#include "fitscore/matching/grade_classifier.h"
#include "fitscore/matching/penalty_engine.h"
#include "fitscore/matching/score_aggregator.h"
#include "fitscore/matching/sectional_matcher.h"
#include "fitscore/vector/similarity.h"

#include <algorithm>
#include <atomic>
#include <set>
#include <stdexcept>
#include <thread>

namespace fitscore::matching {

namespace {

std::shared_ptr<const config::EngineConfig> require_config(
    std::shared_ptr<const config::EngineConfig> config) {
  if (!config) {
    throw std::invalid_argument("MatchOrchestrator requires a configuration");
  }
  return config;
}

// Cosine for an explanation-only narrative pair; absent sections contribute 0.
core::Result<double, MatchError> narrative_similarity(const vector::Vector& description,
                                                      const vector::Vector& narrative) {
  if (description.empty() || narrative.empty()) {
    return core::Result<double, MatchError>::ok(0.0);
  }
  const auto sim = vector::cosine_similarity(description, narrative);
  if (!sim.has_value()) {
    return core::Result<double, MatchError>::err(
        MatchError{core::MatchErrorKind::kDimensionMismatch, "experience",
                   "description and experience narrative vectors differ in dimension"});
  }
  return core::Result<double, MatchError>::ok(sim.value());
}

void collect_section_flags(const domain::SectionOutcome& section, std::set<std::string>& flags) {
  if (section.candidate_empty) {
    flags.insert("missing_section:" + section.section);
  }
  for (const auto& kind : section.missing_material) {
    flags.insert("missing_section:" + section.section + ":" + kind);
  }
  for (const auto& item : section.items) {
    if (item.degraded) {
      flags.insert("degraded_item:" + item.item_id);
    }
    if (item.vetoed) {
      flags.insert("vetoed:" + item.item_id);
    }
    if (item.near_miss) {
      flags.insert("near_miss:" + item.item_id);
    }
  }
}

}  // namespace

MatchOrchestrator::MatchOrchestrator(std::shared_ptr<const config::EngineConfig> config)
    : config_(require_config(std::move(config))),
      resolver_(config_->thresholds, config_->synonyms),
      expander_(config_->synonyms, resolver_.vocabulary()) {}

core::Result<double, MatchError> MatchOrchestrator::overall_similarity(
    const domain::PositionProfile& position, const domain::CandidateProfile& candidate) {
  // A profile without content scores 0 rather than failing on the size check.
  if (position.profile_vector.empty() || candidate.profile_vector.empty()) {
    return core::Result<double, MatchError>::ok(0.0);
  }
  const auto sim = vector::cosine_similarity(position.profile_vector, candidate.profile_vector);
  if (!sim.has_value()) {
    return core::Result<double, MatchError>::err(MatchError{
        core::MatchErrorKind::kDimensionMismatch, "overall",
        "profile vector dimension " + std::to_string(candidate.profile_vector.size()) +
            " does not match position dimension " +
            std::to_string(position.profile_vector.size())});
  }
  return core::Result<double, MatchError>::ok(sim.value());
}

ScreeningResult MatchOrchestrator::screen(const domain::PositionProfile& position,
                                          const std::vector<domain::CandidateProfile>& candidates,
                                          const ScreeningOptions& options) const {
  ScreeningResult result;
  if (candidates.empty()) {
    return result;
  }

  std::size_t workers = options.workers > 0 ? options.workers : std::thread::hardware_concurrency();
  workers = std::clamp<std::size_t>(workers, 1, candidates.size());

  // Each worker claims indices from a shared counter and writes only its own slots.
  std::vector<std::optional<core::Result<double, MatchError>>> slots(candidates.size());
  std::atomic<std::size_t> next{0};
  const auto work = [&]() {
    for (std::size_t i = next.fetch_add(1); i < candidates.size(); i = next.fetch_add(1)) {
      slots[i] = overall_similarity(position, candidates[i]);
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(workers - 1);
  for (std::size_t w = 1; w < workers; ++w) {
    pool.emplace_back(work);
  }
  work();
  for (auto& thread : pool) {
    thread.join();
  }

  for (std::size_t i = 0; i < candidates.size(); ++i) {
    const auto& slot = slots[i].value();
    if (slot.has_value()) {
      result.hits.push_back(ScreeningHit{candidates[i].candidate_id, slot.value(),
                                         ScoreAggregator::to_percent(slot.value())});
    } else {
      result.rejected.push_back(ScreeningRejection{candidates[i].candidate_id, slot.error()});
    }
  }

  std::sort(result.hits.begin(), result.hits.end(),
            [](const ScreeningHit& a, const ScreeningHit& b) {
              if (a.similarity != b.similarity) {
                return a.similarity > b.similarity;
              }
              return a.candidate_id < b.candidate_id;
            });
  std::sort(result.rejected.begin(), result.rejected.end(),
            [](const ScreeningRejection& a, const ScreeningRejection& b) {
              return a.candidate_id < b.candidate_id;
            });

  if (options.top_k.has_value() && result.hits.size() > options.top_k.value()) {
    result.hits.resize(options.top_k.value());
  }

  return result;
}

core::Result<domain::MatchResult, MatchError> MatchOrchestrator::evaluate(
    const domain::CandidateProfile& candidate, const domain::PositionProfile& position,
    core::IClock& clock) const {
  using R = core::Result<domain::MatchResult, MatchError>;
  const config::EngineConfig& cfg = *config_;

  // 1. Required and preferred sections
  const domain::SectionRequirement section = domain::normalize_section(position.requirements);
  const SectionalMatcher sectional(cfg, expander_, resolver_);
  auto sections = sectional.match(section, candidate);
  if (!sections.has_value()) {
    return R::err(sections.error());
  }
  SectionMatch matched = sections.take_value();

  // 2. Experience, plus narrative evidence for the explanation
  const ExperienceMatcher experience_matcher(cfg.params);
  domain::ExperienceEvidence experience = experience_matcher.match(position, candidate);

  const auto experience_sim =
      narrative_similarity(position.description_vector, candidate.experience_vector);
  if (!experience_sim.has_value()) {
    return R::err(experience_sim.error());
  }
  const auto project_sim =
      narrative_similarity(position.description_vector, candidate.project_vector);
  if (!project_sim.has_value()) {
    return R::err(project_sim.error());
  }
  experience.narrative_similarity = 0.7 * experience_sim.value() + 0.3 * project_sim.value();

  // 3. Whole-profile similarity (shared with the fast stage)
  const auto overall = overall_similarity(position, candidate);
  if (!overall.has_value()) {
    return R::err(overall.error());
  }

  // 4. Credentials
  const CredentialMatcher credentials(expander_);
  const double education =
      CredentialMatcher::education_score(position.min_education, candidate.education);
  const CertificationOutcome certification =
      credentials.certification(position.required_certifications, candidate.certifications);

  // 5. Penalties
  PenaltyInputs penalty_inputs;
  penalty_inputs.level_mismatch = experience.level_mismatch;
  penalty_inputs.significantly_lacking = experience.significantly_lacking;
  penalty_inputs.domain_mismatch =
      PenaltyEngine::tags_disjoint(position.domain_tags, candidate.domain_tags, expander_);
  penalty_inputs.role_mismatch =
      PenaltyEngine::tags_disjoint(position.role_tags, candidate.role_tags, expander_);
  penalty_inputs.required_total = matched.required.items.size();
  penalty_inputs.required_missing = matched.required.missing_items.size();
  penalty_inputs.critical_missing = std::any_of(
      matched.required.items.begin(), matched.required.items.end(),
      [](const domain::ItemEvidence& item) { return item.critical && !item.matched; });

  const PenaltyEngine penalty_engine(cfg.penalties, cfg.params);
  PenaltyBreakdown penalties = penalty_engine.compute(penalty_inputs);

  // 6. Aggregate and grade
  CategoryInputs inputs;
  inputs.required = matched.required.score;
  inputs.preferred = matched.preferred.score;
  inputs.experience = experience.fit;
  inputs.overall = overall.value();
  inputs.education = education;
  inputs.certification = certification.score;

  const ScoreAggregator aggregator(cfg.weights);
  AggregateScore aggregate = aggregator.aggregate(inputs, penalties.total());
  const GradeClassifier grades(cfg.grades);

  // 7. Flags (sorted, unique)
  std::set<std::string> flags;
  collect_section_flags(matched.required, flags);
  collect_section_flags(matched.preferred, flags);
  if (candidate.profile_vector.empty()) {
    flags.insert("missing_section:overall");
  }
  if (experience.level_mismatch) {
    flags.insert("experience:level_mismatch");
  }
  if (experience.significantly_lacking) {
    flags.insert("experience:significantly_lacking");
  }
  if (experience.candidate_level_derived) {
    flags.insert("experience:level_derived");
  }
  if (penalty_inputs.domain_mismatch) {
    flags.insert("domain_mismatch");
  }
  if (penalty_inputs.role_mismatch) {
    flags.insert("role_mismatch");
  }
  if (penalties.experience_capped) {
    flags.insert("experience_penalty_capped");
  }
  for (const auto& cert : certification.missing) {
    flags.insert("certification_missing:" + cert);
  }

  domain::MatchResult result;
  result.candidate_id = candidate.candidate_id;
  result.position_id = position.position_id;
  result.config_version = cfg.config_version;
  result.policy_version = cfg.policy_version;
  result.overall_percent = aggregate.percent;
  result.grade = grades.classify(aggregate.percent);
  result.weighted_sum = aggregate.weighted_sum;
  result.penalty_total = aggregate.penalty_total;
  result.categories = std::move(aggregate.categories);
  result.required = std::move(matched.required);
  result.preferred = std::move(matched.preferred);
  result.experience = experience;
  result.penalties = std::move(penalties.applied);
  result.flags.assign(flags.begin(), flags.end());
  result.calculated_at = clock.now_unix_micros();

  return R::ok(std::move(result));
}

}  // namespace fitscore::matching
