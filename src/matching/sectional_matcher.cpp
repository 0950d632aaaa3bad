#include "fitscore/matching/sectional_matcher.h"

#include "fitscore/vector/similarity.h"

namespace fitscore::matching {

namespace {

using EvidenceResult = core::Result<domain::ItemEvidence, MatchError>;

MatchError dimension_error(const std::string& section_name, const domain::RequirementItem& item) {
  return MatchError{core::MatchErrorKind::kDimensionMismatch, section_name,
                    "vector dimension mismatch while matching item " + item.item_id};
}

domain::ItemEvidence base_evidence(const domain::RequirementItem& item, const double weight) {
  domain::ItemEvidence evidence;
  evidence.item_id = item.item_id;
  evidence.text = item.text;
  evidence.kind = item.kind;
  evidence.critical = item.critical;
  evidence.weight = weight;
  return evidence;
}

}  // namespace

SectionalMatcher::SectionalMatcher(const config::EngineConfig& config,
                                   const SynonymExpander& expander,
                                   const ThresholdResolver& resolver)
    : config_(config), expander_(expander), resolver_(resolver) {}

core::Result<SectionMatch, MatchError> SectionalMatcher::match(
    const domain::SectionRequirement& section, const domain::CandidateProfile& candidate) const {
  auto required = match_priority(section, domain::ItemPriority::kRequired, candidate);
  if (!required.has_value()) {
    return core::Result<SectionMatch, MatchError>::err(required.error());
  }

  auto preferred = match_priority(section, domain::ItemPriority::kPreferred, candidate);
  if (!preferred.has_value()) {
    return core::Result<SectionMatch, MatchError>::err(preferred.error());
  }

  return core::Result<SectionMatch, MatchError>::ok(
      SectionMatch{required.take_value(), preferred.take_value()});
}

core::Result<domain::SectionOutcome, MatchError> SectionalMatcher::match_priority(
    const domain::SectionRequirement& section, const domain::ItemPriority priority,
    const domain::CandidateProfile& candidate) const {
  using R = core::Result<domain::SectionOutcome, MatchError>;

  domain::SectionOutcome outcome;
  outcome.section = domain::to_string(priority);

  const auto items = section.with_priority(priority);
  if (items.empty()) {
    // Nothing to fail: a position omitting a section is not penalized.
    outcome.requirement_empty = true;
    outcome.score = 1.0;
    return R::ok(std::move(outcome));
  }

  bool candidate_has_material = false;
  bool lacks_skills = false;
  bool lacks_narrative = false;
  for (const auto* item : items) {
    const bool is_skill = item->kind == domain::ItemKind::kSkill;
    const bool has_material = is_skill ? !candidate.skills.empty() : !candidate.sentences.empty();
    candidate_has_material = candidate_has_material || has_material;
    if (!has_material && is_skill) {
      lacks_skills = true;
    } else if (!has_material) {
      lacks_narrative = true;
    }

    auto evidence = item->kind == domain::ItemKind::kSkill
                        ? match_skill_item(*item, candidate, outcome.section)
                        : match_sentence_item(*item, candidate, outcome.section);
    if (!evidence.has_value()) {
      return R::err(evidence.error());
    }

    domain::ItemEvidence e = evidence.take_value();
    outcome.total_weight += e.weight;
    if (e.matched) {
      outcome.matched_weight += e.weight;
      outcome.matched_items.push_back(e.item_id);
    } else {
      outcome.missing_items.push_back(e.item_id);
    }
    if (e.degraded) {
      outcome.degraded_items.push_back(e.item_id);
    }
    outcome.items.push_back(std::move(e));
  }

  outcome.candidate_empty = !candidate_has_material;
  if (lacks_skills) {
    outcome.missing_material.emplace_back("skills");
  }
  if (lacks_narrative) {
    outcome.missing_material.emplace_back("narrative");
  }
  outcome.score = outcome.total_weight > 0.0 ? outcome.matched_weight / outcome.total_weight : 0.0;
  return R::ok(std::move(outcome));
}

EvidenceResult SectionalMatcher::match_skill_item(const domain::RequirementItem& item,
                                                  const domain::CandidateProfile& candidate,
                                                  const std::string& section_name) const {
  const double weight = item.critical ? config_.params.critical_weight : 1.0;
  domain::ItemEvidence evidence = base_evidence(item, weight);

  if (!item.validate().has_value()) {
    evidence.degraded = true;
    evidence.threshold = resolver_.resolve_default().threshold;
    return EvidenceResult::ok(std::move(evidence));
  }

  const domain::SkillToken required = expander_.expand(item.text);
  const ThresholdResolution resolution = resolver_.resolve(required.canonical);
  evidence.threshold = resolution.threshold;
  evidence.dominant_token = required.canonical;
  evidence.conflict_group = resolution.group;

  // Lexical equality wins outright.
  for (const auto& skill : candidate.skills) {
    if (expander_.same_skill(required.canonical, skill.token)) {
      evidence.matched = true;
      evidence.basis = domain::MatchBasis::kLexical;
      evidence.best_similarity = 1.0;
      evidence.matched_candidate_item = skill.token;
      return EvidenceResult::ok(std::move(evidence));
    }
  }

  const domain::CandidateSkill* best = nullptr;
  double best_similarity = 0.0;
  if (vector::has_magnitude(item.vector)) {
    for (const auto& skill : candidate.skills) {
      if (skill.context_vector.empty()) {
        continue;
      }
      const auto sim = vector::cosine_similarity(item.vector, skill.context_vector);
      if (!sim.has_value()) {
        return EvidenceResult::err(dimension_error(section_name, item));
      }
      if (best == nullptr || sim.value() > best_similarity) {
        best = &skill;
        best_similarity = sim.value();
      }
    }
  }

  evidence.best_similarity = best_similarity;
  if (best != nullptr && best_similarity >= resolution.threshold) {
    const std::string candidate_text = best->token + " " + best->context_text;
    const bool vetoed = resolver_.should_veto(required.canonical,
                                              expander_.canonicalize(best->token),
                                              expander_.mentions(candidate_text, required));
    if (vetoed) {
      evidence.vetoed = true;
    } else {
      evidence.matched = true;
      evidence.basis = domain::MatchBasis::kSemantic;
      evidence.matched_candidate_item = best->token;
    }
  }

  finish_evidence(evidence);
  return EvidenceResult::ok(std::move(evidence));
}

EvidenceResult SectionalMatcher::match_sentence_item(const domain::RequirementItem& item,
                                                     const domain::CandidateProfile& candidate,
                                                     const std::string& section_name) const {
  const double weight = item.critical ? config_.params.critical_weight : 1.0;
  domain::ItemEvidence evidence = base_evidence(item, weight);

  const auto dominant = expander_.dominant_term(item.text);
  const ThresholdResolution resolution =
      dominant.has_value() ? resolver_.resolve(dominant.value()) : resolver_.resolve_default();
  evidence.threshold = resolution.threshold;
  evidence.dominant_token = dominant;
  evidence.conflict_group = resolution.group;

  if (!item.validate().has_value() || !vector::has_magnitude(item.vector)) {
    evidence.degraded = true;
    return EvidenceResult::ok(std::move(evidence));
  }

  const domain::NarrativeSentence* best = nullptr;
  double best_similarity = 0.0;
  for (const auto& sentence : candidate.sentences) {
    if (sentence.vector.empty()) {
      continue;
    }
    const auto sim = vector::cosine_similarity(item.vector, sentence.vector);
    if (!sim.has_value()) {
      return EvidenceResult::err(dimension_error(section_name, item));
    }
    if (best == nullptr || sim.value() > best_similarity) {
      best = &sentence;
      best_similarity = sim.value();
    }
  }

  evidence.best_similarity = best_similarity;
  if (best != nullptr && best_similarity >= resolution.threshold) {
    bool vetoed = false;
    if (dominant.has_value()) {
      vetoed = resolver_.should_veto(dominant.value(), expander_.dominant_term(best->text),
                                     expander_.mentions(best->text,
                                                        expander_.expand(dominant.value())));
    }
    if (vetoed) {
      evidence.vetoed = true;
    } else {
      evidence.matched = true;
      evidence.basis = domain::MatchBasis::kSemantic;
      evidence.matched_candidate_item = best->text;
    }
  }

  finish_evidence(evidence);
  return EvidenceResult::ok(std::move(evidence));
}

void SectionalMatcher::finish_evidence(domain::ItemEvidence& evidence) const {
  if (evidence.matched || evidence.vetoed || evidence.degraded) {
    return;
  }
  evidence.near_miss = evidence.best_similarity > 0.0 &&
                       evidence.best_similarity >=
                           evidence.threshold - config_.params.near_miss_margin;
}

}  // namespace fitscore::matching
