#include "fitscore/config/presets.h"
#include "fitscore/matching/sectional_matcher.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace fitscore;

namespace {

// Members reference each other; declaration order is construction order.
struct MatcherFixture {
  config::EngineConfig cfg = config::default_engine_config();
  matching::ThresholdResolver resolver{cfg.thresholds, cfg.synonyms};
  matching::SynonymExpander expander{cfg.synonyms, resolver.vocabulary()};
  matching::SectionalMatcher matcher{cfg, expander, resolver};
};

domain::RequirementItem skill_item(const std::string& id, const std::string& token,
                                   vector::Vector v = {}, bool critical = false) {
  domain::RequirementItem item;
  item.item_id = id;
  item.kind = domain::ItemKind::kSkill;
  item.priority = domain::ItemPriority::kRequired;
  item.text = token;
  item.critical = critical;
  item.vector = std::move(v);
  return item;
}

domain::RequirementItem sentence_item(const std::string& id, const std::string& text,
                                      vector::Vector v) {
  domain::RequirementItem item;
  item.item_id = id;
  item.kind = domain::ItemKind::kSentence;
  item.priority = domain::ItemPriority::kRequired;
  item.text = text;
  item.vector = std::move(v);
  return item;
}

domain::SectionOutcome required_outcome(const MatcherFixture& f,
                                        const domain::SectionRequirement& section,
                                        const domain::CandidateProfile& candidate) {
  auto result = f.matcher.match_priority(section, domain::ItemPriority::kRequired, candidate);
  REQUIRE(result.has_value());
  return result.value();
}

}  // namespace

TEST_CASE("Skill items match lexically through synonyms", "[matching][sectional]") {
  MatcherFixture f;
  domain::SectionRequirement section;
  section.items = {skill_item("req-0", "Kubernetes")};

  domain::CandidateProfile candidate;
  candidate.skills = {{"k8s", "Ran clusters", {}}};

  const auto outcome = required_outcome(f, section, candidate);
  REQUIRE(outcome.score == 1.0);
  REQUIRE(outcome.items[0].matched);
  REQUIRE(outcome.items[0].basis == domain::MatchBasis::kLexical);
  REQUIRE(outcome.items[0].best_similarity == 1.0);
  REQUIRE(outcome.items[0].matched_candidate_item == "k8s");
  REQUIRE(outcome.match_rate() == "1/1");
}

TEST_CASE("Skill items fall back to context similarity", "[matching][sectional]") {
  MatcherFixture f;
  domain::SectionRequirement section;
  section.items = {skill_item("req-0", "Terraform", {1.0F, 0.0F, 0.0F})};

  domain::CandidateProfile candidate;
  candidate.skills = {{"Pulumi", "Infrastructure as code", {0.9F, 0.1F, 0.0F}}};

  const auto outcome = required_outcome(f, section, candidate);
  const auto& item = outcome.items[0];
  REQUIRE(item.matched);
  REQUIRE(item.basis == domain::MatchBasis::kSemantic);
  REQUIRE(item.threshold == 0.6);
  REQUIRE(item.matched_candidate_item == "Pulumi");
  REQUIRE(item.best_similarity > 0.99);
}

TEST_CASE("Conflict group veto on skill items", "[matching][sectional][veto]") {
  MatcherFixture f;
  domain::SectionRequirement section;
  section.items = {skill_item("req-0", "Java", {1.0F, 0.0F, 0.0F})};

  SECTION("similar but conflicting technology is vetoed") {
    domain::CandidateProfile candidate;
    candidate.skills = {{"Python", "Built Django services", {0.95F, 0.05F, 0.0F}}};

    const auto outcome = required_outcome(f, section, candidate);
    const auto& item = outcome.items[0];
    REQUIRE(item.best_similarity >= item.threshold);
    REQUIRE_FALSE(item.matched);
    REQUIRE(item.vetoed);
    REQUIRE_FALSE(item.near_miss);
    REQUIRE(item.conflict_group == "jvm_backend");
    REQUIRE(outcome.score == 0.0);
  }

  SECTION("a lexical mention of the required token lifts the veto") {
    domain::CandidateProfile candidate;
    candidate.skills = {{"Python", "Ported Java services to Python", {0.95F, 0.05F, 0.0F}}};

    const auto outcome = required_outcome(f, section, candidate);
    REQUIRE(outcome.items[0].matched);
    REQUIRE_FALSE(outcome.items[0].vetoed);
  }

  SECTION("same group is not vetoed") {
    domain::CandidateProfile candidate;
    candidate.skills = {{"Kotlin", "Android backends", {0.95F, 0.05F, 0.0F}}};

    const auto outcome = required_outcome(f, section, candidate);
    REQUIRE(outcome.items[0].matched);
    REQUIRE(outcome.items[0].basis == domain::MatchBasis::kSemantic);
  }
}

TEST_CASE("Conflict groups listing an alias still veto", "[matching][sectional][veto]") {
  config::EngineConfig cfg = config::default_engine_config();
  cfg.thresholds.groups.push_back(config::ConflictGroup{"go_stack", {"golang"}, std::nullopt});
  const matching::ThresholdResolver resolver(cfg.thresholds, cfg.synonyms);
  const matching::SynonymExpander expander(cfg.synonyms, resolver.vocabulary());
  const matching::SectionalMatcher matcher(cfg, expander, resolver);

  domain::SectionRequirement section;
  section.items = {skill_item("req-0", "Go", {1.0F, 0.0F, 0.0F})};
  domain::CandidateProfile candidate;
  candidate.skills = {{"Java", "Built payment services", {0.95F, 0.05F, 0.0F}}};

  auto result = matcher.match_priority(section, domain::ItemPriority::kRequired, candidate);
  REQUIRE(result.has_value());
  const auto& item = result.value().items[0];
  REQUIRE(item.best_similarity >= item.threshold);
  REQUIRE(item.conflict_group == "go_stack");
  REQUIRE(item.vetoed);
  REQUIRE_FALSE(item.matched);
}

TEST_CASE("Sentence items use the best narrative sentence", "[matching][sectional]") {
  MatcherFixture f;

  SECTION("match records the winning sentence") {
    domain::SectionRequirement section;
    section.items = {sentence_item("req-0", "Experience building REST APIs", {0.0F, 1.0F, 0.0F})};

    domain::CandidateProfile candidate;
    candidate.sentences = {{"Cooked meals", {1.0F, 0.0F, 0.0F}},
                           {"Designed REST APIs", {0.0F, 0.9F, 0.1F}}};

    const auto outcome = required_outcome(f, section, candidate);
    const auto& item = outcome.items[0];
    REQUIRE(item.matched);
    REQUIRE_FALSE(item.dominant_token.has_value());
    REQUIRE(item.threshold == 0.6);
    REQUIRE(item.matched_candidate_item == "Designed REST APIs");
  }

  SECTION("dominant technology selects the threshold and can veto") {
    domain::SectionRequirement section;
    section.items = {
        sentence_item("req-0", "Strong Java backend development", {1.0F, 0.0F, 0.0F})};

    domain::CandidateProfile candidate;
    candidate.sentences = {{"Built Django backends in Python", {1.0F, 0.0F, 0.0F}}};

    const auto outcome = required_outcome(f, section, candidate);
    const auto& item = outcome.items[0];
    REQUIRE(item.dominant_token == "java");
    REQUIRE(item.threshold == 0.72);
    REQUIRE(item.vetoed);
    REQUIRE_FALSE(item.matched);
  }

  SECTION("unmatched item within the margin is a near miss") {
    domain::SectionRequirement section;
    section.items = {sentence_item("req-0", "Mentor teammates", {1.0F, 0.0F})};

    domain::CandidateProfile candidate;
    candidate.sentences = {{"Coached interns", {0.58F, 0.81462F}}};

    const auto outcome = required_outcome(f, section, candidate);
    const auto& item = outcome.items[0];
    REQUIRE_FALSE(item.matched);
    REQUIRE(item.near_miss);
    CHECK_THAT(item.best_similarity, Catch::Matchers::WithinAbs(0.58, 1e-3));
  }
}

TEST_CASE("Section scoring edge cases", "[matching][sectional]") {
  MatcherFixture f;

  SECTION("empty preferred section is neutral") {
    domain::SectionRequirement section;
    section.items = {skill_item("req-0", "Kubernetes")};
    domain::CandidateProfile candidate;

    auto result = f.matcher.match(section, candidate);
    REQUIRE(result.has_value());
    REQUIRE(result.value().preferred.requirement_empty);
    REQUIRE(result.value().preferred.score == 1.0);
  }

  SECTION("candidate without material scores zero and is marked empty") {
    domain::SectionRequirement section;
    section.items = {skill_item("req-0", "Kubernetes"),
                     sentence_item("req-1", "Design distributed systems", {1.0F, 0.0F})};
    domain::CandidateProfile candidate;

    const auto outcome = required_outcome(f, section, candidate);
    REQUIRE(outcome.score == 0.0);
    REQUIRE(outcome.candidate_empty);
    REQUIRE(outcome.missing_items.size() == 2);
    REQUIRE(outcome.missing_material == std::vector<std::string>{"skills", "narrative"});
  }

  SECTION("candidate with skills but no narrative is marked per kind") {
    domain::SectionRequirement section;
    section.items = {skill_item("req-0", "Kubernetes"),
                     sentence_item("req-1", "Design distributed systems", {1.0F, 0.0F})};
    domain::CandidateProfile candidate;
    candidate.skills = {{"kubernetes", "", {}}};

    const auto outcome = required_outcome(f, section, candidate);
    REQUIRE(outcome.score == 0.5);
    REQUIRE_FALSE(outcome.candidate_empty);
    REQUIRE(outcome.missing_material == std::vector<std::string>{"narrative"});
  }

  SECTION("critical items carry the critical weight") {
    domain::SectionRequirement section;
    section.items = {skill_item("req-0", "Kubernetes", {}, true), skill_item("req-1", "Erlang")};
    domain::CandidateProfile candidate;
    candidate.skills = {{"kubernetes", "", {}}};

    const auto outcome = required_outcome(f, section, candidate);
    REQUIRE(outcome.total_weight == 3.0);
    REQUIRE(outcome.matched_weight == 2.0);
    CHECK_THAT(outcome.score, Catch::Matchers::WithinAbs(2.0 / 3.0, 1e-12));
    REQUIRE(outcome.missing_items == std::vector<std::string>{"req-1"});
  }

  SECTION("malformed items degrade to unmatched") {
    domain::SectionRequirement section;
    section.items = {skill_item("req-0", "Kubernetes"),
                     sentence_item("req-1", "Sentence that was never embedded", {})};
    domain::CandidateProfile candidate;
    candidate.skills = {{"kubernetes", "", {}}};
    candidate.sentences = {{"Anything", {1.0F, 0.0F}}};

    const auto outcome = required_outcome(f, section, candidate);
    REQUIRE(outcome.score == 0.5);
    REQUIRE(outcome.degraded_items == std::vector<std::string>{"req-1"});
    REQUIRE(outcome.items[1].degraded);
    REQUIRE_FALSE(outcome.items[1].near_miss);
  }

  SECTION("evidence preserves requirement order") {
    domain::SectionRequirement section;
    section.items = {skill_item("b", "Erlang"), skill_item("a", "Kubernetes")};
    domain::CandidateProfile candidate;
    candidate.skills = {{"kubernetes", "", {}}};

    const auto outcome = required_outcome(f, section, candidate);
    REQUIRE(outcome.items[0].item_id == "b");
    REQUIRE(outcome.items[1].item_id == "a");
  }
}

TEST_CASE("Dimension mismatch aborts the section", "[matching][sectional][error]") {
  MatcherFixture f;
  domain::SectionRequirement section;
  section.items = {sentence_item("req-0", "Design distributed systems", {1.0F, 0.0F, 0.0F})};

  domain::CandidateProfile candidate;
  candidate.sentences = {{"Built queues", {1.0F, 0.0F}}};

  auto result = f.matcher.match(section, candidate);
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().kind == core::MatchErrorKind::kDimensionMismatch);
  REQUIRE(result.error().category == "required");
}
