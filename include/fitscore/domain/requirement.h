#pragma once

#include "fitscore/core/result.h"
#include "fitscore/vector/similarity.h"

#include <string>
#include <vector>

namespace fitscore::domain {

enum class ItemKind {
  kSentence,  // free-text qualification sentence
  kSkill,     // a single skill token
};

enum class ItemPriority {
  kRequired,
  kPreferred,
};

// RequirementItem is one line of a position's qualification section.
// - item_id:  stable identifier reported back in evidence (defaults to "req-<index>")
// - text:     the sentence, or the raw skill token for kSkill items
// - critical: only meaningful for required items; critical items carry a heavier weight
// - vector:   sentence embedding (kSentence) or embedding of the skill's narrative
//             context (kSkill); may be empty when absent
struct RequirementItem {
  std::string item_id;
  ItemKind kind{ItemKind::kSentence};
  ItemPriority priority{ItemPriority::kRequired};
  std::string text;
  bool critical{false};
  vector::Vector vector;

  // validate checks schema invariants.
  // Returns ok(true) if valid, err(message) if invalid.
  core::Result<bool, std::string> validate() const;
};

// SectionRequirement is the ordered list of required and preferred items of a position.
// Order is preserved through matching and into the reported evidence.
struct SectionRequirement {
  std::vector<RequirementItem> items;

  [[nodiscard]] std::vector<const RequirementItem*> with_priority(ItemPriority priority) const;
};

// normalize_section produces a normalized copy.
// - Trims item text
// - Assigns "req-<index>" ids to items without one
// - Clears the critical flag on preferred items
SectionRequirement normalize_section(const SectionRequirement& section);

[[nodiscard]] std::string to_string(ItemKind kind);
[[nodiscard]] std::string to_string(ItemPriority priority);

}  // namespace fitscore::domain
