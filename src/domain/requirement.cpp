#include "fitscore/domain/requirement.h"

#include "fitscore/core/normalization.h"

namespace fitscore::domain {

core::Result<bool, std::string> RequirementItem::validate() const {
  if (core::trim(text).empty() && vector.empty()) {
    return core::Result<bool, std::string>::err("requirement item " + item_id +
                                                " has neither text nor vector");
  }

  if (kind == ItemKind::kSkill && core::normalize_term(text).empty()) {
    return core::Result<bool, std::string>::err("skill item " + item_id +
                                                " must name a skill token");
  }

  if (critical && priority == ItemPriority::kPreferred) {
    return core::Result<bool, std::string>::err("preferred item " + item_id +
                                                " cannot be critical");
  }

  return core::Result<bool, std::string>::ok(true);
}

std::vector<const RequirementItem*> SectionRequirement::with_priority(
    const ItemPriority priority) const {
  std::vector<const RequirementItem*> selected;
  for (const auto& item : items) {
    if (item.priority == priority) {
      selected.push_back(&item);
    }
  }
  return selected;
}

SectionRequirement normalize_section(const SectionRequirement& section) {
  SectionRequirement normalized;
  normalized.items.reserve(section.items.size());

  for (std::size_t i = 0; i < section.items.size(); ++i) {
    RequirementItem item = section.items[i];
    item.text = core::trim(item.text);
    if (item.item_id.empty()) {
      item.item_id = "req-" + std::to_string(i);
    }
    if (item.priority == ItemPriority::kPreferred) {
      item.critical = false;
    }
    normalized.items.push_back(std::move(item));
  }

  return normalized;
}

std::string to_string(const ItemKind kind) {
  return kind == ItemKind::kSkill ? "skill" : "sentence";
}

std::string to_string(const ItemPriority priority) {
  return priority == ItemPriority::kRequired ? "required" : "preferred";
}

}  // namespace fitscore::domain
