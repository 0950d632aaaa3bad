#pragma once

#include <string>
#include <vector>

namespace fitscore::domain {

// SkillToken is a canonical skill identity plus the surface forms accepted for it.
// canonical: normalize_term() form (lowercase, trimmed, single-spaced); never empty for a
//            token produced by SynonymExpander.
// aliases:   sorted, deduplicated, normalized; never contains canonical itself.
struct SkillToken {
  std::string canonical;
  std::vector<std::string> aliases;

  bool operator==(const SkillToken&) const = default;
};

}  // namespace fitscore::domain
