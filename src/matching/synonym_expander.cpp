#include "fitscore/matching/synonym_expander.h"

#include "fitscore/core/normalization.h"

#include <algorithm>
#include <cstddef>
#include <set>

namespace fitscore::matching {

SynonymExpander::SynonymExpander(const config::SynonymTable& table,
                                 const std::vector<std::string>& extra_vocabulary) {
  for (const auto& entry : table.entries) {
    const std::string canonical = core::normalize_term(entry.canonical);
    if (canonical.empty()) {
      continue;
    }

    auto& token = entries_[canonical];
    token.canonical = canonical;
    surface_to_canonical_.emplace(canonical, canonical);

    for (const auto& alias : entry.aliases) {
      const std::string surface = core::normalize_term(alias);
      if (surface.empty() || surface == canonical) {
        continue;
      }
      token.aliases.push_back(surface);
      surface_to_canonical_.emplace(surface, canonical);
    }
  }

  for (const auto& term : extra_vocabulary) {
    const std::string canonical = core::normalize_term(term);
    if (canonical.empty() || surface_to_canonical_.count(canonical) > 0) {
      continue;
    }
    entries_[canonical].canonical = canonical;
    surface_to_canonical_.emplace(canonical, canonical);
  }

  for (auto& [canonical, token] : entries_) {
    std::sort(token.aliases.begin(), token.aliases.end());
    token.aliases.erase(std::unique(token.aliases.begin(), token.aliases.end()),
                        token.aliases.end());
  }

  std::set<std::string> ambiguous;
  for (const auto& term : table.ambiguous_terms) {
    ambiguous.insert(core::normalize_term(term));
  }

  surfaces_by_length_.reserve(surface_to_canonical_.size());
  for (const auto& [surface, canonical] : surface_to_canonical_) {
    if (ambiguous.count(surface) == 0) {
      surfaces_by_length_.push_back(surface);
    }
  }
  std::stable_sort(surfaces_by_length_.begin(), surfaces_by_length_.end(),
                   [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
}

domain::SkillToken SynonymExpander::expand(const std::string_view raw) const {
  const std::string key = core::normalize_term(raw);
  const auto surface = surface_to_canonical_.find(key);
  if (surface == surface_to_canonical_.end()) {
    return domain::SkillToken{key, {}};
  }
  return entries_.at(surface->second);
}

std::string SynonymExpander::canonicalize(const std::string_view raw) const {
  const std::string key = core::normalize_term(raw);
  const auto surface = surface_to_canonical_.find(key);
  return surface == surface_to_canonical_.end() ? key : surface->second;
}

bool SynonymExpander::same_skill(const std::string_view a, const std::string_view b) const {
  const std::string ca = canonicalize(a);
  return !ca.empty() && ca == canonicalize(b);
}

bool SynonymExpander::mentions(const std::string_view text, const domain::SkillToken& token) const {
  const std::string haystack = core::normalize_term(text);
  if (core::contains_term(haystack, token.canonical)) {
    return true;
  }
  return std::any_of(token.aliases.begin(), token.aliases.end(), [&](const std::string& alias) {
    return core::contains_term(haystack, alias);
  });
}

std::vector<DetectedTerm> SynonymExpander::detect_terms(const std::string_view text) const {
  std::string masked = core::normalize_term(text);
  std::map<std::string, DetectedTerm> hits;

  for (const auto& surface : surfaces_by_length_) {
    std::size_t pos = core::find_term(masked, surface);
    while (pos != std::string_view::npos) {
      const std::string& canonical = surface_to_canonical_.at(surface);
      auto [it, inserted] = hits.try_emplace(canonical, DetectedTerm{canonical, 0, pos});
      it->second.count += 1;
      it->second.first_position = std::min(it->second.first_position, pos);

      // '|' is not a term character, so masked spans never match again.
      std::fill_n(masked.begin() + static_cast<std::ptrdiff_t>(pos), surface.size(), '|');
      pos = core::find_term(masked, surface, pos + surface.size());
    }
  }

  std::vector<DetectedTerm> terms;
  terms.reserve(hits.size());
  for (auto& [canonical, term] : hits) {
    terms.push_back(std::move(term));
  }
  return terms;
}

std::optional<std::string> SynonymExpander::dominant_term(const std::string_view text) const {
  const auto terms = detect_terms(text);
  if (terms.empty()) {
    return std::nullopt;
  }

  const auto best = std::min_element(
      terms.begin(), terms.end(), [](const DetectedTerm& a, const DetectedTerm& b) {
        if (a.count != b.count) {
          return a.count > b.count;
        }
        if (a.first_position != b.first_position) {
          return a.first_position < b.first_position;
        }
        if (a.canonical.size() != b.canonical.size()) {
          return a.canonical.size() > b.canonical.size();
        }
        return a.canonical < b.canonical;
      });
  return best->canonical;
}

}  // namespace fitscore::matching
