#include "fitscore/matching/threshold_resolver.h"

#include "fitscore/core/normalization.h"

namespace fitscore::matching {

std::string to_string(const ThresholdSource source) {
  switch (source) {
    case ThresholdSource::kToken:
      return "token";
    case ThresholdSource::kGroupDefault:
      return "group_default";
    case ThresholdSource::kGlobal:
      return "global";
  }
  return "global";
}

ThresholdResolver::ThresholdResolver(const config::ThresholdTable& table,
                                     const config::SynonymTable& synonyms)
    : surfaces_(synonyms.surface_index()), global_default_(table.global_default) {
  for (const auto& [token, threshold] : table.token_thresholds) {
    entries_[canonical_key(token)].threshold = threshold;
  }

  for (const auto& group : table.groups) {
    if (group.threshold.has_value()) {
      group_defaults_[group.name] = group.threshold.value();
    }
    for (const auto& token : group.tokens) {
      entries_[canonical_key(token)].group = group.name;
    }
  }
}

std::string ThresholdResolver::canonical_key(const std::string_view token) const {
  std::string key = core::normalize_term(token);
  const auto it = surfaces_.find(key);
  return it == surfaces_.end() ? key : it->second;
}

ThresholdResolution ThresholdResolver::resolve(const std::string_view token) const {
  const auto it = entries_.find(canonical_key(token));
  if (it == entries_.end()) {
    return resolve_default();
  }

  const Entry& entry = it->second;
  if (entry.threshold.has_value()) {
    return ThresholdResolution{entry.threshold.value(), entry.group, ThresholdSource::kToken};
  }
  if (entry.group.has_value()) {
    const auto group_default = group_defaults_.find(entry.group.value());
    if (group_default != group_defaults_.end()) {
      return ThresholdResolution{group_default->second, entry.group,
                                 ThresholdSource::kGroupDefault};
    }
  }
  return ThresholdResolution{global_default_, entry.group, ThresholdSource::kGlobal};
}

ThresholdResolution ThresholdResolver::resolve_default() const {
  return ThresholdResolution{global_default_, std::nullopt, ThresholdSource::kGlobal};
}

std::optional<std::string> ThresholdResolver::group_of(const std::string_view token) const {
  const auto it = entries_.find(canonical_key(token));
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.group;
}

bool ThresholdResolver::should_veto(const std::string_view required_token,
                                    const std::optional<std::string>& candidate_dominant_token,
                                    const bool required_mentioned) const {
  const auto required_group = group_of(required_token);
  if (!required_group.has_value() || !candidate_dominant_token.has_value()) {
    return false;
  }

  const auto candidate_group = group_of(candidate_dominant_token.value());
  if (!candidate_group.has_value() || candidate_group == required_group) {
    return false;
  }

  return !required_mentioned;
}

std::vector<std::string> ThresholdResolver::vocabulary() const {
  std::vector<std::string> tokens;
  tokens.reserve(entries_.size());
  for (const auto& [token, entry] : entries_) {
    tokens.push_back(token);
  }
  return tokens;
}

}  // namespace fitscore::matching
