#include "fitscore/embedding/profile_builder.h"

#include "fitscore/core/normalization.h"

#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace fitscore::embedding {

namespace {

using json = nlohmann::json;

std::string string_or_empty(const json& doc, const char* key) {
  if (doc.contains(key) && !doc.at(key).is_null()) {
    return doc.at(key).get<std::string>();
  }
  return {};
}

std::vector<std::string> strings_or_empty(const json& doc, const char* key) {
  if (doc.contains(key) && !doc.at(key).is_null()) {
    return doc.at(key).get<std::vector<std::string>>();
  }
  return {};
}

// section_vector returns doc[vector_key] when present, else the embedding of doc[text_key].
// Appends the section text to `corpus` for the whole-profile fallback.
vector::Vector section_vector(const json& doc, const char* vector_key, const char* text_key,
                              const IEmbeddingProvider& embedder, std::string& corpus) {
  const std::string text = string_or_empty(doc, text_key);
  if (!text.empty()) {
    corpus += text;
    corpus += '\n';
  }

  if (doc.contains(vector_key) && !doc.at(vector_key).is_null()) {
    return doc.at(vector_key).get<vector::Vector>();
  }
  if (text.empty()) {
    return {};
  }
  return embedder.embed_text(text);
}

void append_sentences(const std::string& text, const IEmbeddingProvider& embedder,
                      std::vector<domain::NarrativeSentence>& out) {
  for (auto& part : core::split_sentences(text)) {
    domain::NarrativeSentence sentence;
    sentence.vector = embedder.embed_text(part);
    sentence.text = std::move(part);
    out.push_back(std::move(sentence));
  }
}

domain::ExperienceLevel require_experience_level(const std::string& text) {
  const auto level = domain::parse_experience_level(text);
  if (!level.has_value()) {
    throw std::invalid_argument("unknown experience level: " + text);
  }
  return level.value();
}

domain::EducationLevel require_education_level(const std::string& text) {
  const auto level = domain::parse_education_level(text);
  if (!level.has_value()) {
    throw std::invalid_argument("unknown education level: " + text);
  }
  return level.value();
}

std::vector<domain::RequirementItem> parse_items(const json& doc, const char* key,
                                                 const domain::ItemPriority priority,
                                                 const IEmbeddingProvider& embedder,
                                                 std::string& corpus) {
  std::vector<domain::RequirementItem> items;
  if (!doc.contains(key)) {
    return items;
  }

  for (const auto& entry : doc.at(key)) {
    domain::RequirementItem item;
    item.priority = priority;

    if (entry.is_string()) {
      item.text = entry.get<std::string>();
    } else {
      item.item_id = string_or_empty(entry, "id");
      item.text = string_or_empty(entry, "text");
      item.kind = string_or_empty(entry, "kind") == "skill" ? domain::ItemKind::kSkill
                                                           : domain::ItemKind::kSentence;
      item.critical = entry.value("critical", false);
      if (entry.contains("vector") && !entry.at("vector").is_null()) {
        item.vector = entry.at("vector").get<vector::Vector>();
      }
    }

    if (item.vector.empty() && !core::trim(item.text).empty()) {
      item.vector = embedder.embed_text(item.text);
    }
    corpus += item.text;
    corpus += '\n';
    items.push_back(std::move(item));
  }

  return items;
}

}  // namespace

domain::CandidateProfile build_candidate_profile(const json& doc,
                                                 const IEmbeddingProvider& embedder) {
  domain::CandidateProfile profile;
  std::string corpus;

  profile.candidate_id = doc.at("candidate_id").get<std::string>();
  profile.qualification_vector =
      section_vector(doc, "qualification_vector", "qualification_text", embedder, corpus);
  profile.experience_vector =
      section_vector(doc, "experience_vector", "experience_text", embedder, corpus);
  profile.project_vector = section_vector(doc, "project_vector", "project_text", embedder, corpus);

  if (doc.contains("sentences")) {
    for (const auto& entry : doc.at("sentences")) {
      domain::NarrativeSentence sentence;
      if (entry.is_string()) {
        sentence.text = entry.get<std::string>();
      } else {
        sentence.text = string_or_empty(entry, "text");
        if (entry.contains("vector") && !entry.at("vector").is_null()) {
          sentence.vector = entry.at("vector").get<vector::Vector>();
        }
      }
      if (sentence.vector.empty() && !sentence.text.empty()) {
        sentence.vector = embedder.embed_text(sentence.text);
      }
      corpus += sentence.text;
      corpus += '\n';
      profile.sentences.push_back(std::move(sentence));
    }
  } else if (doc.contains("narrative")) {
    const std::string narrative = string_or_empty(doc, "narrative");
    append_sentences(narrative, embedder, profile.sentences);
    if (!narrative.empty()) {
      corpus += narrative;
      corpus += '\n';
    }
  } else {
    // Section texts are already part of the corpus.
    for (const char* key : {"qualification_text", "experience_text", "project_text"}) {
      append_sentences(string_or_empty(doc, key), embedder, profile.sentences);
    }
  }

  if (doc.contains("skills")) {
    for (const auto& entry : doc.at("skills")) {
      domain::CandidateSkill skill;
      if (entry.is_string()) {
        skill.token = entry.get<std::string>();
      } else {
        skill.token = string_or_empty(entry, "token");
        skill.context_text = string_or_empty(entry, "context");
        if (entry.contains("context_vector") && !entry.at("context_vector").is_null()) {
          skill.context_vector = entry.at("context_vector").get<vector::Vector>();
        }
      }
      if (skill.context_vector.empty()) {
        const std::string& source = skill.context_text.empty() ? skill.token : skill.context_text;
        if (!source.empty()) {
          skill.context_vector = embedder.embed_text(source);
        }
      }
      corpus += skill.token;
      corpus += '\n';
      profile.skills.push_back(std::move(skill));
    }
  }

  profile.experience_years = doc.value("experience_years", 0.0);
  const std::string level = string_or_empty(doc, "level");
  if (!level.empty()) {
    profile.level = require_experience_level(level);
  }

  profile.domain_tags = strings_or_empty(doc, "domain_tags");
  profile.role_tags = strings_or_empty(doc, "role_tags");

  const std::string education = string_or_empty(doc, "education");
  if (!education.empty()) {
    profile.education = require_education_level(education);
  }
  profile.certifications = strings_or_empty(doc, "certifications");

  profile.profile_vector = section_vector(doc, "profile_vector", "profile_text", embedder, corpus);
  if (profile.profile_vector.empty() && !corpus.empty()) {
    profile.profile_vector = embedder.embed_text(corpus);
  }

  return profile;
}

domain::PositionProfile build_position_profile(const json& doc,
                                               const IEmbeddingProvider& embedder) {
  domain::PositionProfile position;
  std::string corpus;

  position.position_id = doc.at("position_id").get<std::string>();
  position.title = string_or_empty(doc, "title");
  if (!position.title.empty()) {
    corpus += position.title;
    corpus += '\n';
  }
  position.description_vector =
      section_vector(doc, "description_vector", "description", embedder, corpus);

  auto required =
      parse_items(doc, "required", domain::ItemPriority::kRequired, embedder, corpus);
  auto preferred =
      parse_items(doc, "preferred", domain::ItemPriority::kPreferred, embedder, corpus);
  position.requirements.items = std::move(required);
  position.requirements.items.insert(position.requirements.items.end(),
                                     std::make_move_iterator(preferred.begin()),
                                     std::make_move_iterator(preferred.end()));
  position.requirements = domain::normalize_section(position.requirements);

  position.min_experience_years = doc.value("min_experience_years", 0.0);
  if (doc.contains("max_experience_years") && !doc.at("max_experience_years").is_null()) {
    position.max_experience_years = doc.at("max_experience_years").get<double>();
  }
  const std::string level = string_or_empty(doc, "level");
  if (!level.empty()) {
    position.level = require_experience_level(level);
  }

  position.domain_tags = strings_or_empty(doc, "domain_tags");
  position.role_tags = strings_or_empty(doc, "role_tags");

  const std::string education = string_or_empty(doc, "min_education");
  if (!education.empty()) {
    position.min_education = require_education_level(education);
  }
  position.required_certifications = strings_or_empty(doc, "required_certifications");

  position.profile_vector = section_vector(doc, "profile_vector", "profile_text", embedder, corpus);
  if (position.profile_vector.empty() && !corpus.empty()) {
    position.profile_vector = embedder.embed_text(corpus);
  }

  return position;
}

}  // namespace fitscore::embedding
