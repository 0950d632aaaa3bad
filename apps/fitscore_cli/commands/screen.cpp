#include "screen.h"

#include "cli_io.h"
#include "fitscore/embedding/embedding_provider.h"
#include "fitscore/embedding/profile_builder.h"
#include "fitscore/matching/match_orchestrator.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ScreenCliConfig {
  std::optional<std::string> position_path;
  std::optional<std::string> candidates_path;
  std::optional<std::string> config_path;
  fitscore::matching::ScreeningOptions screening;
  std::size_t dimension{kDefaultStubDimension};
};

nlohmann::json screening_to_json(const std::string& position_id,
                                 const fitscore::matching::ScreeningResult& result) {
  nlohmann::json hits = nlohmann::json::array();
  for (std::size_t rank = 0; rank < result.hits.size(); ++rank) {
    const auto& hit = result.hits[rank];
    hits.push_back({{"candidate_id", hit.candidate_id},
                    {"percent", hit.percent},
                    {"rank", rank + 1},
                    {"similarity", hit.similarity}});
  }

  nlohmann::json rejected = nlohmann::json::array();
  for (const auto& rejection : result.rejected) {
    rejected.push_back({{"candidate_id", rejection.candidate_id},
                        {"category", rejection.error.category},
                        {"error", fitscore::matching::to_string(rejection.error.kind)},
                        {"message", rejection.error.message}});
  }

  nlohmann::json out;
  out["hits"] = std::move(hits);
  out["position_id"] = position_id;
  out["rejected"] = std::move(rejected);
  return out;
}

}  // namespace

int cmd_screen(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<fitscore::apps::Option<ScreenCliConfig>> options = {
      {"--position", true, "Position profile JSON file",
       [](ScreenCliConfig& c, const std::string& v) {
         c.position_path = v;
         return true;
       }},
      {"--candidates", true, "JSON file holding an array of candidate profiles",
       [](ScreenCliConfig& c, const std::string& v) {
         c.candidates_path = v;
         return true;
       }},
      {"--top-k", true, "Keep only the best k candidates",
       [](ScreenCliConfig& c, const std::string& v) {
         const auto parsed = parse_count("--top-k", v);
         if (!parsed.has_value()) {
           return false;
         }
         c.screening.top_k = parsed.value();
         return true;
       }},
      {"--workers", true, "Worker threads (default: hardware concurrency)",
       [](ScreenCliConfig& c, const std::string& v) {
         const auto parsed = parse_count("--workers", v);
         if (!parsed.has_value()) {
           return false;
         }
         c.screening.workers = parsed.value();
         return true;
       }},
      {"--config", true, "Engine configuration JSON file (default: built-in sectional_v2)",
       [](ScreenCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--dimension", true, "Stub embedding dimension for text-only sections",
       [](ScreenCliConfig& c, const std::string& v) {
         const auto parsed = parse_count("--dimension", v);
         if (!parsed.has_value() || parsed.value() == 0) {
           return false;
         }
         c.dimension = parsed.value();
         return true;
       }},
  };
  const auto parsed = fitscore::apps::parse_options(argc, argv, options);
  const ScreenCliConfig& config = parsed.config;

  if (!parsed.ok || !config.position_path.has_value() || !config.candidates_path.has_value()) {
    fitscore::apps::print_usage(
        std::cerr, "fitscore_cli screen --position <json> --candidates <json> [options]",
        options);
    return 1;
  }

  const auto engine_config = load_config(config.config_path);
  if (!engine_config) {
    return 1;
  }

  const auto position_doc = read_json_file(config.position_path.value());
  const auto candidates_doc = read_json_file(config.candidates_path.value());
  if (!position_doc.has_value() || !candidates_doc.has_value()) {
    return 1;
  }
  if (!candidates_doc->is_array()) {
    std::cerr << "Error: " << config.candidates_path.value() << " must hold a JSON array\n";
    return 1;
  }

  fitscore::embedding::DeterministicStubEmbeddingProvider embedder(config.dimension);
  fitscore::domain::PositionProfile position;
  std::vector<fitscore::domain::CandidateProfile> candidates;
  try {
    position = fitscore::embedding::build_position_profile(position_doc.value(), embedder);
    candidates.reserve(candidates_doc->size());
    for (const auto& doc : candidates_doc.value()) {
      candidates.push_back(fitscore::embedding::build_candidate_profile(doc, embedder));
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: invalid profile document: " << e.what() << "\n";
    return 1;
  }

  const fitscore::matching::MatchOrchestrator orchestrator(engine_config);
  const auto result = orchestrator.screen(position, candidates, config.screening);

  std::cerr << "Screened " << candidates.size() << " candidates: " << result.hits.size()
            << " ranked, " << result.rejected.size() << " rejected\n";
  std::cout << screening_to_json(position.position_id, result).dump(2) << "\n";
  return 0;
}
