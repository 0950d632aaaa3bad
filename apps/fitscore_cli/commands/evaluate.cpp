#include "evaluate.h"

#include "cli_io.h"
#include "fitscore/core/clock.h"
#include "fitscore/embedding/embedding_provider.h"
#include "fitscore/embedding/profile_builder.h"
#include "fitscore/matching/match_orchestrator.h"
#include "fitscore/storage/match_snapshot.h"
#include "fitscore/storage/sqlite/sqlite_db.h"
#include "fitscore/storage/sqlite/sqlite_match_snapshot_store.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct EvaluateCliConfig {
  std::optional<std::string> candidate_path;
  std::optional<std::string> position_path;
  std::optional<std::string> config_path;
  std::optional<std::string> db_path;
  std::optional<std::int64_t> fixed_time;
  std::size_t dimension{kDefaultStubDimension};
};

// store_snapshot saves the result to the SQLite database at db_path.
bool store_snapshot(const std::string& db_path, const fitscore::domain::MatchResult& result) {
  auto db_result = fitscore::storage::sqlite::SqliteDb::open(db_path);
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return false;
  }

  auto db = db_result.value();
  auto schema_result = db->migrate();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return false;
  }

  fitscore::storage::sqlite::SqliteMatchSnapshotStore store(db);
  const auto snapshot = fitscore::storage::make_snapshot(result);
  auto saved = store.save(snapshot);
  if (!saved.has_value()) {
    std::cerr << "Failed to store snapshot: " << saved.error() << "\n";
    return false;
  }

  std::cerr << "Stored snapshot " << snapshot.snapshot_id << " in " << db_path << "\n";
  return true;
}

}  // namespace

int cmd_evaluate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<fitscore::apps::Option<EvaluateCliConfig>> options = {
      {"--candidate", true, "Candidate profile JSON file",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.candidate_path = v;
         return true;
       }},
      {"--position", true, "Position profile JSON file",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.position_path = v;
         return true;
       }},
      {"--config", true, "Engine configuration JSON file (default: built-in sectional_v2)",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--db", true, "SQLite database for storing a result snapshot",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--fixed-time", true, "Stamp results with this Unix time in microseconds",
       [](EvaluateCliConfig& c, const std::string& v) {
         const auto parsed = parse_count("--fixed-time", v);
         if (!parsed.has_value()) {
           return false;
         }
         c.fixed_time = static_cast<std::int64_t>(parsed.value());
         return true;
       }},
      {"--dimension", true, "Stub embedding dimension for text-only sections",
       [](EvaluateCliConfig& c, const std::string& v) {
         const auto parsed = parse_count("--dimension", v);
         if (!parsed.has_value() || parsed.value() == 0) {
           return false;
         }
         c.dimension = parsed.value();
         return true;
       }},
  };
  const auto parsed = fitscore::apps::parse_options(argc, argv, options);
  const EvaluateCliConfig& config = parsed.config;

  if (!parsed.ok || !config.candidate_path.has_value() || !config.position_path.has_value()) {
    fitscore::apps::print_usage(
        std::cerr, "fitscore_cli evaluate --candidate <json> --position <json> [options]",
        options);
    return 1;
  }

  const auto engine_config = load_config(config.config_path);
  if (!engine_config) {
    return 1;
  }

  const auto candidate_doc = read_json_file(config.candidate_path.value());
  const auto position_doc = read_json_file(config.position_path.value());
  if (!candidate_doc.has_value() || !position_doc.has_value()) {
    return 1;
  }

  fitscore::embedding::DeterministicStubEmbeddingProvider embedder(config.dimension);
  fitscore::domain::CandidateProfile candidate;
  fitscore::domain::PositionProfile position;
  try {
    candidate = fitscore::embedding::build_candidate_profile(candidate_doc.value(), embedder);
    position = fitscore::embedding::build_position_profile(position_doc.value(), embedder);
  } catch (const std::exception& e) {
    std::cerr << "Error: invalid profile document: " << e.what() << "\n";
    return 1;
  }

  const fitscore::matching::MatchOrchestrator orchestrator(engine_config);

  fitscore::core::SystemClock system_clock;
  std::optional<fitscore::core::FixedClock> fixed_clock;
  if (config.fixed_time.has_value()) {
    fixed_clock.emplace(config.fixed_time.value());
  }
  fitscore::core::IClock& clock =
      fixed_clock.has_value() ? static_cast<fitscore::core::IClock&>(fixed_clock.value())
                              : static_cast<fitscore::core::IClock&>(system_clock);

  const auto result = orchestrator.evaluate(candidate, position, clock);
  if (!result.has_value()) {
    const auto& error = result.error();
    std::cerr << "Evaluation failed [" << fitscore::matching::to_string(error.kind) << "] in "
              << error.category << ": " << error.message << "\n";
    return 1;
  }

  std::cout << fitscore::domain::match_result_to_json(result.value()).dump(2) << "\n";

  if (config.db_path.has_value() && !store_snapshot(config.db_path.value(), result.value())) {
    return 1;
  }
  return 0;
}
