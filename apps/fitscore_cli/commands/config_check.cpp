#include "config_check.h"

#include "cli_io.h"
#include "fitscore/config/engine_config.h"
#include "fitscore/config/presets.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ConfigCheckCliConfig {
  std::optional<std::string> config_path;
  std::string policy{fitscore::config::kSectionalV2Policy};
};

}  // namespace

int cmd_config_check(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<fitscore::apps::Option<ConfigCheckCliConfig>> options = {
      {"--config", true, "Engine configuration JSON file",
       [](ConfigCheckCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--policy", true, "Built-in preset to check (sectional_v2|dynamic_threshold_v3)",
       [](ConfigCheckCliConfig& c, const std::string& v) {
         if (!fitscore::config::weights_for_policy(v).has_value()) {
           std::cerr << "Invalid --policy: " << v
                     << " (valid: sectional_v2, dynamic_threshold_v3)\n";
           return false;
         }
         c.policy = v;
         return true;
       }},
  };
  const auto parsed = fitscore::apps::parse_options(argc, argv, options);
  if (!parsed.ok) {
    fitscore::apps::print_usage(std::cerr, "fitscore_cli config-check [options]", options);
    return 1;
  }
  const ConfigCheckCliConfig& config = parsed.config;

  std::shared_ptr<const fitscore::config::EngineConfig> engine_config;
  if (config.config_path.has_value()) {
    engine_config = load_config(config.config_path);
    if (!engine_config) {
      return 1;
    }
  } else {
    auto preset = fitscore::config::default_engine_config(config.policy);
    const auto valid = fitscore::config::validate_engine_config(preset);
    if (!valid.has_value()) {
      std::cerr << "Error: built-in preset is invalid: " << valid.error() << "\n";
      return 1;
    }
    engine_config = std::make_shared<const fitscore::config::EngineConfig>(std::move(preset));
  }

  std::cerr << "Configuration " << engine_config->config_version << " ("
            << engine_config->policy_version << ") is valid\n";
  std::cout << fitscore::config::config_to_json(*engine_config).dump(2) << "\n";
  return 0;
}
