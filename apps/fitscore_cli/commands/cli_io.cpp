#include "cli_io.h"

#include "fitscore/config/presets.h"

#include <fstream>
#include <iostream>
#include <sstream>

std::optional<nlohmann::json> read_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "Error: cannot open " << path << "\n";
    return std::nullopt;
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();

  nlohmann::json doc = nlohmann::json::parse(buffer.str(), nullptr, false);
  if (doc.is_discarded()) {
    std::cerr << "Error: " << path << " is not valid JSON\n";
    return std::nullopt;
  }
  return doc;
}

std::shared_ptr<const fitscore::config::EngineConfig> load_config(
    const std::optional<std::string>& path) {
  if (!path.has_value()) {
    return std::make_shared<const fitscore::config::EngineConfig>(
        fitscore::config::default_engine_config());
  }

  auto loaded = fitscore::config::load_engine_config_file(path.value());
  if (!loaded.has_value()) {
    std::cerr << "Error: " << loaded.error() << "\n";
    return nullptr;
  }
  return loaded.value();
}

std::optional<std::size_t> parse_count(const std::string& flag, const std::string& value) {
  try {
    std::size_t consumed = 0;
    const long long parsed = std::stoll(value, &consumed);
    if (consumed == value.size() && parsed >= 0) {
      return static_cast<std::size_t>(parsed);
    }
  } catch (const std::exception&) {
    // Reported below.
  }
  std::cerr << "Invalid " << flag << ": " << value << " (expected a non-negative integer)\n";
  return std::nullopt;
}
