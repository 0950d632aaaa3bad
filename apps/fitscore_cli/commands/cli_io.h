#pragma once

#include "fitscore/config/engine_config.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

// Default dimension of the stub embedder used for text-only profile sections.
inline constexpr std::size_t kDefaultStubDimension = 256;

// read_json_file parses `path`. Errors are reported to stderr and yield nullopt.
[[nodiscard]] std::optional<nlohmann::json> read_json_file(const std::string& path);

// load_config loads and validates `path`, or returns the built-in sectional_v2 configuration
// when no path is given. Errors are reported to stderr and yield nullptr.
[[nodiscard]] std::shared_ptr<const fitscore::config::EngineConfig> load_config(
    const std::optional<std::string>& path);

// parse_count parses a non-negative integer flag value; reports and returns nullopt on error.
[[nodiscard]] std::optional<std::size_t> parse_count(const std::string& flag,
                                                     const std::string& value);
