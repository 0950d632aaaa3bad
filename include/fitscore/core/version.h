#pragma once

namespace fitscore::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "0.3";

// kResultSchemaVersion tracks the JSON layout of MatchResult and snapshots.
constexpr int kResultSchemaVersion = 1;

}  // namespace fitscore::core
