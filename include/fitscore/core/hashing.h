#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace fitscore::core {

// FNV-1a 64-bit. Stable across platforms; used to spread stub embedding features
// and to derive deterministic snapshot ids. Not a cryptographic hash.
// seed perturbs the offset basis so one input can yield independent hash streams.
std::uint64_t stable_hash64(std::string_view input, std::uint64_t seed = 0);
std::string stable_hash64_hex(std::string_view input);

}  // namespace fitscore::core
