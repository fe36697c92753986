#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sme::core {

// FNV-1a 64-bit. Stable across platforms and runs; used for cache keys, not security.
std::uint64_t stable_hash64(std::string_view input);
std::string stable_hash64_hex(std::string_view input);

// Fixed-width (16 char) lowercase hex rendering.
std::string hash_to_hex(std::uint64_t hash);

// Folds `input` into an existing hash so multi-part keys never need concatenation.
std::uint64_t stable_hash64_extend(std::uint64_t seed, std::string_view input);

}  // namespace sme::core
