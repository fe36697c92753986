#include "sme/core/hashing.h"

#include <iomanip>
#include <sstream>

namespace sme::core {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

}  // namespace

std::uint64_t stable_hash64_extend(std::uint64_t seed, const std::string_view input) {
  for (const char ch : input) {
    seed ^= static_cast<std::uint64_t>(static_cast<unsigned char>(ch));
    seed *= kFnvPrime;
  }
  // Field separator so ("ab","c") and ("a","bc") hash differently.
  seed ^= 0xffu;
  seed *= kFnvPrime;
  return seed;
}

std::uint64_t stable_hash64(const std::string_view input) {
  return stable_hash64_extend(kFnvOffset, input);
}

std::string hash_to_hex(const std::uint64_t hash) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(16) << hash;
  return oss.str();
}

std::string stable_hash64_hex(const std::string_view input) {
  return hash_to_hex(stable_hash64(input));
}

}  // namespace sme::core
