#include "hash.hpp"

namespace pricing::util {

namespace {

constexpr uint64_t kFnvPrime = 1099511628211ULL;

// Second lane seed: FNV offset basis run over a fixed salt.
constexpr uint64_t kSecondLaneSeed = 0x84222325cbf29ce4ULL;

void AppendHex(std::string& out, uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (int shift = 60; shift >= 0; shift -= 4) {
    out.push_back(kHex[(value >> shift) & 0x0F]);
  }
}

} // namespace

uint64_t Fnv1a64(std::string_view data, uint64_t seed) {
  uint64_t hash = seed;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  return hash;
}

std::string ContentHash(std::string_view data) {
  // The second lane also folds in the length so that inputs sharing a
  // first-lane collision rarely collide on both.
  const uint64_t first  = Fnv1a64(data);
  const uint64_t second = Fnv1a64(data, kSecondLaneSeed ^ static_cast<uint64_t>(data.size()));

  std::string out;
  out.reserve(32);
  AppendHex(out, first);
  AppendHex(out, second);
  return out;
}

} // namespace pricing::util
