#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pricing::util {

/*
  Non-cryptographic content hashing for cache keys.

  ContentHash returns 32 lowercase hex chars (two independent 64-bit
  FNV-1a lanes). Stable across processes and platforms, so keys can be
  shared through an external cache store.
*/

uint64_t    Fnv1a64(std::string_view data, uint64_t seed = 14695981039346656037ULL);
std::string ContentHash(std::string_view data);

} // namespace pricing::util
