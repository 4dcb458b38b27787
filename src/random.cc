#include "random.h"

#include <chrono>

namespace {

// https://code.google.com/p/smhasher/wiki/MurmurHash3
uint64_t murmur_hash3_64(uint64_t h) {
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdull;
  h ^= h >> 33;
  h *= 0xc4ceb9fe1a85ec53ull;
  h ^= h >> 33;
  return h;
}

uint64_t rol64(uint64_t x, int k) {
  return (x << k) | (x >> (64 - k));
}

}  // namespace

uint64_t resolve_seed(uint64_t seed) {
  while (seed == 0) {
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch();
    seed = murmur_hash3_64(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
  }
  return seed;
}

void Xoshiro256pp::seed(uint64_t seed_) {
  Splitmix64 r(resolve_seed(seed_));
  s[0] = r();
  s[1] = r();
  s[2] = r();
  s[3] = r();
}

Xoshiro256pp::result_type Xoshiro256pp::operator()() {
  uint64_t const result = rol64(s[0] + s[3], 23) + s[0];
  uint64_t const t = s[1] << 17;

  s[2] ^= s[0];
  s[3] ^= s[1];
  s[1] ^= s[2];
  s[0] ^= s[3];

  s[2] ^= t;
  s[3] = rol64(s[3], 45);

  return result;
}
