#pragma once

#include <stdint.h>

// Returns `seed`, or a fresh seed from the clock when `seed` is 0. Callers that
// want a game to be reproducible should resolve the seed once and report it.
uint64_t resolve_seed(uint64_t seed);


class Splitmix64 {
  // https://en.wikipedia.org/wiki/Xorshift#Initialization
public:
  using result_type = uint64_t;
  static constexpr result_type min() { return 0; }
  static constexpr result_type max() { return (result_type)-1; }

  Splitmix64(uint64_t seed_ = 0) { seed(seed_); }
  void seed(uint64_t seed_) { state = resolve_seed(seed_); }
  result_type operator()() {
    uint64_t result = (state += 0x9E3779B97f4A7C15);
    result = (result ^ (result >> 30)) * 0xBF58476D1CE4E5B9;
    result = (result ^ (result >> 27)) * 0x94D049BB133111EB;
    return result ^ (result >> 31);
  }
private:
  uint64_t state;
};


// The generator behind mine placement and random moves. Usable with
// absl::Uniform and the <random> distributions.
class Xoshiro256pp {
  // https://en.wikipedia.org/wiki/Xorshift#xoshiro256++
public:
  using result_type = uint64_t;
  static constexpr result_type min() { return 0; }
  static constexpr result_type max() { return (result_type)-1; }

  Xoshiro256pp(uint64_t seed_ = 0) { seed(seed_); }
  void seed(uint64_t seed_);

  result_type operator()();
private:
  uint64_t s[4];
};
