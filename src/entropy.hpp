#ifndef ENTROPY_HPP
#define ENTROPY_HPP

#include <cstdint>
#include <random>

using RNG = std::mt19937;

struct EntropySource {
  /** Draw a seed from the system's entropy pool */
  static size_t random_seed() { return std::random_device()(); }

  /**
   * Construct a generator; a seed of 0 is replaced by a random seed.
   * All 64 bits of the seed take effect.
   */
  static RNG make_rng(size_t &seed) {
    while (seed == 0)
      seed = random_seed();
    const uint64_t value = seed;
    std::seed_seq sequence{static_cast<uint32_t>(value),
                           static_cast<uint32_t>(value >> 32)};
    return RNG(sequence);
  }
};

#endif
