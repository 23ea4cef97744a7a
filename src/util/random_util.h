#ifndef LUMINA_UTIL_RANDOM_UTIL_H
#define LUMINA_UTIL_RANDOM_UTIL_H

#include <cstddef>
#include <cstdint>

namespace Lumina {

// PCG32 random stream. Every camera sample owns its own stream, seeded from
// the render seed, the pixel and the sample index, so the value sequence a
// sample sees never depends on which thread traced it.
class RandomStream {
 public:
  RandomStream(uint64_t seed = 0x853c49e6748fea9bULL,
               uint64_t stream = 0xda3e39cb94b95bdbULL);

  static RandomStream for_sample(uint64_t seed, size_t x, size_t y,
                                 size_t sample);

  uint32_t next_uint();

  // Uniform double in [0, 1).
  double random_uniform();

  // Returns true with probability p.
  bool coin_flip(double p);

 private:
  uint64_t state;
  uint64_t inc;
};

// SplitMix64 finalizer.
uint64_t hash_mix(uint64_t x);

} // namespace Lumina

#endif // LUMINA_UTIL_RANDOM_UTIL_H
