#include "random_util.h"

namespace Lumina {

uint64_t hash_mix(uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

RandomStream::RandomStream(uint64_t seed, uint64_t stream)
    : state(0), inc((stream << 1u) | 1u) {
  next_uint();
  state += seed;
  next_uint();
}

RandomStream RandomStream::for_sample(uint64_t seed, size_t x, size_t y,
                                      size_t sample) {
  uint64_t h = hash_mix(seed);
  h = hash_mix(h ^ static_cast<uint64_t>(x));
  h = hash_mix(h ^ (static_cast<uint64_t>(y) << 1));
  uint64_t stream = hash_mix(h ^ static_cast<uint64_t>(sample));
  return RandomStream(h, stream);
}

uint32_t RandomStream::next_uint() {
  uint64_t oldstate = state;
  state = oldstate * 6364136223846793005ULL + inc;
  uint32_t xorshifted = static_cast<uint32_t>(((oldstate >> 18u) ^ oldstate) >> 27u);
  uint32_t rot = static_cast<uint32_t>(oldstate >> 59u);
  return (xorshifted >> rot) | (xorshifted << ((~rot + 1u) & 31));
}

double RandomStream::random_uniform() {
  return next_uint() * (1.0 / 4294967296.0);
}

bool RandomStream::coin_flip(double p) { return random_uniform() < p; }

} // namespace Lumina
