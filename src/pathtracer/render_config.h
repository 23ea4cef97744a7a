#ifndef LUMINA_RENDER_CONFIG_H
#define LUMINA_RENDER_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace Lumina {

/**
 * Parameters of one render.
 */
struct RenderConfig {
  size_t width = 640;
  size_t height = 480;

  // fixed sampling
  size_t samples_per_pixel = 16;

  // adaptive sampling: min_samples first, then batches until the 95%
  // confidence interval of the pixel luminance is within max_tolerance of
  // its mean or max_samples is reached
  bool adaptive = false;
  size_t min_samples = 16;
  size_t max_samples = 256;
  size_t samples_per_batch = 16;
  double max_tolerance = 0.05;

  size_t max_ray_depth = 8;
  size_t rr_min_depth = 3;
  bool russian_roulette = true;

  size_t num_threads = 0;  ///< 0 uses the hardware concurrency
  size_t tile_size = 32;
  uint64_t seed = 0;

  double time_limit_seconds = 0;  ///< 0 disables the limit
  bool aux_buffers = false;
  bool verbose = false;

  /**
   * Throws ConfigurationError describing the first invalid field.
   */
  void validate() const;
};

} // namespace Lumina

#endif // LUMINA_RENDER_CONFIG_H
