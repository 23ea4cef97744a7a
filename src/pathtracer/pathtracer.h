#ifndef LUMINA_PATHTRACER_H
#define LUMINA_PATHTRACER_H

#include "framebuffer.h"
#include "intersection.h"
#include "ray.h"
#include "render_config.h"

#include "scene/scene.h"
#include "util/random_util.h"

namespace Lumina {

// Sample counts gathered by one worker.
struct PathStats {
  PathStats() : samples(0), degenerate(0) {}

  size_t samples;     ///< camera samples drawn
  size_t degenerate;  ///< samples discarded for a non finite estimate
};

/**
 * Hooks a render driver uses to follow and interrupt pixel sampling. Both
 * are called from worker threads, once per camera sample.
 */
class SampleObserver {
 public:
  virtual ~SampleObserver() {}

  // Checked before every sample; returning true ends the pixel early.
  virtual bool should_stop() = 0;

  virtual void sample_drawn() = 0;
};

/**
 * Unidirectional path tracer with next event estimation, multiple
 * importance sampling, homogeneous media and Russian roulette. Stateless
 * apart from its settings, so one instance is shared by all workers.
 */
class PathTracer {
 public:
  /**
   * camera may be null when only est_radiance_global_illumination is used.
   */
  PathTracer(const Scene* scene, const Camera* camera,
             const RenderConfig& config);

  /**
   * Radiance arriving at the origin of r from direction -r.d. When aux is
   * not null it receives the first surface hit.
   */
  Vector3D est_radiance_global_illumination(const Ray& r, RandomStream& rng,
                                            AuxSample* aux = NULL) const;

  /**
   * Draw up to num_samples more camera samples for pixel (x, y) and
   * accumulate them into the framebuffer. Non finite estimates are dropped
   * and counted as degenerate. Stops early when the observer asks to.
   * Returns the number of samples drawn.
   */
  size_t raytrace_pixel(size_t x, size_t y, size_t num_samples,
                        Framebuffer* framebuffer, PathStats* stats,
                        SampleObserver* observer = NULL) const;

  /**
   * Keep sampling pixel (x, y) in batches until it converges, the sample
   * budget is spent or the observer asks to stop. Returns the number of
   * samples drawn.
   */
  size_t raytrace_pixel_adaptive(size_t x, size_t y, Framebuffer* framebuffer,
                                 PathStats* stats,
                                 SampleObserver* observer = NULL) const;

  // Whether the 95% confidence interval of the pixel luminance lies within
  // the tolerance.
  bool is_converged(const PixelAccumulator& pixel) const;

 private:
  // Light arriving at a surface point from one sampled light, MIS weighted
  // against BSDF sampling.
  Vector3D estimate_direct_lighting_importance(const Intersection& isect,
                                               const Matrix3x3& o2w,
                                               const Vector3D& w_out,
                                               const Medium* medium,
                                               double time,
                                               RandomStream& rng) const;

  // Same for a scattering point inside a medium, using the phase function.
  Vector3D estimate_direct_lighting_medium(const Vector3D& p,
                                           const Vector3D& d_in,
                                           const Medium* medium,
                                           double time,
                                           RandomStream& rng) const;

  // Returns false when the path is terminated.
  bool russian_roulette(Vector3D& throughput, size_t bounce,
                        RandomStream& rng) const;

  const Scene* scene;
  const Camera* camera;

  size_t width, height;
  size_t max_ray_depth;
  size_t rr_min_depth;
  bool use_russian_roulette;
  uint64_t seed;

  size_t max_samples;
  size_t samples_per_batch;
  double max_tolerance;
  bool aux_buffers;
};

} // namespace Lumina

#endif // LUMINA_PATHTRACER_H
