#ifndef LUMINA_FRAMEBUFFER_H
#define LUMINA_FRAMEBUFFER_H

#include "util/math_util.h"

#include <cstdint>
#include <vector>

namespace Lumina {

/**
 * Running statistics of one pixel. The mean color and the variance of the
 * luminance are updated with Welford's method.
 */
struct PixelAccumulator {

  PixelAccumulator() : lum_mean(0), lum_m2(0), n(0), drawn(0) {}

  void add(const Vector3D& sample) {
    n++;
    mean += (sample - mean) / static_cast<double>(n);
    double lum = sample.illum();
    double delta = lum - lum_mean;
    lum_mean += delta / n;
    lum_m2 += delta * (lum - lum_mean);
  }

  // Unbiased sample variance of the luminance.
  double variance() const { return n > 1 ? lum_m2 / (n - 1) : 0.0; }

  Vector3D mean;
  double lum_mean;
  double lum_m2;
  size_t n;      ///< accumulated samples
  size_t drawn;  ///< samples drawn, including discarded ones
};

// First hit data of one camera sample.
struct AuxSample {

  AuxSample()
      : depth(INF_D), primitive_id(-1), material_id(-1), hit(false) {}

  Vector3D albedo;
  Vector3D normal;
  double depth;
  int64_t primitive_id;
  int64_t material_id;
  bool hit;
};

/**
 * Per pixel accumulators plus optional auxiliary buffers. Albedo, normal
 * and depth are averaged over the samples that hit a surface; the ids come
 * from the first sample of the pixel. Each pixel is only ever touched by
 * the worker rendering its tile.
 */
class Framebuffer {
 public:
  Framebuffer() : w(0), h(0), aux_enabled(false) {}

  void resize(size_t width, size_t height, bool aux_buffers);
  void clear();

  size_t width() const { return w; }
  size_t height() const { return h; }
  bool has_aux() const { return aux_enabled; }

  PixelAccumulator& pixel(size_t x, size_t y) { return pixels[y * w + x]; }
  const PixelAccumulator& pixel(size_t x, size_t y) const {
    return pixels[y * w + x];
  }

  void add_aux(size_t x, size_t y, const AuxSample& aux);

  void mark_failed(size_t x, size_t y) { failed[y * w + x] = 1; }
  bool is_failed(size_t x, size_t y) const { return failed[y * w + x] != 0; }

  /**
   * Dense row major RGB triples of the pixel means.
   */
  std::vector<float> to_float_rgb() const;

  std::vector<size_t> sample_counts() const;

  Vector3D albedo(size_t x, size_t y) const { return aux_albedo[y * w + x]; }
  Vector3D normal(size_t x, size_t y) const { return aux_normal[y * w + x]; }
  double depth(size_t x, size_t y) const;
  int64_t primitive_id(size_t x, size_t y) const {
    return aux_primitive[y * w + x];
  }
  int64_t material_id(size_t x, size_t y) const {
    return aux_material[y * w + x];
  }

 private:
  size_t w, h;
  bool aux_enabled;
  std::vector<PixelAccumulator> pixels;
  std::vector<unsigned char> failed;

  std::vector<Vector3D> aux_albedo;
  std::vector<Vector3D> aux_normal;
  std::vector<double> aux_depth;
  std::vector<size_t> aux_hits;
  std::vector<size_t> aux_samples;
  std::vector<int64_t> aux_primitive;
  std::vector<int64_t> aux_material;
};

} // namespace Lumina

#endif // LUMINA_FRAMEBUFFER_H
