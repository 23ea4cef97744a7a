#include "framebuffer.h"

namespace Lumina {

void Framebuffer::resize(size_t width, size_t height, bool aux_buffers) {
  w = width;
  h = height;
  aux_enabled = aux_buffers;
  clear();
}

void Framebuffer::clear() {
  size_t n = w * h;
  pixels.assign(n, PixelAccumulator());
  failed.assign(n, 0);

  size_t m = aux_enabled ? n : 0;
  aux_albedo.assign(m, Vector3D());
  aux_normal.assign(m, Vector3D());
  aux_depth.assign(m, 0.0);
  aux_hits.assign(m, 0);
  aux_samples.assign(m, 0);
  aux_primitive.assign(m, -1);
  aux_material.assign(m, -1);
}

void Framebuffer::add_aux(size_t x, size_t y, const AuxSample& aux) {
  if (!aux_enabled) return;
  size_t i = y * w + x;

  if (aux_samples[i]++ == 0) {
    aux_primitive[i] = aux.primitive_id;
    aux_material[i] = aux.material_id;
  }
  if (!aux.hit) return;

  size_t n = ++aux_hits[i];
  aux_albedo[i] += (aux.albedo - aux_albedo[i]) / static_cast<double>(n);
  aux_normal[i] += (aux.normal - aux_normal[i]) / static_cast<double>(n);
  aux_depth[i] += (aux.depth - aux_depth[i]) / static_cast<double>(n);
}

double Framebuffer::depth(size_t x, size_t y) const {
  size_t i = y * w + x;
  return aux_hits[i] > 0 ? aux_depth[i] : INF_D;
}

std::vector<float> Framebuffer::to_float_rgb() const {
  std::vector<float> rgb(3 * w * h);
  for (size_t i = 0; i < pixels.size(); ++i) {
    const Vector3D& c = pixels[i].mean;
    rgb[3 * i + 0] = static_cast<float>(c.x);
    rgb[3 * i + 1] = static_cast<float>(c.y);
    rgb[3 * i + 2] = static_cast<float>(c.z);
  }
  return rgb;
}

std::vector<size_t> Framebuffer::sample_counts() const {
  std::vector<size_t> counts(pixels.size());
  for (size_t i = 0; i < pixels.size(); ++i) counts[i] = pixels[i].n;
  return counts;
}

} // namespace Lumina
