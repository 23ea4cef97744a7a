#include "pathtracer.h"

#include "bsdf.h"
#include "medium.h"
#include "sampler.h"
#include "util/error.h"

#include <algorithm>
#include <cmath>

using namespace Lumina::SceneObjects;

namespace Lumina {

// Upper bound on index matched boundaries crossed without a bounce.
static const int kMaxBoundaryCrossings = 256;

PathTracer::PathTracer(const Scene* scene, const Camera* camera,
                       const RenderConfig& config)
    : scene(scene), camera(camera), width(config.width),
      height(config.height), max_ray_depth(config.max_ray_depth),
      rr_min_depth(config.rr_min_depth),
      use_russian_roulette(config.russian_roulette), seed(config.seed),
      max_samples(config.max_samples),
      samples_per_batch(config.samples_per_batch),
      max_tolerance(config.max_tolerance), aux_buffers(config.aux_buffers) {}

Vector3D PathTracer::estimate_direct_lighting_importance(
    const Intersection& isect, const Matrix3x3& o2w, const Vector3D& w_out,
    const Medium* medium, double time, RandomStream& rng) const {

  const std::vector<SceneLight>& lights = scene->get_lights();
  if (lights.empty()) return Vector3D();

  double pmf;
  size_t index =
      scene->get_light_distribution().sample(rng.random_uniform(), &pmf);
  const SceneLight& light = lights[index];

  Vector3D wi;
  double dist, light_pdf;
  Vector3D Li = light.sample_L(isect.p, rng, &wi, &dist, &light_pdf);
  if (!(light_pdf > 0) || is_black(Li)) return Vector3D();

  Matrix3x3 w2o = o2w.T();
  Vector3D w_in = w2o * wi;
  Vector3D f = isect.bsdf->f(w_out, w_in, isect.uv);
  if (is_black(f)) return Vector3D();

  Ray shadow(isect.p, wi, dist - EPS_F, time);
  shadow.min_t = EPS_F;
  Vector3D tr = scene->transmittance(shadow, medium);
  if (is_black(tr)) return Vector3D();

  light_pdf *= pmf;
  double weight = 1.0;
  if (!light.is_delta_light()) {
    weight = power_heuristic(light_pdf, isect.bsdf->pdf(w_out, w_in));
  }
  return f * Li * tr * (abs_cos_theta(w_in) * weight / light_pdf);
}

Vector3D PathTracer::estimate_direct_lighting_medium(const Vector3D& p,
                                                     const Vector3D& d_in,
                                                     const Medium* medium,
                                                     double time,
                                                     RandomStream& rng) const {

  const std::vector<SceneLight>& lights = scene->get_lights();
  if (lights.empty()) return Vector3D();

  double pmf;
  size_t index =
      scene->get_light_distribution().sample(rng.random_uniform(), &pmf);
  const SceneLight& light = lights[index];

  Vector3D wi;
  double dist, light_pdf;
  Vector3D Li = light.sample_L(p, rng, &wi, &dist, &light_pdf);
  if (!(light_pdf > 0) || is_black(Li)) return Vector3D();

  double phase = medium->phase(d_in, wi);

  Ray shadow(p, wi, dist - EPS_F, time);
  Vector3D tr = scene->transmittance(shadow, medium);
  if (is_black(tr)) return Vector3D();

  light_pdf *= pmf;
  double weight = 1.0;
  if (!light.is_delta_light()) weight = power_heuristic(light_pdf, phase);
  return Li * tr * (phase * weight / light_pdf);
}

bool PathTracer::russian_roulette(Vector3D& throughput, size_t bounce,
                                  RandomStream& rng) const {
  if (!use_russian_roulette || bounce < rr_min_depth) return true;
  double p = std::min(1.0, max_component(throughput));
  if (!(p > 0)) return false;
  if (!rng.coin_flip(p)) return false;
  throughput = throughput / p;
  return true;
}

Vector3D PathTracer::est_radiance_global_illumination(const Ray& r,
                                                      RandomStream& rng,
                                                      AuxSample* aux) const {
  Vector3D L_out;
  Vector3D throughput(1, 1, 1);

  Ray ray = r;
  const Medium* medium = NULL;
  size_t bounce = 0;
  int crossings = 0;

  // state of the previous scattering vertex, for MIS on emitter hits
  bool specular = true;
  double prev_pdf = 0;
  Vector3D prev_p = ray.o;

  while (true) {
    Intersection isect;
    bool hit = scene->intersect(ray, &isect);

    if (medium) {
      double t;
      bool scattered;
      throughput = throughput * medium->sample_distance(
                                    hit ? isect.t : INF_D, rng, &t,
                                    &scattered);
      if (is_black(throughput)) break;

      if (scattered) {
        if (bounce >= max_ray_depth) break;
        Vector3D p = ray.at_time(t);
        L_out += throughput * estimate_direct_lighting_medium(
                                  p, ray.d, medium, ray.time, rng);

        Vector3D d_out;
        double phase_pdf = medium->sample_phase(ray.d, &d_out, rng);
        if (!(phase_pdf > 0)) break;
        // the phase value equals its pdf, so the throughput is unchanged

        specular = false;
        prev_pdf = phase_pdf;
        prev_p = p;
        ray = Ray(p, d_out, ray.time);

        bounce++;
        if (!russian_roulette(throughput, bounce, rng)) break;
        continue;
      }
    }

    if (!hit) {
      L_out += throughput * scene->environment_radiance(ray.d);
      break;
    }

    const BSDF* bsdf = isect.bsdf;

    if (!bsdf) {
      // index matched medium boundary
      medium = isect.front_face ? isect.primitive->get_interior() : NULL;
      ray = Ray(isect.p, ray.d, ray.time);
      ray.min_t = EPS_F;
      if (++crossings > kMaxBoundaryCrossings) break;
      continue;
    }

    if (aux && !aux->hit) {
      aux->hit = true;
      aux->albedo = bsdf->albedo_at(isect.uv);
      aux->normal = isect.shading_n;
      aux->depth = (isect.p - r.o).norm();
      aux->primitive_id = static_cast<int64_t>(isect.primitive->get_id());
      aux->material_id = scene->material_id(bsdf);
    }

    Vector3D w_out_world = -ray.d;

    if (bsdf->is_emissive()) {
      if (isect.front_face) {
        double weight = 1.0;
        int light_index = isect.primitive->get_light_index();
        if (!specular && light_index >= 0) {
          const SceneLight& light = scene->get_lights()[light_index];
          double light_pdf =
              scene->get_light_distribution().pmf(light_index) *
              light.pdf(prev_p, ray.d);
          weight = power_heuristic(prev_pdf, light_pdf);
        }
        L_out += throughput * bsdf->get_emission() * weight;
      }
      break;
    }

    if (bounce >= max_ray_depth) break;

    // Opaque materials shade the side the ray arrived from.
    Vector3D n = isect.shading_n;
    if (!bsdf->is_transmissive() && dot(n, w_out_world) < 0) n = -n;

    Matrix3x3 o2w;
    make_coord_space(o2w, n);
    Matrix3x3 w2o = o2w.T();
    Vector3D w_out = w2o * w_out_world;

    if (!bsdf->is_delta()) {
      L_out += throughput * estimate_direct_lighting_importance(
                                isect, o2w, w_out, medium, ray.time, rng);
    }

    Vector3D w_in;
    double pdf;
    Vector3D f = bsdf->sample_f(w_out, &w_in, &pdf, rng, isect.uv);
    if (!(pdf > 0) || !is_finite(f) || is_black(f)) break;

    Vector3D wi = o2w * w_in;
    if (!(wi.norm2() > 0)) break;
    wi.normalize();

    throughput = throughput * f * (abs_cos_theta(w_in) / pdf);
    if (min_component(throughput) < 0) {
      throw InvalidStateError("negative path throughput");
    }
    if (!is_finite(throughput)) break;

    // refraction moves the path into or out of the interior medium
    double cos_out = dot(w_out_world, isect.n);
    double cos_in = dot(wi, isect.n);
    if (bsdf->is_transmissive() && cos_out * cos_in < 0) {
      medium = cos_in < 0 ? isect.primitive->get_interior() : NULL;
    }

    specular = bsdf->is_delta();
    prev_pdf = pdf;
    prev_p = isect.p;
    ray = Ray(isect.p, wi, ray.time);
    ray.min_t = EPS_F;

    bounce++;
    if (!russian_roulette(throughput, bounce, rng)) break;
  }

  return L_out;
}

size_t PathTracer::raytrace_pixel(size_t x, size_t y, size_t num_samples,
                                  Framebuffer* framebuffer, PathStats* stats,
                                  SampleObserver* observer) const {
  if (!camera) throw InvalidStateError("no camera to generate rays from");
  PixelAccumulator& pixel = framebuffer->pixel(x, y);

  size_t i = 0;
  for (; i < num_samples; ++i) {
    if (observer && observer->should_stop()) break;
    size_t s = pixel.drawn++;
    RandomStream rng = RandomStream::for_sample(seed, x, y, s);

    // jittered position inside the pixel, y grows downwards
    Vector2D jitter = sample_unit_square(rng);
    double x_norm = (x + jitter.x) / width;
    double y_norm = (y + jitter.y) / height;
    Ray ray = camera->generate_ray(x_norm, y_norm, rng);

    AuxSample aux;
    Vector3D radiance = est_radiance_global_illumination(
        ray, rng, aux_buffers ? &aux : NULL);

    stats->samples++;
    if (observer) observer->sample_drawn();
    if (!is_finite(radiance)) {
      stats->degenerate++;
      continue;
    }
    pixel.add(radiance);
    if (aux_buffers) framebuffer->add_aux(x, y, aux);
  }
  return i;
}

bool PathTracer::is_converged(const PixelAccumulator& pixel) const {
  if (pixel.n < 2) return false;
  double I = 1.96 * std::sqrt(pixel.variance() / pixel.n);
  return I <= max_tolerance * pixel.lum_mean;
}

size_t PathTracer::raytrace_pixel_adaptive(size_t x, size_t y,
                                           Framebuffer* framebuffer,
                                           PathStats* stats,
                                           SampleObserver* observer) const {
  const PixelAccumulator& pixel = framebuffer->pixel(x, y);
  size_t drawn = 0;
  while (pixel.drawn < max_samples && !is_converged(pixel)) {
    size_t batch = std::min(samples_per_batch, max_samples - pixel.drawn);
    size_t n = raytrace_pixel(x, y, batch, framebuffer, stats, observer);
    drawn += n;
    if (n < batch) break;
  }
  return drawn;
}

} // namespace Lumina
