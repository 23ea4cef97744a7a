#include "medium.h"

#include "bsdf.h"
#include "sampler.h"
#include "util/error.h"

#include <cmath>
#include <sstream>

namespace Lumina {

static double henyey_greenstein(double cos_theta, double g) {
  double denom = 1.0 + g * g - 2.0 * g * cos_theta;
  return (1.0 - g * g) / (4.0 * PI * denom * std::sqrt(denom));
}

Medium::Medium(double density, const Vector3D& sigma_a,
               const Vector3D& sigma_s, PhaseType phase, double g)
    : density(density), phase_type(phase), g(g) {
  if (!(density >= 0)) {
    std::ostringstream msg;
    msg << "medium density must be >= 0, got " << density;
    throw ConfigurationError(msg.str());
  }
  if (min_component(sigma_a) < 0 || min_component(sigma_s) < 0) {
    throw ConfigurationError("medium coefficients must be >= 0");
  }
  if (!(g > -1.0 && g < 1.0)) {
    std::ostringstream msg;
    msg << "phase asymmetry g must lie in (-1, 1), got " << g;
    throw ConfigurationError(msg.str());
  }
  sigma_a_ = sigma_a * density;
  sigma_s_ = sigma_s * density;
}

Medium Medium::fog(double density, const Vector3D& color) {
  return Medium(density, Vector3D(), color, PhaseType::ISOTROPIC);
}

Medium Medium::smoke(double density, const Vector3D& albedo, double g) {
  Vector3D absorb = Vector3D(1, 1, 1) - albedo;
  return Medium(density, absorb, albedo, PhaseType::HENYEY_GREENSTEIN, g);
}

Medium Medium::subsurface(const Vector3D& albedo, double mean_free_path,
                          double g) {
  if (!(mean_free_path > 0)) {
    throw ConfigurationError("subsurface mean free path must be > 0");
  }
  Vector3D absorb = Vector3D(1, 1, 1) - albedo;
  PhaseType type = std::fabs(g) < 1e-3 ? PhaseType::ISOTROPIC
                                       : PhaseType::HENYEY_GREENSTEIN;
  return Medium(1.0 / mean_free_path, absorb, albedo, type, g);
}

Vector3D Medium::transmittance(double distance) const {
  Vector3D st = sigma_t();
  Vector3D tr;
  for (int c = 0; c < 3; ++c) {
    tr[c] = st[c] > 0 ? std::exp(-st[c] * distance) : 1.0;
  }
  return tr;
}

Vector3D Medium::sample_distance(double t_max, RandomStream& rng, double* t,
                                 bool* scattered) const {
  Vector3D st = sigma_t();

  int channel = std::min(static_cast<int>(rng.random_uniform() * 3.0), 2);
  double xi = rng.random_uniform();
  double dist = st[channel] > 0 ? -std::log(1.0 - xi) / st[channel] : INF_D;

  *scattered = dist < t_max;
  *t = *scattered ? dist : t_max;

  Vector3D tr = transmittance(*t);
  Vector3D density_pdf = *scattered ? st * tr : tr;
  double pdf = average(density_pdf);
  if (!(pdf > 0) || !std::isfinite(pdf)) {
    *scattered = false;
    return Vector3D();
  }

  if (*scattered) return tr * sigma_s_ * (1.0 / pdf);
  return tr * (1.0 / pdf);
}

double Medium::phase(const Vector3D& d_in, const Vector3D& d_out) const {
  switch (phase_type) {
    case PhaseType::ISOTROPIC:
      return 1.0 / (4.0 * PI);
    case PhaseType::HENYEY_GREENSTEIN:
      return henyey_greenstein(dot(d_in, d_out), g);
  }
  return 0;
}

double Medium::sample_phase(const Vector3D& d_in, Vector3D* d_out,
                            RandomStream& rng) const {
  switch (phase_type) {
    case PhaseType::ISOTROPIC:
      *d_out = sample_uniform_sphere(rng);
      return 1.0 / (4.0 * PI);

    case PhaseType::HENYEY_GREENSTEIN: {
      double xi1 = rng.random_uniform();
      double xi2 = rng.random_uniform();

      double cos_theta;
      if (std::fabs(g) < 1e-3) {
        cos_theta = 1.0 - 2.0 * xi1;
      } else {
        double sq = (1.0 - g * g) / (1.0 - g + 2.0 * g * xi1);
        cos_theta = (1.0 + g * g - sq * sq) / (2.0 * g);
      }
      cos_theta = clamp(cos_theta, -1.0, 1.0);
      double sin_theta = std::sqrt(std::max(0.0, 1.0 - cos_theta * cos_theta));
      double phi = 2.0 * PI * xi2;

      Matrix3x3 o2w;
      make_coord_space(o2w, d_in);
      Vector3D local(sin_theta * std::cos(phi), sin_theta * std::sin(phi),
                     cos_theta);
      *d_out = (o2w * local).unit();
      return henyey_greenstein(cos_theta, g);
    }
  }
  return 0;
}

} // namespace Lumina
