#include "sampler.h"

namespace Lumina {

Vector2D sample_unit_square(RandomStream& rng) {
  double x = rng.random_uniform();
  double y = rng.random_uniform();
  return Vector2D(x, y);
}

Vector2D sample_concentric_disk(RandomStream& rng) {
  double ux = 2.0 * rng.random_uniform() - 1.0;
  double uy = 2.0 * rng.random_uniform() - 1.0;
  if (ux == 0 && uy == 0) return Vector2D(0, 0);

  double r, theta;
  if (std::fabs(ux) > std::fabs(uy)) {
    r = ux;
    theta = (PI / 4.0) * (uy / ux);
  } else {
    r = uy;
    theta = (PI / 2.0) - (PI / 4.0) * (ux / uy);
  }
  return Vector2D(r * std::cos(theta), r * std::sin(theta));
}

Vector3D sample_uniform_hemisphere(RandomStream& rng) {
  double xi1 = rng.random_uniform();
  double xi2 = rng.random_uniform();

  double theta = std::acos(xi1);
  double phi = 2.0 * PI * xi2;

  double xs = std::sin(theta) * std::cos(phi);
  double ys = std::sin(theta) * std::sin(phi);
  double zs = std::cos(theta);

  return Vector3D(xs, ys, zs);
}

Vector3D sample_cosine_hemisphere(RandomStream& rng, double* pdf) {
  double xi1 = rng.random_uniform();
  double xi2 = rng.random_uniform();

  double r = std::sqrt(xi1);
  double theta = 2.0 * PI * xi2;
  double z = std::sqrt(std::max(0.0, 1.0 - xi1));
  *pdf = z / PI;
  return Vector3D(r * std::cos(theta), r * std::sin(theta), z);
}

Vector3D sample_uniform_sphere(RandomStream& rng) {
  double z = 1.0 - 2.0 * rng.random_uniform();
  double r = std::sqrt(std::max(0.0, 1.0 - z * z));
  double phi = 2.0 * PI * rng.random_uniform();
  return Vector3D(r * std::cos(phi), r * std::sin(phi), z);
}

Vector3D sample_uniform_cone(RandomStream& rng, double cos_theta_max) {
  double xi1 = rng.random_uniform();
  double xi2 = rng.random_uniform();
  double cos_theta = (1.0 - xi1) + xi1 * cos_theta_max;
  double sin_theta = std::sqrt(std::max(0.0, 1.0 - cos_theta * cos_theta));
  double phi = 2.0 * PI * xi2;
  return Vector3D(sin_theta * std::cos(phi), sin_theta * std::sin(phi),
                  cos_theta);
}

Vector3D sample_ggx_half_vector(RandomStream& rng, double alpha) {
  double xi1 = rng.random_uniform();
  double xi2 = rng.random_uniform();

  double a2 = alpha * alpha;
  double cos2_theta = (1.0 - xi1) / (1.0 + (a2 - 1.0) * xi1);
  double cos_theta = std::sqrt(std::max(0.0, cos2_theta));
  double sin_theta = std::sqrt(std::max(0.0, 1.0 - cos2_theta));
  double phi = 2.0 * PI * xi2;

  return Vector3D(sin_theta * std::cos(phi), sin_theta * std::sin(phi),
                  cos_theta);
}

} // namespace Lumina
