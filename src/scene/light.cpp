#include "light.h"

#include "pathtracer/bsdf.h"
#include "pathtracer/sampler.h"

#include <algorithm>
#include <cmath>

namespace Lumina {
namespace SceneObjects {

// Relative weight given to lights that report no power.
static const double kPowerFloor = 1e-4;

SceneLight::SceneLight(Type type, const Vector3D& color, double intensity)
    : type(type), color(color), intensity(intensity), area_(0), radius(0) {}

SceneLight SceneLight::point(const Vector3D& position, const Vector3D& color,
                             double intensity) {
  SceneLight light(Type::POINT, color, intensity);
  light.position = position;
  return light;
}

SceneLight SceneLight::directional(const Vector3D& direction,
                                   const Vector3D& color, double intensity) {
  SceneLight light(Type::DIRECTIONAL, color, intensity);
  light.direction = direction.unit();
  return light;
}

SceneLight SceneLight::area(const Vector3D& corner, const Vector3D& edge1,
                            const Vector3D& edge2, const Vector3D& color,
                            double intensity) {
  SceneLight light(Type::AREA, color, intensity);
  light.position = corner;
  light.edge1 = edge1;
  light.edge2 = edge2;
  Vector3D n = cross(edge1, edge2);
  light.area_ = n.norm();
  light.direction = light.area_ > 0 ? n / light.area_ : Vector3D(0, 0, 1);
  return light;
}

SceneLight SceneLight::sphere(const Vector3D& center, double radius,
                              const Vector3D& color, double intensity) {
  SceneLight light(Type::SPHERE, color, intensity);
  light.position = center;
  light.radius = std::fabs(radius);
  return light;
}

// Distance along unit direction d from p to the sphere surface, preferring
// the near side.
static double sphere_distance(const Vector3D& p, const Vector3D& d,
                              const Vector3D& center, double radius) {
  Vector3D pc = center - p;
  double proj = dot(pc, d);
  double d2 = pc.norm2() - proj * proj;
  double thc = std::sqrt(std::max(0.0, radius * radius - d2));
  double t = proj - thc;
  if (t < 0) t = proj + thc;
  return t;
}

// 1 - cos(theta_max) of the cone subtended by a sphere, stable for
// distant spheres.
static double one_minus_cos_max(double dist2, double radius) {
  double sin2 = std::min(1.0, radius * radius / dist2);
  double cos_max = std::sqrt(std::max(0.0, 1.0 - sin2));
  return sin2 / (1.0 + cos_max);
}

Vector3D SceneLight::sample_L(const Vector3D& p, RandomStream& rng,
                              Vector3D* wi, double* distance_to_light,
                              double* pdf) const {
  switch (type) {
    case Type::POINT: {
      Vector3D d = position - p;
      double dist2 = d.norm2();
      if (dist2 <= 0) {
        *pdf = 0;
        return Vector3D();
      }
      double dist = std::sqrt(dist2);
      *wi = d / dist;
      *distance_to_light = dist;
      *pdf = 1.0;
      return radiance() / dist2;
    }

    case Type::DIRECTIONAL:
      *wi = -direction;
      *distance_to_light = INF_D;
      *pdf = 1.0;
      return radiance();

    case Type::AREA: {
      Vector2D u = sample_unit_square(rng);
      Vector3D q = position + u.x * edge1 + u.y * edge2;
      Vector3D d = q - p;
      double dist2 = d.norm2();
      if (dist2 <= 0 || area_ <= 0) {
        *pdf = 0;
        return Vector3D();
      }
      double dist = std::sqrt(dist2);
      *wi = d / dist;
      *distance_to_light = dist;
      double cos_l = -dot(*wi, direction);
      if (cos_l <= 0) {
        // behind the emitting side
        *pdf = 0;
        return Vector3D();
      }
      *pdf = dist2 / (cos_l * area_);
      return radiance();
    }

    case Type::SPHERE: {
      Vector3D d = position - p;
      double dist2 = d.norm2();
      if (dist2 <= radius * radius) {
        // Inside the sphere every direction reaches its surface, but only
        // the back of the emitter is visible.
        *wi = sample_uniform_sphere(rng);
        *distance_to_light = sphere_distance(p, *wi, position, radius);
        *pdf = 1.0 / (4.0 * PI);
        return Vector3D();
      }
      double omc = one_minus_cos_max(dist2, radius);
      Matrix3x3 o2w;
      make_coord_space(o2w, d);
      *wi = (o2w * sample_uniform_cone(rng, 1.0 - omc)).unit();
      *distance_to_light = sphere_distance(p, *wi, position, radius);
      *pdf = omc > 0 ? 1.0 / (2.0 * PI * omc) : 0.0;
      return radiance();
    }
  }
  *pdf = 0;
  return Vector3D();
}

double SceneLight::pdf(const Vector3D& p, const Vector3D& wi) const {
  switch (type) {
    case Type::POINT:
    case Type::DIRECTIONAL:
      return 0;

    case Type::AREA: {
      double denom = dot(direction, wi);
      if (denom >= 0 || area_ <= 0) return 0;  // parallel or from behind
      double t = dot(position - p, direction) / denom;
      if (t <= 0) return 0;
      Vector3D local = p + t * wi - position;
      // parallelogram coordinates of the hit point
      Vector3D w = direction / area_;
      double a = dot(w, cross(local, edge2));
      double b = dot(w, cross(edge1, local));
      if (a < 0 || a > 1 || b < 0 || b > 1) return 0;
      double cos_l = -denom / wi.norm();
      return t * t * wi.norm2() / (cos_l * area_);
    }

    case Type::SPHERE: {
      Vector3D d = position - p;
      double dist2 = d.norm2();
      if (dist2 <= radius * radius) return 1.0 / (4.0 * PI);
      double omc = one_minus_cos_max(dist2, radius);
      if (omc <= 0) return 0;
      double cos_theta = dot(d, wi) / (std::sqrt(dist2) * wi.norm());
      if (cos_theta < 1.0 - omc) return 0;
      return 1.0 / (2.0 * PI * omc);
    }
  }
  return 0;
}

double SceneLight::power() const {
  double base = intensity * average(color);
  switch (type) {
    case Type::POINT:
    case Type::DIRECTIONAL:
      return base;
    case Type::AREA:
      return area_ * base;
    case Type::SPHERE:
      return 4.0 * PI * radius * radius * base;
  }
  return base;
}

LightDistribution::LightDistribution(const std::vector<SceneLight>& lights) {
  if (lights.empty()) return;

  std::vector<double> weights(lights.size());
  double total = 0;
  for (size_t i = 0; i < lights.size(); ++i) {
    weights[i] = std::max(0.0, lights[i].power());
    if (!std::isfinite(weights[i])) weights[i] = 0;
    total += weights[i];
  }

  double floor = total > 0 ? kPowerFloor * total / lights.size() : 1.0;
  total = 0;
  for (double& w : weights) {
    w = std::max(w, floor);
    total += w;
  }

  cdf.resize(weights.size());
  pmfs.resize(weights.size());
  double acc = 0;
  for (size_t i = 0; i < weights.size(); ++i) {
    pmfs[i] = weights[i] / total;
    acc += pmfs[i];
    cdf[i] = acc;
  }
  cdf.back() = 1.0;
}

size_t LightDistribution::sample(double u, double* pmf) const {
  size_t index = std::upper_bound(cdf.begin(), cdf.end(), u) - cdf.begin();
  if (index >= cdf.size()) index = cdf.size() - 1;
  *pmf = pmfs[index];
  return index;
}

double LightDistribution::pmf(size_t index) const {
  if (index >= pmfs.size()) return 0;
  return pmfs[index];
}

} // namespace SceneObjects
} // namespace Lumina
