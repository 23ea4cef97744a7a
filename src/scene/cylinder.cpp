#include "cylinder.h"

#include "pathtracer/bsdf.h"

#include <cmath>

namespace Lumina {
namespace SceneObjects {

Cylinder::Cylinder(const Vector3D& base, const Vector3D& axis, double radius,
                   double height)
    : base(base), axis(axis.unit()), radius(radius), height(height) {
  make_coord_space(o2w, this->axis);
}

BBox Cylinder::get_bbox() const {
  // bounds of a disk of the given radius perpendicular to the axis
  Vector3D ext;
  for (int k = 0; k < 3; ++k) {
    ext[k] = radius * std::sqrt(std::max(0.0, 1.0 - axis[k] * axis[k]));
  }
  Vector3D top = base + height * axis;
  BBox bbox(base - ext, base + ext);
  bbox.expand(BBox(top - ext, top + ext));
  return bbox;
}

bool Cylinder::has_intersection(const Ray& ray) const {
  double max_t = ray.max_t;
  Intersection isect;
  bool hit = intersect(ray, &isect);
  ray.max_t = max_t;
  return hit;
}

bool Cylinder::intersect(const Ray& ray, Intersection* i) const {
  Matrix3x3 w2o = o2w.T();
  Vector3D o = w2o * (ray.o - base);
  Vector3D d = w2o * ray.d;

  double best_t = ray.max_t;
  bool found = false;
  Vector3D best_n;
  Vector2D best_uv;

  // lateral surface
  double a = d.x * d.x + d.y * d.y;
  if (a > 0) {
    double half_b = o.x * d.x + o.y * d.y;
    double c = o.x * o.x + o.y * o.y - radius * radius;
    double disc = half_b * half_b - a * c;
    if (disc >= 0) {
      double sq = std::sqrt(disc);
      double roots[2] = { (-half_b - sq) / a, (-half_b + sq) / a };
      for (double t : roots) {
        if (t < ray.min_t || t > best_t) continue;
        double z = o.z + t * d.z;
        if (z < 0 || z > height) continue;
        Vector3D pl = o + t * d;
        best_t = t;
        best_n = Vector3D(pl.x, pl.y, 0) / radius;
        double phi = std::atan2(pl.y, pl.x) + PI;
        best_uv = Vector2D(phi / (2.0 * PI), z / height);
        found = true;
        break;
      }
    }
  }

  // caps
  if (d.z != 0) {
    double cap_z[2] = { 0.0, height };
    for (int k = 0; k < 2; ++k) {
      double t = (cap_z[k] - o.z) / d.z;
      if (t < ray.min_t || t > best_t) continue;
      Vector3D pl = o + t * d;
      if (pl.x * pl.x + pl.y * pl.y > radius * radius) continue;
      best_t = t;
      best_n = Vector3D(0, 0, k == 0 ? -1.0 : 1.0);
      best_uv = Vector2D(0.5 + 0.5 * pl.x / radius, 0.5 + 0.5 * pl.y / radius);
      found = true;
    }
  }

  if (!found) return false;

  ray.max_t = best_t;

  i->t = best_t;
  i->p = ray.at_time(best_t);
  i->set_face_normal(ray.d, (o2w * best_n).unit());
  i->uv = best_uv;
  return true;
}

} // namespace SceneObjects
} // namespace Lumina
