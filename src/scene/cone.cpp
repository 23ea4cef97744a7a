#include "cone.h"

#include "pathtracer/bsdf.h"

#include <cmath>

namespace Lumina {
namespace SceneObjects {

Cone::Cone(const Vector3D& base, const Vector3D& axis, double radius,
           double height)
    : base(base), axis(axis.unit()), radius(radius), height(height) {
  make_coord_space(o2w, this->axis);
}

BBox Cone::get_bbox() const {
  Vector3D ext;
  for (int k = 0; k < 3; ++k) {
    ext[k] = radius * std::sqrt(std::max(0.0, 1.0 - axis[k] * axis[k]));
  }
  BBox bbox(base - ext, base + ext);
  bbox.expand(base + height * axis);
  return bbox;
}

bool Cone::has_intersection(const Ray& ray) const {
  double max_t = ray.max_t;
  Intersection isect;
  bool hit = intersect(ray, &isect);
  ray.max_t = max_t;
  return hit;
}

bool Cone::intersect(const Ray& ray, Intersection* i) const {
  Matrix3x3 w2o = o2w.T();
  Vector3D o = w2o * (ray.o - base);
  Vector3D d = w2o * ray.d;

  // radius shrinks linearly: r(z) = radius - k z
  double k = radius / height;
  double r0 = radius - k * o.z;

  double best_t = ray.max_t;
  bool found = false;
  Vector3D best_n;
  Vector2D best_uv;

  double a = d.x * d.x + d.y * d.y - k * k * d.z * d.z;
  double half_b = o.x * d.x + o.y * d.y + k * d.z * r0;
  double c = o.x * o.x + o.y * o.y - r0 * r0;

  double roots[2];
  int num_roots = 0;
  if (std::fabs(a) > 1e-12) {
    double disc = half_b * half_b - a * c;
    if (disc >= 0) {
      double sq = std::sqrt(disc);
      double t1 = (-half_b - sq) / a;
      double t2 = (-half_b + sq) / a;
      if (t1 > t2) std::swap(t1, t2);
      roots[0] = t1;
      roots[1] = t2;
      num_roots = 2;
    }
  } else if (half_b != 0) {
    // ray parallel to the slant
    roots[0] = -c / (2.0 * half_b);
    num_roots = 1;
  }

  for (int n = 0; n < num_roots; ++n) {
    double t = roots[n];
    if (t < ray.min_t || t > best_t) continue;
    Vector3D pl = o + t * d;
    // reject the mirrored nappe above the apex and anything below the base
    if (pl.z < 0 || pl.z > height) continue;
    best_t = t;
    best_n = Vector3D(pl.x, pl.y, k * (radius - k * pl.z));
    double phi = std::atan2(pl.y, pl.x) + PI;
    best_uv = Vector2D(phi / (2.0 * PI), pl.z / height);
    found = true;
    break;
  }

  // base cap
  if (d.z != 0) {
    double t = -o.z / d.z;
    if (t >= ray.min_t && t <= best_t) {
      Vector3D pl = o + t * d;
      if (pl.x * pl.x + pl.y * pl.y <= radius * radius) {
        best_t = t;
        best_n = Vector3D(0, 0, -1);
        best_uv =
            Vector2D(0.5 + 0.5 * pl.x / radius, 0.5 + 0.5 * pl.y / radius);
        found = true;
      }
    }
  }

  if (!found || best_n.norm2() <= 0) return false;

  ray.max_t = best_t;

  i->t = best_t;
  i->p = ray.at_time(best_t);
  i->set_face_normal(ray.d, (o2w * best_n).unit());
  i->uv = best_uv;
  return true;
}

} // namespace SceneObjects
} // namespace Lumina
