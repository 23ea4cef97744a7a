#include "plane.h"

#include <cmath>

namespace Lumina {
namespace SceneObjects {

bool Plane::has_intersection(const Ray& ray) const {
  double max_t = ray.max_t;
  Intersection isect;
  bool hit = intersect(ray, &isect);
  ray.max_t = max_t;
  return hit;
}

bool Plane::intersect(const Ray& ray, Intersection* i) const {
  double denom = dot(normal, ray.d);
  // parallel to the plane
  if (std::fabs(denom) < 1e-8) return false;

  double t = dot(point - ray.o, normal) / denom;
  if (t < ray.min_t || t > ray.max_t) return false;

  ray.max_t = t;

  Vector3D p = ray.at_time(t);
  i->t = t;
  i->p = p;
  i->set_face_normal(ray.d, normal);
  i->uv = Vector2D(p.x - std::floor(p.x), p.z - std::floor(p.z));
  return true;
}

} // namespace SceneObjects
} // namespace Lumina
