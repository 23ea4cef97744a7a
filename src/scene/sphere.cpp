#include "sphere.h"

#include <cmath>

namespace Lumina {
namespace SceneObjects {

Vector3D Sphere::center(double time) const {
  if (time1 == time0) return center0;
  double s = (time - time0) / (time1 - time0);
  return center0 + s * (center1 - center0);
}

BBox Sphere::get_bbox() const {
  double ar = std::fabs(r);
  Vector3D ext(ar, ar, ar);
  BBox bbox(center0 - ext, center0 + ext);
  bbox.expand(BBox(center1 - ext, center1 + ext));
  return bbox;
}

bool Sphere::test(const Ray& ray, double& t1, double& t2) const {

  Vector3D oc = ray.o - center(ray.time);

  double a = dot(ray.d, ray.d);
  double half_b = dot(oc, ray.d);
  double c = dot(oc, oc) - r2;

  double discriminant = half_b * half_b - a * c;
  if (discriminant < 0 || a <= 0) {
    return false;
  }

  double sqrtd = std::sqrt(discriminant);
  t1 = (-half_b - sqrtd) / a;
  t2 = (-half_b + sqrtd) / a;

  return true;
}

bool Sphere::has_intersection(const Ray& ray) const {
  // occlusion queries leave the ray untouched
  double max_t = ray.max_t;
  Intersection isect;
  bool hit = intersect(ray, &isect);
  ray.max_t = max_t;
  return hit;
}

bool Sphere::intersect(const Ray& ray, Intersection* i) const {

  double t1, t2;
  if (!test(ray, t1, t2)) return false;

  double t;
  if (t1 >= ray.min_t && t1 <= ray.max_t) {
    t = t1;  // closer intersection
  } else if (t2 >= ray.min_t && t2 <= ray.max_t) {
    t = t2;  // ray starts inside the sphere
  } else {
    return false;
  }

  ray.max_t = t;

  Vector3D p = ray.at_time(t);
  Vector3D outward = (p - center(ray.time)) / r;

  i->t = t;
  i->p = p;
  i->set_face_normal(ray.d, outward);

  // spherical coordinates of the unit normal
  Vector3D u = outward * (r < 0 ? -1.0 : 1.0);
  double theta = std::acos(std::max(-1.0, std::min(1.0, -u.y)));
  double phi = std::atan2(-u.z, u.x) + PI;
  i->uv = Vector2D(phi / (2.0 * PI), theta / PI);

  return true;
}

} // namespace SceneObjects
} // namespace Lumina
