#include "box.h"

#include <algorithm>
#include <cmath>

namespace Lumina {
namespace SceneObjects {

Box::Box(const Vector3D& a, const Vector3D& b) {
  min = Vector3D(std::min(a.x, b.x), std::min(a.y, b.y), std::min(a.z, b.z));
  max = Vector3D(std::max(a.x, b.x), std::max(a.y, b.y), std::max(a.z, b.z));
}

bool Box::has_intersection(const Ray& ray) const {
  double max_t = ray.max_t;
  Intersection isect;
  bool hit = intersect(ray, &isect);
  ray.max_t = max_t;
  return hit;
}

bool Box::intersect(const Ray& ray, Intersection* i) const {
  double t0 = -INF_D, t1 = INF_D;
  int axis0 = -1, axis1 = -1;

  for (int a = 0; a < 3; ++a) {
    if (ray.d[a] == 0) {
      if (ray.o[a] < min[a] || ray.o[a] > max[a]) return false;
      continue;
    }
    double ta = (min[a] - ray.o[a]) * ray.inv_d[a];
    double tb = (max[a] - ray.o[a]) * ray.inv_d[a];
    if (ta > tb) std::swap(ta, tb);
    if (ta > t0) { t0 = ta; axis0 = a; }
    if (tb < t1) { t1 = tb; axis1 = a; }
    if (t0 > t1) return false;
  }
  if (axis0 < 0 || axis1 < 0) return false;

  double t;
  int axis;
  if (t0 >= ray.min_t && t0 <= ray.max_t) {
    t = t0;
    axis = axis0;
  } else if (t1 >= ray.min_t && t1 <= ray.max_t) {
    t = t1;  // ray starts inside the box
    axis = axis1;
  } else {
    return false;
  }

  ray.max_t = t;

  Vector3D p = ray.at_time(t);
  Vector3D center = (min + max) / 2;
  Vector3D outward;
  outward[axis] = p[axis] > center[axis] ? 1.0 : -1.0;

  i->t = t;
  i->p = p;
  i->set_face_normal(ray.d, outward);

  // planar uvs over the two remaining axes of the face
  int ua = (axis + 1) % 3, va = (axis + 2) % 3;
  Vector3D ext = max - min;
  double u = ext[ua] > 0 ? (p[ua] - min[ua]) / ext[ua] : 0.0;
  double v = ext[va] > 0 ? (p[va] - min[va]) / ext[va] : 0.0;
  i->uv = Vector2D(u, v);
  return true;
}

} // namespace SceneObjects
} // namespace Lumina
