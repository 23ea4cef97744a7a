#include "quad.h"

#include <cmath>

namespace Lumina {
namespace SceneObjects {

static const double kBoundsPad = 1e-3;

Quad::Quad(const Vector3D& corner, const Vector3D& edge1,
           const Vector3D& edge2)
    : corner(corner), edge1(edge1), edge2(edge2) {
  Vector3D n = cross(edge1, edge2);
  area_ = n.norm();
  double n2 = n.norm2();
  normal = area_ > 0 ? n / area_ : Vector3D(0, 0, 1);
  w = n2 > 0 ? n / n2 : Vector3D();
}

BBox Quad::get_bbox() const {
  BBox bbox(corner);
  bbox.expand(corner + edge1);
  bbox.expand(corner + edge2);
  bbox.expand(corner + edge1 + edge2);
  Vector3D pad(kBoundsPad, kBoundsPad, kBoundsPad);
  return BBox(bbox.min - pad, bbox.max + pad);
}

bool Quad::has_intersection(const Ray& ray) const {
  double max_t = ray.max_t;
  Intersection isect;
  bool hit = intersect(ray, &isect);
  ray.max_t = max_t;
  return hit;
}

bool Quad::intersect(const Ray& ray, Intersection* i) const {
  double denom = dot(normal, ray.d);
  if (std::fabs(denom) < 1e-8) return false;

  double t = dot(corner - ray.o, normal) / denom;
  if (t < ray.min_t || t > ray.max_t) return false;

  Vector3D p = ray.at_time(t);
  Vector3D local = p - corner;
  double a = dot(w, cross(local, edge2));
  double b = dot(w, cross(edge1, local));
  if (a < 0 || a > 1 || b < 0 || b > 1) return false;

  ray.max_t = t;

  i->t = t;
  i->p = p;
  i->set_face_normal(ray.d, normal);
  i->uv = Vector2D(a, b);
  return true;
}

} // namespace SceneObjects
} // namespace Lumina
