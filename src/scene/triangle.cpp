#include "triangle.h"

#include <cmath>

namespace Lumina {
namespace SceneObjects {

// Padding applied to the triangle bounds so flat triangles keep a volume.
static const double kBoundsPad = 1e-4;

Triangle::Triangle(const Vector3D& p1, const Vector3D& p2,
                   const Vector3D& p3)
    : p1(p1), p2(p2), p3(p3), has_normals(false), has_uvs(false) {
  face_n = cross(p2 - p1, p3 - p1);
  if (face_n.norm2() > 0) face_n.normalize();
  n1 = n2 = n3 = face_n;
}

Triangle::Triangle(const Vector3D& p1, const Vector3D& p2,
                   const Vector3D& p3, const Vector3D& n1,
                   const Vector3D& n2, const Vector3D& n3)
    : Triangle(p1, p2, p3) {
  this->n1 = n1;
  this->n2 = n2;
  this->n3 = n3;
  has_normals = true;
}

void Triangle::set_uvs(const Vector2D& a, const Vector2D& b,
                       const Vector2D& c) {
  uv1 = a;
  uv2 = b;
  uv3 = c;
  has_uvs = true;
}

BBox Triangle::get_bbox() const {
  BBox bbox(p1);
  bbox.expand(p2);
  bbox.expand(p3);
  Vector3D pad(kBoundsPad, kBoundsPad, kBoundsPad);
  return BBox(bbox.min - pad, bbox.max + pad);
}

bool Triangle::has_intersection(const Ray& ray) const {
  double max_t = ray.max_t;
  Intersection isect;
  bool hit = intersect(ray, &isect);
  ray.max_t = max_t;
  return hit;
}

bool Triangle::intersect(const Ray& ray, Intersection* isect) const {
  // Moller-Trumbore
  Vector3D e1 = p2 - p1;
  Vector3D e2 = p3 - p1;
  Vector3D h = cross(ray.d, e2);
  double a = dot(e1, h);
  if (std::fabs(a) < 1e-12) return false;  // parallel or degenerate

  double f = 1.0 / a;
  Vector3D s = ray.o - p1;
  double beta = f * dot(s, h);
  if (beta < 0.0 || beta > 1.0) return false;

  Vector3D q = cross(s, e1);
  double gamma = f * dot(ray.d, q);
  if (gamma < 0.0 || beta + gamma > 1.0) return false;

  double t = f * dot(e2, q);
  if (t < ray.min_t || t > ray.max_t) return false;

  ray.max_t = t;

  double alpha = 1.0 - beta - gamma;
  isect->t = t;
  isect->p = ray.at_time(t);
  isect->set_face_normal(ray.d, face_n);
  if (has_normals) {
    Vector3D ns = alpha * n1 + beta * n2 + gamma * n3;
    if (ns.norm2() > 0) {
      ns.normalize();
      // keep the shading normal on the geometric side
      if (dot(ns, face_n) < 0) ns = -ns;
      isect->shading_n = ns;
    }
  }
  if (has_uvs) {
    isect->uv = alpha * uv1 + beta * uv2 + gamma * uv3;
  } else {
    isect->uv = Vector2D(beta, gamma);
  }
  return true;
}

} // namespace SceneObjects
} // namespace Lumina
