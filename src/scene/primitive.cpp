#include "primitive.h"

#include <new>

namespace Lumina {
namespace SceneObjects {

Primitive::Primitive(const Sphere& sphere, const BSDF* bsdf,
                     const Medium* interior)
    : type(Type::SPHERE), bsdf(bsdf), interior(interior), light_index(-1),
      id(0) {
  new (&shape.sphere) Sphere(sphere);
  compute_bbox();
}

Primitive::Primitive(const Plane& plane, const BSDF* bsdf,
                     const Medium* interior)
    : type(Type::PLANE), bsdf(bsdf), interior(interior), light_index(-1),
      id(0) {
  new (&shape.plane) Plane(plane);
  compute_bbox();
}

Primitive::Primitive(const Triangle& triangle, const BSDF* bsdf,
                     const Medium* interior)
    : type(Type::TRIANGLE), bsdf(bsdf), interior(interior), light_index(-1),
      id(0) {
  new (&shape.triangle) Triangle(triangle);
  compute_bbox();
}

Primitive::Primitive(const Box& box, const BSDF* bsdf,
                     const Medium* interior)
    : type(Type::BOX), bsdf(bsdf), interior(interior), light_index(-1),
      id(0) {
  new (&shape.box) Box(box);
  compute_bbox();
}

Primitive::Primitive(const Cylinder& cylinder, const BSDF* bsdf,
                     const Medium* interior)
    : type(Type::CYLINDER), bsdf(bsdf), interior(interior), light_index(-1),
      id(0) {
  new (&shape.cylinder) Cylinder(cylinder);
  compute_bbox();
}

Primitive::Primitive(const Cone& cone, const BSDF* bsdf,
                     const Medium* interior)
    : type(Type::CONE), bsdf(bsdf), interior(interior), light_index(-1),
      id(0) {
  new (&shape.cone) Cone(cone);
  compute_bbox();
}

Primitive::Primitive(const Quad& quad, const BSDF* bsdf,
                     const Medium* interior)
    : type(Type::QUAD), bsdf(bsdf), interior(interior), light_index(-1),
      id(0) {
  new (&shape.quad) Quad(quad);
  compute_bbox();
}

Primitive::Primitive(const Primitive& other)
    : type(other.type), bsdf(other.bsdf), interior(other.interior),
      light_index(other.light_index), id(other.id), bbox(other.bbox) {
  copy_shape(other);
}

Primitive& Primitive::operator=(const Primitive& other) {
  if (this == &other) return *this;
  // every shape is trivially destructible, so the old member is simply
  // overwritten
  type = other.type;
  bsdf = other.bsdf;
  interior = other.interior;
  light_index = other.light_index;
  id = other.id;
  bbox = other.bbox;
  copy_shape(other);
  return *this;
}

void Primitive::copy_shape(const Primitive& other) {
  switch (other.type) {
    case Type::SPHERE:
      new (&shape.sphere) Sphere(other.shape.sphere);
      break;
    case Type::PLANE:
      new (&shape.plane) Plane(other.shape.plane);
      break;
    case Type::TRIANGLE:
      new (&shape.triangle) Triangle(other.shape.triangle);
      break;
    case Type::BOX:
      new (&shape.box) Box(other.shape.box);
      break;
    case Type::CYLINDER:
      new (&shape.cylinder) Cylinder(other.shape.cylinder);
      break;
    case Type::CONE:
      new (&shape.cone) Cone(other.shape.cone);
      break;
    case Type::QUAD:
      new (&shape.quad) Quad(other.shape.quad);
      break;
  }
}

void Primitive::compute_bbox() {
  switch (type) {
    case Type::SPHERE:   bbox = shape.sphere.get_bbox(); break;
    case Type::TRIANGLE: bbox = shape.triangle.get_bbox(); break;
    case Type::BOX:      bbox = shape.box.get_bbox(); break;
    case Type::CYLINDER: bbox = shape.cylinder.get_bbox(); break;
    case Type::CONE:     bbox = shape.cone.get_bbox(); break;
    case Type::QUAD:     bbox = shape.quad.get_bbox(); break;
    case Type::PLANE:    bbox = BBox(); break;
  }
}

bool Primitive::intersect(const Ray& ray, Intersection* isect) const {
  bool hit = false;
  switch (type) {
    case Type::SPHERE:   hit = shape.sphere.intersect(ray, isect); break;
    case Type::PLANE:    hit = shape.plane.intersect(ray, isect); break;
    case Type::TRIANGLE: hit = shape.triangle.intersect(ray, isect); break;
    case Type::BOX:      hit = shape.box.intersect(ray, isect); break;
    case Type::CYLINDER: hit = shape.cylinder.intersect(ray, isect); break;
    case Type::CONE:     hit = shape.cone.intersect(ray, isect); break;
    case Type::QUAD:     hit = shape.quad.intersect(ray, isect); break;
  }
  if (hit) {
    isect->primitive = this;
    isect->bsdf = bsdf;
  }
  return hit;
}

bool Primitive::has_intersection(const Ray& ray) const {
  switch (type) {
    case Type::SPHERE:   return shape.sphere.has_intersection(ray);
    case Type::PLANE:    return shape.plane.has_intersection(ray);
    case Type::TRIANGLE: return shape.triangle.has_intersection(ray);
    case Type::BOX:      return shape.box.has_intersection(ray);
    case Type::CYLINDER: return shape.cylinder.has_intersection(ray);
    case Type::CONE:     return shape.cone.has_intersection(ray);
    case Type::QUAD:     return shape.quad.has_intersection(ray);
  }
  return false;
}

} // namespace SceneObjects
} // namespace Lumina
