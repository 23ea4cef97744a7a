#ifndef LUMINA_SCENE_QUAD_H
#define LUMINA_SCENE_QUAD_H

#include "bbox.h"
#include "pathtracer/intersection.h"
#include "pathtracer/ray.h"

namespace Lumina {
namespace SceneObjects {

/**
 * Parallelogram spanned by two edges from a corner. The front side faces
 * along cross(edge1, edge2). Used as the visible surface of rectangular area
 * lights.
 */
struct Quad {

  Quad(const Vector3D& corner, const Vector3D& edge1, const Vector3D& edge2);

  BBox get_bbox() const;

  double area() const { return area_; }

  bool has_intersection(const Ray& ray) const;

  bool intersect(const Ray& ray, Intersection* i) const;

  Vector3D corner;
  Vector3D edge1;
  Vector3D edge2;
  Vector3D normal;  ///< unit normal
  Vector3D w;       ///< cross(edge1, edge2) / |cross|^2, for plane coordinates
  double area_;
};

} // namespace SceneObjects
} // namespace Lumina

#endif // LUMINA_SCENE_QUAD_H
