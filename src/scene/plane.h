#ifndef LUMINA_SCENE_PLANE_H
#define LUMINA_SCENE_PLANE_H

#include "bbox.h"
#include "pathtracer/intersection.h"
#include "pathtracer/ray.h"

namespace Lumina {
namespace SceneObjects {

/**
 * Infinite plane through a point. It has no finite bounds, so the scene
 * tests planes outside of the BVH.
 */
struct Plane {

  Plane(const Vector3D& point, const Vector3D& normal)
      : point(point), normal(normal.unit()) {}

  bool has_intersection(const Ray& ray) const;

  bool intersect(const Ray& ray, Intersection* i) const;

  Vector3D point;
  Vector3D normal;
};

} // namespace SceneObjects
} // namespace Lumina

#endif // LUMINA_SCENE_PLANE_H
