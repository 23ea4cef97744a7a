#ifndef LUMINA_SCENE_CONE_H
#define LUMINA_SCENE_CONE_H

#include "bbox.h"
#include "pathtracer/intersection.h"
#include "pathtracer/ray.h"

namespace Lumina {
namespace SceneObjects {

/**
 * Cone with a capped base. The axis points from the base center toward the
 * apex, which lies at base + height * axis.
 */
struct Cone {

  Cone(const Vector3D& base, const Vector3D& axis, double radius,
       double height);

  BBox get_bbox() const;

  bool has_intersection(const Ray& ray) const;

  bool intersect(const Ray& ray, Intersection* i) const;

  Vector3D base;
  Vector3D axis;  ///< unit axis
  double radius;  ///< base radius
  double height;
  Matrix3x3 o2w;
};

} // namespace SceneObjects
} // namespace Lumina

#endif // LUMINA_SCENE_CONE_H
