#ifndef LUMINA_SCENE_CYLINDER_H
#define LUMINA_SCENE_CYLINDER_H

#include "bbox.h"
#include "pathtracer/intersection.h"
#include "pathtracer/ray.h"

namespace Lumina {
namespace SceneObjects {

/**
 * Closed cylinder standing on a base disk. The axis points from the base
 * cap to the top cap.
 */
struct Cylinder {

  Cylinder(const Vector3D& base, const Vector3D& axis, double radius,
           double height);

  BBox get_bbox() const;

  bool has_intersection(const Ray& ray) const;

  bool intersect(const Ray& ray, Intersection* i) const;

  Vector3D base;
  Vector3D axis;  ///< unit axis
  double radius;
  double height;
  Matrix3x3 o2w;  ///< local frame, z along the axis
};

} // namespace SceneObjects
} // namespace Lumina

#endif // LUMINA_SCENE_CYLINDER_H
