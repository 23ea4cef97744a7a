#ifndef LUMINA_SCENE_SPHERE_H
#define LUMINA_SCENE_SPHERE_H

#include "bbox.h"
#include "pathtracer/intersection.h"
#include "pathtracer/ray.h"

namespace Lumina {
namespace SceneObjects {

/**
 * A sphere, optionally moving linearly from center0 at time0 to center1 at
 * time1. A negative radius flips the normals inward.
 */
struct Sphere {

  Sphere(const Vector3D& o, double r)
      : center0(o), center1(o), time0(0), time1(1), r(r), r2(r * r) {}

  Sphere(const Vector3D& c0, const Vector3D& c1, double t0, double t1,
         double r)
      : center0(c0), center1(c1), time0(t0), time1(t1), r(r), r2(r * r) {}

  Vector3D center(double time) const;

  BBox get_bbox() const;

  /**
   * Ray - sphere intersection test. Writes the smaller of the two
   * intersection times in t1 and the larger in t2.
   */
  bool test(const Ray& ray, double& t1, double& t2) const;

  bool has_intersection(const Ray& ray) const;

  bool intersect(const Ray& ray, Intersection* i) const;

  Vector3D center0;
  Vector3D center1;
  double time0;
  double time1;
  double r;   ///< radius
  double r2;  ///< radius squared
};

} // namespace SceneObjects
} // namespace Lumina

#endif // LUMINA_SCENE_SPHERE_H
