#ifndef LUMINA_SCENE_BOX_H
#define LUMINA_SCENE_BOX_H

#include "bbox.h"
#include "pathtracer/intersection.h"
#include "pathtracer/ray.h"

namespace Lumina {
namespace SceneObjects {

// Solid axis-aligned box.
struct Box {

  Box(const Vector3D& a, const Vector3D& b);

  BBox get_bbox() const { return BBox(min, max); }

  bool has_intersection(const Ray& ray) const;

  bool intersect(const Ray& ray, Intersection* i) const;

  Vector3D min;
  Vector3D max;
};

} // namespace SceneObjects
} // namespace Lumina

#endif // LUMINA_SCENE_BOX_H
