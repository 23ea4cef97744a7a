#ifndef LUMINA_BBOX_H
#define LUMINA_BBOX_H

#include "pathtracer/ray.h"
#include "util/math_util.h"

#include <algorithm>
#include <iostream>

namespace Lumina {

/**
 * Axis-aligned bounding box.
 * An empty box has min at +inf and max at -inf, so expanding it by anything
 * yields that thing's bounds.
 */
struct BBox {

  Vector3D max;     ///< max corner of the bounding box
  Vector3D min;     ///< min corner of the bounding box
  Vector3D extent;  ///< extent of the bounding box (min -> max)

  BBox() {
    max = Vector3D(-INF_D, -INF_D, -INF_D);
    min = Vector3D(INF_D, INF_D, INF_D);
    extent = max - min;
  }

  BBox(const Vector3D p) : min(p), max(p) { extent = max - min; }

  BBox(const Vector3D min, const Vector3D max) : min(min), max(max) {
    extent = max - min;
  }

  void expand(const BBox& bbox) {
    min.x = std::min(min.x, bbox.min.x);
    min.y = std::min(min.y, bbox.min.y);
    min.z = std::min(min.z, bbox.min.z);
    max.x = std::max(max.x, bbox.max.x);
    max.y = std::max(max.y, bbox.max.y);
    max.z = std::max(max.z, bbox.max.z);
    extent = max - min;
  }

  void expand(const Vector3D& p) {
    min.x = std::min(min.x, p.x);
    min.y = std::min(min.y, p.y);
    min.z = std::min(min.z, p.z);
    max.x = std::max(max.x, p.x);
    max.y = std::max(max.y, p.y);
    max.z = std::max(max.z, p.z);
    extent = max - min;
  }

  Vector3D centroid() const { return (min + max) / 2; }

  double surface_area() const {
    if (empty()) return 0.0;
    return 2 * (extent.x * extent.z + extent.x * extent.y +
                extent.y * extent.z);
  }

  bool empty() const {
    return min.x > max.x || min.y > max.y || min.z > max.z;
  }

  // Index of the axis with the largest extent.
  int max_extent_axis() const {
    if (extent.x >= extent.y && extent.x >= extent.z) return 0;
    if (extent.y >= extent.z) return 1;
    return 2;
  }

  bool contains(const BBox& other, double eps = 0.0) const;

  bool equals(const BBox& other, double eps = 0.0) const;

  /**
   * Ray - bbox intersection using the slab method. On entry [t0, t1] is the
   * accepted parametric range; on a hit it is narrowed to the overlap of
   * that range with the box.
   */
  bool intersect(const Ray& r, double& t0, double& t1) const;
};

std::ostream& operator<<(std::ostream& os, const BBox& b);

} // namespace Lumina

#endif // LUMINA_BBOX_H
