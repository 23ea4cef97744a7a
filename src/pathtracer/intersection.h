#ifndef LUMINA_INTERSECTION_H
#define LUMINA_INTERSECTION_H

#include "util/math_util.h"

namespace Lumina {

class BSDF;

namespace SceneObjects {
class Primitive;
}

// Result of a nearest hit query. Both normals point out of the surface; the
// front_face flag tells which side the ray arrived from.
struct Intersection {

  Intersection()
      : t(INF_D), primitive(NULL), bsdf(NULL), front_face(true) {}

  double t;            ///< ray parameter of the hit
  Vector3D p;          ///< hit point
  Vector3D n;          ///< geometric normal
  Vector3D shading_n;  ///< interpolated normal used for shading
  Vector2D uv;

  const SceneObjects::Primitive* primitive;
  const BSDF* bsdf;    ///< null for pure medium boundaries

  bool front_face;

  // Fills n, shading_n and front_face from an outward geometric normal.
  void set_face_normal(const Vector3D& ray_d, const Vector3D& outward) {
    n = outward;
    shading_n = outward;
    front_face = dot(ray_d, outward) < 0;
  }
};

} // namespace Lumina

#endif // LUMINA_INTERSECTION_H
