#ifndef LUMINA_SCENE_TRIANGLE_H
#define LUMINA_SCENE_TRIANGLE_H

#include "bbox.h"
#include "pathtracer/intersection.h"
#include "pathtracer/ray.h"

namespace Lumina {
namespace SceneObjects {

/**
 * A single triangle. Vertex normals and uvs are optional; without them the
 * face normal and barycentric uvs are used.
 */
struct Triangle {

  Triangle(const Vector3D& p1, const Vector3D& p2, const Vector3D& p3);

  Triangle(const Vector3D& p1, const Vector3D& p2, const Vector3D& p3,
           const Vector3D& n1, const Vector3D& n2, const Vector3D& n3);

  void set_uvs(const Vector2D& a, const Vector2D& b, const Vector2D& c);

  BBox get_bbox() const;

  bool has_intersection(const Ray& ray) const;

  bool intersect(const Ray& ray, Intersection* isect) const;

  Vector3D p1, p2, p3;  ///< vertices
  Vector3D n1, n2, n3;  ///< vertex normals
  Vector2D uv1, uv2, uv3;
  Vector3D face_n;      ///< unit geometric normal
  bool has_normals;
  bool has_uvs;
};

} // namespace SceneObjects
} // namespace Lumina

#endif // LUMINA_SCENE_TRIANGLE_H
