#ifndef LUMINA_SCENE_PRIMITIVE_H
#define LUMINA_SCENE_PRIMITIVE_H

#include "bbox.h"
#include "box.h"
#include "cone.h"
#include "cylinder.h"
#include "plane.h"
#include "quad.h"
#include "sphere.h"
#include "triangle.h"

#include "pathtracer/intersection.h"
#include "pathtracer/ray.h"

namespace Lumina {

class BSDF;
class Medium;

namespace SceneObjects {

/**
 * A shape together with its material and optional interior medium. The
 * shape is stored inline as a tagged union; queries switch on the tag.
 *
 * A primitive with a null BSDF is a pure medium boundary: rays cross it
 * without scattering.
 */
class Primitive {
 public:
  enum class Type { SPHERE, PLANE, TRIANGLE, BOX, CYLINDER, CONE, QUAD };

  Primitive(const Sphere& sphere, const BSDF* bsdf,
            const Medium* interior = NULL);
  Primitive(const Plane& plane, const BSDF* bsdf,
            const Medium* interior = NULL);
  Primitive(const Triangle& triangle, const BSDF* bsdf,
            const Medium* interior = NULL);
  Primitive(const Box& box, const BSDF* bsdf, const Medium* interior = NULL);
  Primitive(const Cylinder& cylinder, const BSDF* bsdf,
            const Medium* interior = NULL);
  Primitive(const Cone& cone, const BSDF* bsdf,
            const Medium* interior = NULL);
  Primitive(const Quad& quad, const BSDF* bsdf,
            const Medium* interior = NULL);

  Primitive(const Primitive& other);
  Primitive& operator=(const Primitive& other);

  Type get_type() const { return type; }

  // Planes are unbounded and never enter the BVH.
  bool is_bounded() const { return type != Type::PLANE; }

  /**
   * World space bounds. Only meaningful for bounded primitives.
   */
  BBox get_bbox() const { return bbox; }

  /**
   * Nearest hit test. On a hit, shrinks ray.max_t and fills in the record,
   * including the primitive and material pointers.
   */
  bool intersect(const Ray& ray, Intersection* isect) const;

  bool has_intersection(const Ray& ray) const;

  const BSDF* get_bsdf() const { return bsdf; }
  const Medium* get_interior() const { return interior; }

  // Index into the scene light list, -1 when the primitive is not a light.
  int get_light_index() const { return light_index; }
  void set_light_index(int index) { light_index = index; }

  // Position in the scene primitive list, reported in the id buffer.
  size_t get_id() const { return id; }
  void set_id(size_t id) { this->id = id; }

  // Only valid for the matching type.
  const Sphere& as_sphere() const { return shape.sphere; }
  const Quad& as_quad() const { return shape.quad; }

 private:
  void copy_shape(const Primitive& other);
  void compute_bbox();

  union Shape {
    Shape() {}
    Sphere sphere;
    Plane plane;
    Triangle triangle;
    Box box;
    Cylinder cylinder;
    Cone cone;
    Quad quad;
  };

  Type type;
  Shape shape;
  const BSDF* bsdf;
  const Medium* interior;
  int light_index;
  size_t id;
  BBox bbox;
};

} // namespace SceneObjects
} // namespace Lumina

#endif // LUMINA_SCENE_PRIMITIVE_H
