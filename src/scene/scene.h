#ifndef LUMINA_SCENE_SCENE_H
#define LUMINA_SCENE_SCENE_H

#include "bvh.h"
#include "light.h"
#include "primitive.h"

#include "pathtracer/bsdf.h"
#include "pathtracer/camera.h"
#include "pathtracer/medium.h"

#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace Lumina {

/**
 * Radiance arriving from infinitely far away along the negated direction.
 */
typedef std::function<Vector3D(const Vector3D&)> EnvironmentFunction;

/**
 * Everything a render needs: materials, media, geometry with its BVH,
 * lights and the camera. The scene owns its materials and media and hands
 * out stable pointers to them. After build() it is read only and may be
 * shared by any number of render threads.
 */
class Scene {
 public:
  Scene();
  ~Scene();

  const BSDF* add_material(const BSDF& bsdf);
  const Medium* add_medium(const Medium& medium);

  // Returns the index of the primitive.
  size_t add_primitive(const SceneObjects::Primitive& primitive);

  // Returns the index of the light.
  size_t add_light(const SceneObjects::SceneLight& light);

  /**
   * Register a rectangular emitter both as visible geometry and as a
   * sampled light. Returns the light index.
   */
  size_t add_area_light(const Vector3D& corner, const Vector3D& edge1,
                        const Vector3D& edge2, const Vector3D& color,
                        double intensity = 1.0);

  /**
   * Register a spherical emitter both as visible geometry and as a sampled
   * light. Returns the light index.
   */
  size_t add_sphere_light(const Vector3D& center, double radius,
                          const Vector3D& color, double intensity = 1.0);

  /**
   * Add a triangle list. indices holds three entries per triangle. normals
   * and uvs are either empty or have one entry per position.
   */
  void add_triangle_mesh(const std::vector<Vector3D>& positions,
                         const std::vector<Vector3D>& normals,
                         const std::vector<Vector2D>& uvs,
                         const std::vector<size_t>& indices,
                         const BSDF* material,
                         const Medium* interior = NULL);

  void set_environment(const EnvironmentFunction& environment);
  void set_camera(const Camera& camera);

  /**
   * Build the BVH and the light distribution. Throws ConfigurationError
   * when nothing in the scene emits light.
   */
  void build(const SceneObjects::BVHBuildParams& params =
                 SceneObjects::BVHBuildParams());

  bool is_built() const { return built; }

  /**
   * Nearest hit over the BVH and the unbounded planes.
   */
  bool intersect(const Ray& ray, Intersection* isect) const;

  bool has_intersection(const Ray& ray) const;

  /**
   * Fraction of light that survives along a shadow ray, starting inside
   * the given medium. Any surface with a material blocks the ray; medium
   * boundaries are crossed and their interiors attenuate.
   */
  Vector3D transmittance(const Ray& shadow_ray, const Medium* medium) const;

  bool has_environment() const { return static_cast<bool>(environment); }
  Vector3D environment_radiance(const Vector3D& dir) const;

  const Camera* get_camera() const { return camera.get(); }

  const std::vector<SceneObjects::Primitive>& get_primitives() const {
    return primitives;
  }
  const std::vector<SceneObjects::SceneLight>& get_lights() const {
    return lights;
  }
  const SceneObjects::LightDistribution& get_light_distribution() const {
    return light_distribution;
  }
  const SceneObjects::BVHAccel* get_bvh() const { return bvh.get(); }

  // Index of a material owned by this scene, -1 otherwise.
  int64_t material_id(const BSDF* bsdf) const;

 private:
  void check_mutable(const char* what) const;

  std::vector<std::unique_ptr<BSDF>> materials;
  std::unordered_map<const BSDF*, int64_t> material_ids;
  std::vector<std::unique_ptr<Medium>> media;

  std::vector<SceneObjects::Primitive> primitives;
  std::vector<const SceneObjects::Primitive*> planes;
  bool has_media_boundaries;

  std::unique_ptr<SceneObjects::BVHAccel> bvh;

  std::vector<SceneObjects::SceneLight> lights;
  SceneObjects::LightDistribution light_distribution;

  EnvironmentFunction environment;
  std::unique_ptr<Camera> camera;

  bool built;
};

} // namespace Lumina

#endif // LUMINA_SCENE_SCENE_H
