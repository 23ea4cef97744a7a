#include "scene.h"

#include "util/error.h"

#include <cstdio>
#include <sstream>

using namespace Lumina::SceneObjects;

namespace Lumina {

// Upper bound on medium boundaries a shadow ray may cross.
static const int kMaxShadowCrossings = 64;

Scene::Scene() : has_media_boundaries(false), built(false) {}

Scene::~Scene() {}

void Scene::check_mutable(const char* what) const {
  if (built) {
    std::ostringstream msg;
    msg << "cannot " << what << " after the scene is built";
    throw ConfigurationError(msg.str());
  }
}

const BSDF* Scene::add_material(const BSDF& bsdf) {
  check_mutable("add a material");
  materials.push_back(std::make_unique<BSDF>(bsdf));
  const BSDF* p = materials.back().get();
  material_ids[p] = static_cast<int64_t>(materials.size() - 1);
  return p;
}

const Medium* Scene::add_medium(const Medium& medium) {
  check_mutable("add a medium");
  media.push_back(std::make_unique<Medium>(medium));
  return media.back().get();
}

size_t Scene::add_primitive(const Primitive& primitive) {
  check_mutable("add a primitive");
  primitives.push_back(primitive);
  primitives.back().set_id(primitives.size() - 1);
  return primitives.size() - 1;
}

size_t Scene::add_light(const SceneLight& light) {
  check_mutable("add a light");
  lights.push_back(light);
  return lights.size() - 1;
}

size_t Scene::add_area_light(const Vector3D& corner, const Vector3D& edge1,
                             const Vector3D& edge2, const Vector3D& color,
                             double intensity) {
  const BSDF* emitter = add_material(BSDF::emissive(color, intensity));
  size_t index =
      add_light(SceneLight::area(corner, edge1, edge2, color, intensity));
  Primitive quad(Quad(corner, edge1, edge2), emitter);
  quad.set_light_index(static_cast<int>(index));
  add_primitive(quad);
  return index;
}

size_t Scene::add_sphere_light(const Vector3D& center, double radius,
                               const Vector3D& color, double intensity) {
  const BSDF* emitter = add_material(BSDF::emissive(color, intensity));
  size_t index =
      add_light(SceneLight::sphere(center, radius, color, intensity));
  Primitive sphere(Sphere(center, std::fabs(radius)), emitter);
  sphere.set_light_index(static_cast<int>(index));
  add_primitive(sphere);
  return index;
}

void Scene::add_triangle_mesh(const std::vector<Vector3D>& positions,
                              const std::vector<Vector3D>& normals,
                              const std::vector<Vector2D>& uvs,
                              const std::vector<size_t>& indices,
                              const BSDF* material, const Medium* interior) {
  check_mutable("add a mesh");
  if (indices.size() % 3 != 0) {
    throw ConfigurationError("mesh index count must be a multiple of 3");
  }
  bool use_normals = !normals.empty();
  bool use_uvs = !uvs.empty();
  if ((use_normals && normals.size() != positions.size()) ||
      (use_uvs && uvs.size() != positions.size())) {
    throw ConfigurationError("mesh normals and uvs must match the positions");
  }

  for (size_t i = 0; i < indices.size(); i += 3) {
    size_t a = indices[i], b = indices[i + 1], c = indices[i + 2];
    if (a >= positions.size() || b >= positions.size() ||
        c >= positions.size()) {
      throw ConfigurationError("mesh index out of range");
    }
    Triangle tri = use_normals
        ? Triangle(positions[a], positions[b], positions[c], normals[a],
                   normals[b], normals[c])
        : Triangle(positions[a], positions[b], positions[c]);
    if (use_uvs) tri.set_uvs(uvs[a], uvs[b], uvs[c]);
    add_primitive(Primitive(tri, material, interior));
  }
}

void Scene::set_environment(const EnvironmentFunction& environment) {
  check_mutable("set the environment");
  this->environment = environment;
}

void Scene::set_camera(const Camera& camera) {
  this->camera = std::make_unique<Camera>(camera);
}

void Scene::build(const BVHBuildParams& params) {
  check_mutable("build");

  bool has_emitter = false;
  for (const Primitive& p : primitives) {
    if (p.get_bsdf() && p.get_bsdf()->is_emissive()) has_emitter = true;
  }
  if (lights.empty() && !has_emitter && !environment) {
    throw ConfigurationError("scene has no lights, no emissive primitives "
                             "and no environment");
  }

  std::vector<const Primitive*> bounded;
  planes.clear();
  has_media_boundaries = false;
  for (const Primitive& p : primitives) {
    if (p.is_bounded()) {
      bounded.push_back(&p);
    } else {
      planes.push_back(&p);
    }
    if (!p.get_bsdf()) has_media_boundaries = true;
  }

  if (!bounded.empty()) {
    bvh = std::make_unique<BVHAccel>(bounded, params);
  }
  light_distribution = LightDistribution(lights);

  if (params.verbose) {
    printf("[Scene] %zu primitives (%zu unbounded), %zu lights, %zu "
           "materials, %zu media\n",
           primitives.size(), planes.size(), lights.size(), materials.size(),
           media.size());
  }
  built = true;
}

bool Scene::intersect(const Ray& ray, Intersection* isect) const {
  bool hit = false;
  if (bvh && bvh->intersect(ray, isect)) hit = true;
  for (const Primitive* p : planes) {
    if (p->intersect(ray, isect)) hit = true;
  }
  return hit;
}

bool Scene::has_intersection(const Ray& ray) const {
  if (bvh && bvh->has_intersection(ray)) return true;
  for (const Primitive* p : planes) {
    if (p->has_intersection(ray)) return true;
  }
  return false;
}

Vector3D Scene::transmittance(const Ray& shadow_ray,
                              const Medium* medium) const {
  if (!has_media_boundaries && !medium) {
    return has_intersection(shadow_ray) ? Vector3D() : Vector3D(1, 1, 1);
  }

  Vector3D tr(1, 1, 1);
  Vector3D o = shadow_ray.o;
  double remaining = shadow_ray.max_t;
  double min_t = shadow_ray.min_t;

  for (int i = 0; i < kMaxShadowCrossings; ++i) {
    Ray segment(o, shadow_ray.d, remaining, shadow_ray.time);
    segment.min_t = min_t;

    Intersection isect;
    bool hit = intersect(segment, &isect);
    double length = hit ? isect.t : remaining;
    if (medium) tr = tr * medium->transmittance(length);
    if (!hit) return tr;
    if (isect.bsdf) return Vector3D();

    medium = isect.front_face ? isect.primitive->get_interior() : NULL;
    o = isect.p;
    remaining -= isect.t;
    min_t = EPS_F;
    if (is_black(tr)) return tr;
  }
  return Vector3D();
}

Vector3D Scene::environment_radiance(const Vector3D& dir) const {
  if (!environment) return Vector3D();
  return environment(dir);
}

int64_t Scene::material_id(const BSDF* bsdf) const {
  auto it = material_ids.find(bsdf);
  if (it == material_ids.end()) return -1;
  return it->second;
}

} // namespace Lumina
