#ifndef LUMINA_SCENE_LIGHT_H
#define LUMINA_SCENE_LIGHT_H

#include "util/math_util.h"
#include "util/random_util.h"

#include <vector>

namespace Lumina {
namespace SceneObjects {

/**
 * A light source that can be sampled for next event estimation. Point and
 * directional lights are deltas; area and sphere lights are usually also
 * registered as emissive geometry so that BSDF sampled rays can hit them.
 */
class SceneLight {
 public:
  enum class Type { POINT, DIRECTIONAL, AREA, SPHERE };

  static SceneLight point(const Vector3D& position, const Vector3D& color,
                          double intensity = 1.0);

  // direction is the way the light travels
  static SceneLight directional(const Vector3D& direction,
                                const Vector3D& color,
                                double intensity = 1.0);

  // Rectangle spanned by edge1 and edge2, emitting towards
  // cross(edge1, edge2).
  static SceneLight area(const Vector3D& corner, const Vector3D& edge1,
                         const Vector3D& edge2, const Vector3D& color,
                         double intensity = 1.0);

  static SceneLight sphere(const Vector3D& center, double radius,
                           const Vector3D& color, double intensity = 1.0);

  /**
   * Sample incident radiance at p. Writes the unit direction towards the
   * light, the distance to the sampled point (INF_D for directional
   * lights) and the solid angle pdf, which is 1 for delta lights. A zero
   * pdf or zero radiance means the sample carries no light.
   */
  Vector3D sample_L(const Vector3D& p, RandomStream& rng, Vector3D* wi,
                    double* distance_to_light, double* pdf) const;

  /**
   * Solid angle density with which sample_L picks direction wi from p.
   * Zero for delta lights.
   */
  double pdf(const Vector3D& p, const Vector3D& wi) const;

  // Scalar power estimate used to build the selection distribution.
  double power() const;

  bool is_delta_light() const {
    return type == Type::POINT || type == Type::DIRECTIONAL;
  }

  Type get_type() const { return type; }

  Vector3D radiance() const { return color * intensity; }

 private:
  SceneLight(Type type, const Vector3D& color, double intensity);

  Type type;
  Vector3D color;
  double intensity;

  Vector3D position;   ///< point position, area corner or sphere center
  Vector3D direction;  ///< travel direction (directional), unit normal (area)
  Vector3D edge1;
  Vector3D edge2;
  double area_;
  double radius;
};

/**
 * Discrete distribution over the scene lights proportional to their power.
 * Every light keeps a strictly positive probability.
 */
class LightDistribution {
 public:
  LightDistribution() {}
  explicit LightDistribution(const std::vector<SceneLight>& lights);

  /**
   * Pick a light index for u in [0, 1) and write its probability.
   */
  size_t sample(double u, double* pmf) const;

  double pmf(size_t index) const;

  size_t size() const { return pmfs.size(); }
  bool empty() const { return pmfs.empty(); }

 private:
  std::vector<double> cdf;
  std::vector<double> pmfs;
};

} // namespace SceneObjects
} // namespace Lumina

#endif // LUMINA_SCENE_LIGHT_H
