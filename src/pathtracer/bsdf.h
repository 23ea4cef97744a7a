#ifndef LUMINA_BSDF_H
#define LUMINA_BSDF_H

#include "util/math_util.h"
#include "util/random_util.h"

#include <functional>

namespace Lumina {

// Helper math functions. Assume all vectors are in unit hemisphere //

inline double clamp(double n, double lower, double upper) {
  return std::max(lower, std::min(n, upper));
}

inline double abs_cos_theta(const Vector3D w) { return std::fabs(w.z); }

inline double sin_theta2(const Vector3D w) {
  return std::max(0.0, 1.0 - w.z * w.z);
}

inline double tan_theta2(const Vector3D w) {
  return sin_theta2(w) / (w.z * w.z);
}

/**
 * Build the object to world matrix of a frame whose z axis is n. Columns are
 * the tangent, bitangent and normal.
 */
void make_coord_space(Matrix3x3& o2w, const Vector3D n);

/**
 * Mirror wo about the local normal (0, 0, 1).
 */
Vector3D reflect(const Vector3D wo);

/**
 * Refract wo through the local interface. Directions with wo.z > 0 are on
 * the outside, where the index of refraction is 1. Returns false on total
 * internal reflection.
 */
bool refract(const Vector3D wo, Vector3D* wi, double ior);

/**
 * Schlick's approximation of the Fresnel reflectance.
 */
double schlick_fresnel(double cos_theta, double r0);
Vector3D schlick_fresnel(double cos_theta, const Vector3D& f0);

/**
 * GGX normal distribution for microfacet normal h.
 */
double ggx_D(const Vector3D& h, double alpha);

/**
 * Smith masking term for one direction.
 */
double smith_G1(const Vector3D& v, double alpha);

/**
 * Density of reflecting wo into wi through a GGX sampled half vector.
 */
double ggx_reflection_pdf(const Vector3D& wo, const Vector3D& wi,
                          double alpha);

/**
 * Surface material. A closed set of shading models sharing one parameter
 * block; every query dispatches on the model type.
 *
 * All directions are expressed in the local shading frame, whose z axis is
 * the shading normal. For sample_f the returned value f satisfies
 * throughput *= f * |cos(wi)| / pdf, including for delta lobes.
 */
class BSDF {
 public:
  enum class Type { LAMBERTIAN, METAL, DIELECTRIC, EMISSIVE, PBR };

  typedef std::function<Vector3D(const Vector2D&)> Texture;

  static BSDF lambertian(const Vector3D& albedo);
  static BSDF metal(const Vector3D& albedo, double roughness);
  static BSDF dielectric(double ior,
                         const Vector3D& tint = Vector3D(1, 1, 1));
  static BSDF emissive(const Vector3D& color, double intensity = 1.0);
  static BSDF pbr(const Vector3D& albedo, double metallic, double roughness);

  // Replaces the constant albedo by a UV lookup.
  void set_texture(const Texture& texture) { this->texture = texture; }

  Type get_type() const { return type; }

  /**
   * Evaluate the BSDF for the given pair of directions.
   */
  Vector3D f(const Vector3D wo, const Vector3D wi,
             const Vector2D& uv = Vector2D()) const;

  /**
   * Sample an incoming direction for wo. A zero pdf marks a degenerate
   * sample that contributes nothing.
   */
  Vector3D sample_f(const Vector3D wo, Vector3D* wi, double* pdf,
                    RandomStream& rng,
                    const Vector2D& uv = Vector2D()) const;

  /**
   * Density with which sample_f produces wi given wo. Zero for delta lobes.
   */
  double pdf(const Vector3D wo, const Vector3D wi) const;

  Vector3D get_emission() const;

  Vector3D albedo_at(const Vector2D& uv) const;

  bool is_delta() const;
  bool is_emissive() const { return type == Type::EMISSIVE; }
  bool is_transmissive() const { return type == Type::DIELECTRIC; }

  double get_roughness() const { return roughness; }
  double get_ior() const { return ior; }
  double get_metallic() const { return metallic; }

 private:
  BSDF(Type type);

  // Probability of picking the specular lobe of the PBR model.
  double specular_probability() const;
  double alpha() const;

  Vector3D f_microfacet(const Vector3D& wo, const Vector3D& wi,
                        const Vector3D& f0) const;

  Type type;
  Vector3D albedo;      ///< reflectance, refraction tint or emitted color
  double roughness;
  double metallic;
  double ior;
  double intensity;     ///< emission scale
  Texture texture;

}; // class BSDF

} // namespace Lumina

#endif // LUMINA_BSDF_H
