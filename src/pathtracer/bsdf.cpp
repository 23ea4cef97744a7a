#include "bsdf.h"

#include "sampler.h"

#include <algorithm>
#include <cmath>

namespace Lumina {

// Roughness below this is treated as a perfect mirror.
static const double kDeltaRoughness = 1e-3;

void make_coord_space(Matrix3x3& o2w, const Vector3D n) {

  Vector3D z = Vector3D(n.x, n.y, n.z);
  Vector3D h = z;
  if (std::fabs(h.x) <= std::fabs(h.y) && std::fabs(h.x) <= std::fabs(h.z))
    h.x = 1.0;
  else if (std::fabs(h.y) <= std::fabs(h.x) && std::fabs(h.y) <= std::fabs(h.z))
    h.y = 1.0;
  else
    h.z = 1.0;

  z.normalize();
  Vector3D y = cross(h, z);
  y.normalize();
  Vector3D x = cross(z, y);
  x.normalize();

  o2w[0] = x;
  o2w[1] = y;
  o2w[2] = z;
}

Vector3D reflect(const Vector3D wo) { return Vector3D(-wo.x, -wo.y, wo.z); }

bool refract(const Vector3D wo, Vector3D* wi, double ior) {
  bool entering = wo.z > 0;
  double eta = entering ? 1.0 / ior : ior;

  double cos_i = std::fabs(wo.z);
  double sin2_t = eta * eta * std::max(0.0, 1.0 - cos_i * cos_i);
  if (sin2_t >= 1.0) return false;

  double cos_t = std::sqrt(1.0 - sin2_t);
  *wi = Vector3D(-eta * wo.x, -eta * wo.y, entering ? -cos_t : cos_t);
  return true;
}

double schlick_fresnel(double cos_theta, double r0) {
  double m = clamp(1.0 - cos_theta, 0.0, 1.0);
  double m2 = m * m;
  return r0 + (1.0 - r0) * m2 * m2 * m;
}

Vector3D schlick_fresnel(double cos_theta, const Vector3D& f0) {
  double m = clamp(1.0 - cos_theta, 0.0, 1.0);
  double m5 = m * m * m * m * m;
  return f0 + (Vector3D(1, 1, 1) - f0) * m5;
}

double ggx_D(const Vector3D& h, double alpha) {
  if (h.z <= 0) return 0;
  double a2 = alpha * alpha;
  double c2 = h.z * h.z;
  double denom = (a2 - 1.0) * c2 + 1.0;
  return a2 / (PI * denom * denom);
}

double smith_G1(const Vector3D& v, double alpha) {
  if (v.z <= 0) return 0;
  double t2 = tan_theta2(v);
  return 2.0 / (1.0 + std::sqrt(1.0 + alpha * alpha * t2));
}

double ggx_reflection_pdf(const Vector3D& wo, const Vector3D& wi,
                          double alpha) {
  if (wo.z <= 0 || wi.z <= 0) return 0;
  Vector3D h = wo + wi;
  if (h.norm2() <= 0) return 0;
  h.normalize();
  double wo_dot_h = dot(wo, h);
  if (wo_dot_h <= 0) return 0;
  return ggx_D(h, alpha) * h.z / (4.0 * wo_dot_h);
}

BSDF::BSDF(Type type)
    : type(type), albedo(1, 1, 1), roughness(0), metallic(0), ior(1),
      intensity(0) {}

BSDF BSDF::lambertian(const Vector3D& albedo) {
  BSDF bsdf(Type::LAMBERTIAN);
  bsdf.albedo = albedo;
  return bsdf;
}

BSDF BSDF::metal(const Vector3D& albedo, double roughness) {
  BSDF bsdf(Type::METAL);
  bsdf.albedo = albedo;
  bsdf.roughness = clamp(roughness, 0.0, 1.0);
  return bsdf;
}

BSDF BSDF::dielectric(double ior, const Vector3D& tint) {
  BSDF bsdf(Type::DIELECTRIC);
  bsdf.albedo = tint;
  bsdf.ior = ior;
  return bsdf;
}

BSDF BSDF::emissive(const Vector3D& color, double intensity) {
  BSDF bsdf(Type::EMISSIVE);
  bsdf.albedo = color;
  bsdf.intensity = intensity;
  return bsdf;
}

BSDF BSDF::pbr(const Vector3D& albedo, double metallic, double roughness) {
  BSDF bsdf(Type::PBR);
  bsdf.albedo = albedo;
  bsdf.metallic = clamp(metallic, 0.0, 1.0);
  bsdf.roughness = clamp(roughness, 0.0, 1.0);
  return bsdf;
}

Vector3D BSDF::albedo_at(const Vector2D& uv) const {
  if (texture) return texture(uv);
  return albedo;
}

Vector3D BSDF::get_emission() const {
  if (type == Type::EMISSIVE) return albedo * intensity;
  return Vector3D();
}

bool BSDF::is_delta() const {
  switch (type) {
    case Type::DIELECTRIC:
      return true;
    case Type::METAL:
      return roughness < kDeltaRoughness;
    case Type::LAMBERTIAN:
    case Type::EMISSIVE:
    case Type::PBR:
      return false;
  }
  return false;
}

double BSDF::alpha() const {
  return std::max(roughness * roughness, 1e-3);
}

double BSDF::specular_probability() const {
  return clamp(0.5 * (1.0 + metallic), 0.5, 1.0);
}

Vector3D BSDF::f_microfacet(const Vector3D& wo, const Vector3D& wi,
                            const Vector3D& f0) const {
  if (wo.z <= 0 || wi.z <= 0) return Vector3D();
  Vector3D h = wo + wi;
  if (h.norm2() <= 0) return Vector3D();
  h.normalize();

  double a = alpha();
  double D = ggx_D(h, a);
  double G = smith_G1(wo, a) * smith_G1(wi, a);
  Vector3D F = schlick_fresnel(dot(wi, h), f0);
  return F * (D * G / (4.0 * wo.z * wi.z));
}

Vector3D BSDF::f(const Vector3D wo, const Vector3D wi,
                 const Vector2D& uv) const {
  switch (type) {
    case Type::LAMBERTIAN:
      if (wo.z <= 0 || wi.z <= 0) return Vector3D();
      return albedo_at(uv) * (1.0 / PI);

    case Type::METAL:
      if (is_delta()) return Vector3D();
      return f_microfacet(wo, wi, albedo_at(uv));

    case Type::PBR: {
      if (wo.z <= 0 || wi.z <= 0) return Vector3D();
      Vector3D base = albedo_at(uv);
      Vector3D f0 = lerp(Vector3D(0.04, 0.04, 0.04), base, metallic);
      Vector3D h = (wo + wi).unit();
      Vector3D F = schlick_fresnel(dot(wi, h), f0);
      Vector3D diffuse = (Vector3D(1, 1, 1) - F) * base *
                         ((1.0 - metallic) / PI);
      return diffuse + f_microfacet(wo, wi, f0);
    }

    case Type::DIELECTRIC:
    case Type::EMISSIVE:
      return Vector3D();
  }
  return Vector3D();
}

Vector3D BSDF::sample_f(const Vector3D wo, Vector3D* wi, double* pdf,
                        RandomStream& rng, const Vector2D& uv) const {
  *pdf = 0;

  switch (type) {
    case Type::LAMBERTIAN:
      *wi = sample_cosine_hemisphere(rng, pdf);
      return f(wo, *wi, uv);

    case Type::METAL: {
      if (is_delta()) {
        *wi = reflect(wo);
        double c = abs_cos_theta(*wi);
        if (c <= 0) return Vector3D();
        *pdf = 1.0;
        return schlick_fresnel(c, albedo_at(uv)) * (1.0 / c);
      }
      if (wo.z <= 0) return Vector3D();
      Vector3D h = sample_ggx_half_vector(rng, alpha());
      *wi = -wo + 2.0 * dot(wo, h) * h;
      if (wi->z <= 0) return Vector3D();
      *pdf = ggx_reflection_pdf(wo, *wi, alpha());
      return f_microfacet(wo, *wi, albedo_at(uv));
    }

    case Type::DIELECTRIC: {
      double cos_o = abs_cos_theta(wo);
      if (cos_o <= 0) return Vector3D();

      Vector3D refracted;
      if (!refract(wo, &refracted, ior)) {
        // total internal reflection
        *wi = reflect(wo);
        *pdf = 1.0;
        return Vector3D(1, 1, 1) * (1.0 / cos_o);
      }

      double r0 = (1.0 - ior) / (1.0 + ior);
      r0 = r0 * r0;
      // Schlick needs the cosine on the optically thinner side.
      double cos_f = wo.z > 0 ? cos_o : abs_cos_theta(refracted);
      double R = schlick_fresnel(cos_f, r0);

      if (rng.coin_flip(R)) {
        *wi = reflect(wo);
        *pdf = R;
        return Vector3D(1, 1, 1) * (R / cos_o);
      }
      *wi = refracted;
      *pdf = 1.0 - R;
      double cos_t = abs_cos_theta(refracted);
      if (cos_t <= 0) {
        *pdf = 0;
        return Vector3D();
      }
      return albedo * ((1.0 - R) / cos_t);
    }

    case Type::PBR: {
      if (wo.z <= 0) return Vector3D();
      double cos_pdf;
      if (rng.coin_flip(specular_probability())) {
        Vector3D h = sample_ggx_half_vector(rng, alpha());
        *wi = -wo + 2.0 * dot(wo, h) * h;
      } else {
        *wi = sample_cosine_hemisphere(rng, &cos_pdf);
      }
      if (wi->z <= 0) return Vector3D();
      *pdf = BSDF::pdf(wo, *wi);
      return f(wo, *wi, uv);
    }

    case Type::EMISSIVE:
      return Vector3D();
  }
  return Vector3D();
}

double BSDF::pdf(const Vector3D wo, const Vector3D wi) const {
  switch (type) {
    case Type::LAMBERTIAN:
      return wi.z > 0 ? wi.z / PI : 0.0;

    case Type::METAL:
      if (is_delta()) return 0;
      return ggx_reflection_pdf(wo, wi, alpha());

    case Type::PBR: {
      if (wo.z <= 0 || wi.z <= 0) return 0;
      double p = specular_probability();
      return p * ggx_reflection_pdf(wo, wi, alpha()) +
             (1.0 - p) * wi.z / PI;
    }

    case Type::DIELECTRIC:
    case Type::EMISSIVE:
      return 0;
  }
  return 0;
}

} // namespace Lumina
