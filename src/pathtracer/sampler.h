#ifndef LUMINA_SAMPLER_H
#define LUMINA_SAMPLER_H

#include "util/math_util.h"
#include "util/random_util.h"

namespace Lumina {

// Jittered position inside the unit square.
Vector2D sample_unit_square(RandomStream& rng);

// Uniform point on the unit disk (concentric mapping).
Vector2D sample_concentric_disk(RandomStream& rng);

// Uniform direction on the +z hemisphere, pdf = 1 / 2pi.
Vector3D sample_uniform_hemisphere(RandomStream& rng);

// Cosine weighted direction on the +z hemisphere, pdf = cos / pi.
Vector3D sample_cosine_hemisphere(RandomStream& rng, double* pdf);

// Uniform direction on the unit sphere, pdf = 1 / 4pi.
Vector3D sample_uniform_sphere(RandomStream& rng);

// Uniform direction inside the cone of half angle acos(cos_theta_max)
// around +z, pdf = 1 / (2pi (1 - cos_theta_max)).
Vector3D sample_uniform_cone(RandomStream& rng, double cos_theta_max);

// GGX distributed microfacet normal around +z for roughness alpha.
Vector3D sample_ggx_half_vector(RandomStream& rng, double alpha);

} // namespace Lumina

#endif // LUMINA_SAMPLER_H
