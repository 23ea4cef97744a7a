#ifndef LUMINA_MEDIUM_H
#define LUMINA_MEDIUM_H

#include "util/math_util.h"
#include "util/random_util.h"

namespace Lumina {

/**
 * Homogeneous participating medium. Extinction is
 * sigma_t = density * (sigma_a + sigma_s), per color channel.
 */
class Medium {
 public:
  enum class PhaseType { ISOTROPIC, HENYEY_GREENSTEIN };

  /**
   * Throws ConfigurationError for a negative density or coefficient, or an
   * asymmetry factor outside (-1, 1).
   */
  Medium(double density, const Vector3D& sigma_a, const Vector3D& sigma_s,
         PhaseType phase = PhaseType::ISOTROPIC, double g = 0.0);

  // Uniform, purely scattering haze.
  static Medium fog(double density, const Vector3D& color);

  // Forward scattering smoke with some absorption.
  static Medium smoke(double density, const Vector3D& albedo, double g = 0.6);

  // Dense, mostly scattering interior for an approximate subsurface look.
  static Medium subsurface(const Vector3D& albedo, double mean_free_path,
                           double g = 0.0);

  Vector3D sigma_t() const { return sigma_a_ + sigma_s_; }
  Vector3D sigma_s() const { return sigma_s_; }
  double get_density() const { return density; }
  double get_g() const { return g; }
  PhaseType get_phase_type() const { return phase_type; }

  /**
   * Beer-Lambert transmittance over the given distance.
   */
  Vector3D transmittance(double distance) const;

  /**
   * Sample a free flight distance along a segment of length t_max. On a
   * scattering event *scattered is set and *t holds the distance; otherwise
   * *t is t_max. Returns the throughput weight of the sample.
   */
  Vector3D sample_distance(double t_max, RandomStream& rng, double* t,
                           bool* scattered) const;

  /**
   * Phase function value for light travelling along d_in and leaving along
   * d_out. Both are unit vectors in the direction of propagation.
   */
  double phase(const Vector3D& d_in, const Vector3D& d_out) const;

  /**
   * Sample an outgoing propagation direction. Returns the pdf, which equals
   * the phase value.
   */
  double sample_phase(const Vector3D& d_in, Vector3D* d_out,
                      RandomStream& rng) const;

 private:
  double density;
  Vector3D sigma_a_;  ///< density scaled absorption
  Vector3D sigma_s_;  ///< density scaled scattering
  PhaseType phase_type;
  double g;
};

} // namespace Lumina

#endif // LUMINA_MEDIUM_H
