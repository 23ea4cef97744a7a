#ifndef LUMINA_CAMERA_H
#define LUMINA_CAMERA_H

#include "ray.h"
#include "util/math_util.h"
#include "util/random_util.h"

namespace Lumina {

/**
 * Thin lens perspective camera. With a zero aperture it is a pinhole; the
 * shutter interval [time0, time1] stamps each ray with a random time for
 * motion blur.
 */
class Camera {
 public:

  /**
   * Throws ConfigurationError when vfov_deg is outside (0, 180), look_from
   * equals look_at, up is parallel to the view direction, or the aperture is
   * negative. A focus_dist of 0 focuses on look_at.
   */
  Camera(const Vector3D& look_from, const Vector3D& look_at,
         const Vector3D& up, double vfov_deg, double aspect = 1.0,
         double aperture = 0.0, double focus_dist = 0.0, double time0 = 0.0,
         double time1 = 0.0);

  // Matches the aspect ratio to the film.
  void set_screen_size(size_t screen_w, size_t screen_h);

  /**
   * Ray through the normalized film position (x, y), with (0, 0) the top
   * left corner and (1, 1) the bottom right one.
   */
  Ray generate_ray(double x, double y, RandomStream& rng) const;

  Vector3D position() const { return look_from; }
  Vector3D view_direction() const { return -w; }
  double get_vfov() const { return vfov_deg; }
  double get_aspect() const { return aspect; }

 private:
  Vector3D look_from;
  double vfov_deg;
  double aspect;
  double lens_radius;
  double focus_dist;
  double time0, time1;

  Vector3D u, v, w;  ///< camera frame, w points backwards
  double half_height;
};

} // namespace Lumina

#endif // LUMINA_CAMERA_H
