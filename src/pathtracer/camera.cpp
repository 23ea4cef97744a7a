#include "camera.h"

#include "sampler.h"
#include "util/error.h"

#include <cmath>
#include <sstream>

namespace Lumina {

Camera::Camera(const Vector3D& look_from, const Vector3D& look_at,
               const Vector3D& up, double vfov_deg, double aspect,
               double aperture, double focus_dist, double time0,
               double time1)
    : look_from(look_from), vfov_deg(vfov_deg), aspect(aspect),
      lens_radius(aperture / 2), time0(time0), time1(time1) {

  if (!(vfov_deg > 0 && vfov_deg < 180)) {
    std::ostringstream msg;
    msg << "camera field of view must lie in (0, 180) degrees, got "
        << vfov_deg;
    throw ConfigurationError(msg.str());
  }
  if (!(aperture >= 0)) {
    throw ConfigurationError("camera aperture must be >= 0");
  }
  if (!(aspect > 0)) {
    throw ConfigurationError("camera aspect ratio must be > 0");
  }

  Vector3D back = look_from - look_at;
  double dist = back.norm();
  if (dist <= 0) {
    throw ConfigurationError("camera look_from and look_at coincide");
  }
  w = back / dist;

  Vector3D side = cross(up, w);
  if (side.norm() <= 1e-9 * up.norm() || up.norm2() <= 0) {
    throw ConfigurationError("camera up vector is parallel to the view "
                             "direction");
  }
  u = side.unit();
  v = cross(w, u);

  this->focus_dist = focus_dist > 0 ? focus_dist : dist;
  half_height = std::tan(vfov_deg * PI / 360.0);
}

void Camera::set_screen_size(size_t screen_w, size_t screen_h) {
  if (screen_w == 0 || screen_h == 0) return;
  aspect = static_cast<double>(screen_w) / screen_h;
}

Ray Camera::generate_ray(double x, double y, RandomStream& rng) const {
  double half_width = aspect * half_height;

  // point on the plane of focus
  Vector3D target =
      look_from + focus_dist * ((2.0 * x - 1.0) * half_width * u +
                                (1.0 - 2.0 * y) * half_height * v - w);

  Vector3D origin = look_from;
  if (lens_radius > 0) {
    Vector2D lens = sample_concentric_disk(rng) * lens_radius;
    origin += lens.x * u + lens.y * v;
  }

  double time = time0;
  if (time1 > time0) time = time0 + rng.random_uniform() * (time1 - time0);

  return Ray(origin, (target - origin).unit(), time);
}

} // namespace Lumina
