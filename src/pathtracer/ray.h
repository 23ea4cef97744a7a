#ifndef LUMINA_RAY_H
#define LUMINA_RAY_H

#include "util/math_util.h"

namespace Lumina {

struct Ray {
  Vector3D o;     ///< origin
  Vector3D d;     ///< direction
  double time;    ///< shutter time, used by moving geometry
  mutable double min_t;
  mutable double max_t;  ///< shrunk by intersection routines on each hit

  Vector3D inv_d;  ///< component wise inverse of d
  int sign[3];     ///< 1 where the direction component is negative

  Ray(const Vector3D& o, const Vector3D& d, double time = 0.0)
      : o(o), d(d), time(time), min_t(0.0), max_t(INF_D) {
    inv_d = Vector3D(1.0 / d.x, 1.0 / d.y, 1.0 / d.z);
    sign[0] = (inv_d.x < 0);
    sign[1] = (inv_d.y < 0);
    sign[2] = (inv_d.z < 0);
  }

  Ray(const Vector3D& o, const Vector3D& d, double max_t, double time)
      : Ray(o, d, time) {
    this->max_t = max_t;
  }

  inline Vector3D at_time(double t) const { return o + t * d; }
};

} // namespace Lumina

#endif // LUMINA_RAY_H
