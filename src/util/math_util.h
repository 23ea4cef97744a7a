#ifndef LUMINA_UTIL_MATH_UTIL_H
#define LUMINA_UTIL_MATH_UTIL_H

#include "CGL/CGL.h"
#include "CGL/matrix3x3.h"
#include "CGL/vector2D.h"
#include "CGL/vector3D.h"

#include <algorithm>
#include <cmath>

namespace Lumina {

using CGL::Matrix3x3;
using CGL::Vector2D;
using CGL::Vector3D;

inline double max_component(const Vector3D& v) {
  return std::max({ v.x, v.y, v.z });
}

inline double min_component(const Vector3D& v) {
  return std::min({ v.x, v.y, v.z });
}

inline double average(const Vector3D& v) { return (v.x + v.y + v.z) / 3.0; }

inline bool is_finite(const Vector3D& v) {
  return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

inline bool is_black(const Vector3D& v) {
  return v.x == 0 && v.y == 0 && v.z == 0;
}

inline Vector3D exp(const Vector3D& v) {
  return Vector3D(std::exp(v.x), std::exp(v.y), std::exp(v.z));
}

inline Vector3D lerp(const Vector3D& a, const Vector3D& b, double t) {
  return a * (1.0 - t) + b * t;
}

// Power heuristic (beta = 2) for combining two sampling strategies.
inline double power_heuristic(double f_pdf, double g_pdf) {
  double f2 = f_pdf * f_pdf;
  double g2 = g_pdf * g_pdf;
  if (f2 + g2 <= 0) return 0;
  return f2 / (f2 + g2);
}

} // namespace Lumina

#endif // LUMINA_UTIL_MATH_UTIL_H
