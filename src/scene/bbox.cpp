#include "bbox.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <iostream>

namespace Lumina {

// Widens the far slab distance to absorb rounding in the slab arithmetic.
static const double kSlabPad = 1.0 + 4.0 * std::numeric_limits<double>::epsilon();

bool BBox::intersect(const Ray& r, double& t0, double& t1) const {

  double tmin = t0;
  double tmax = t1;

  for (int a = 0; a < 3; ++a) {
    const int s = r.sign[a];
    double tnear = ((s ? max[a] : min[a]) - r.o[a]) * r.inv_d[a];
    double tfar = ((s ? min[a] : max[a]) - r.o[a]) * r.inv_d[a] * kSlabPad;

    // NaN (origin on a slab plane with a zero direction component) fails
    // both comparisons and leaves the interval unchanged.
    if (tnear > tmin) tmin = tnear;
    if (tfar < tmax) tmax = tfar;
    if (tmin > tmax) return false;
  }

  t0 = tmin;
  t1 = tmax;
  return true;
}

bool BBox::contains(const BBox& other, double eps) const {
  if (other.empty()) return true;
  return min.x <= other.min.x + eps && min.y <= other.min.y + eps &&
         min.z <= other.min.z + eps && max.x >= other.max.x - eps &&
         max.y >= other.max.y - eps && max.z >= other.max.z - eps;
}

bool BBox::equals(const BBox& other, double eps) const {
  return contains(other, eps) && other.contains(*this, eps);
}

std::ostream& operator<<(std::ostream& os, const BBox& b) {
  return os << "BBOX(" << b.min << ", " << b.max << ")";
}

} // namespace Lumina
