#include "core/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace pcc {

float IoU(const BBox& a, const BBox& b) {
  const float ax2 = a.x + a.w;
  const float ay2 = a.y + a.h;
  const float bx2 = b.x + b.w;
  const float by2 = b.y + b.h;

  const float ix1 = std::max(a.x, b.x);
  const float iy1 = std::max(a.y, b.y);
  const float ix2 = std::min(ax2, bx2);
  const float iy2 = std::min(ay2, by2);

  const float iw = std::max(0.f, ix2 - ix1);
  const float ih = std::max(0.f, iy2 - iy1);
  const float inter = iw * ih;

  const float ua = Area(a) + Area(b) - inter;
  if (ua <= 0.f) return 0.f;
  return inter / ua;
}

bool IsFinite(const BBox& b) {
  return std::isfinite(b.x) && std::isfinite(b.y) && std::isfinite(b.w) && std::isfinite(b.h);
}

} // namespace pcc
