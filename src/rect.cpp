#include "rect.hpp"
#include <algorithm>
#include <glm/common.hpp>

namespace phasorplot
{
rect bounding_rect(std::span<const glm::dvec2> points)
{
  auto r = rect{.lower_bounds = points.front(), .upper_bounds = points.front()};
  for (const auto &p : points.subspan(1))
  {
    r = union_rect(r, rect{.lower_bounds = p, .upper_bounds = p});
  }
  return r;
}

rect union_rect(const rect &r1, const rect &r2)
{
  return rect{.lower_bounds = glm::min(r1.lower_bounds, r2.lower_bounds),
              .upper_bounds = glm::max(r1.upper_bounds, r2.upper_bounds)};
}

rect grow(const rect &r, double margin)
{
  const auto m = glm::dvec2(margin, margin);
  return {.lower_bounds = r.lower_bounds - m, .upper_bounds = r.upper_bounds + m};
}

glm::dvec2 extent(const rect &r) { return r.upper_bounds - r.lower_bounds; }
} // namespace phasorplot
