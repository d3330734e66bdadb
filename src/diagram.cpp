#include "diagram.hpp"
#include <algorithm>
#include <cmath>
#include <glm/trigonometric.hpp>

namespace phasorplot
{
point label_anchor(const phasor &p, double offset)
{
  const auto rad = glm::radians(p.angle_deg);
  return midpoint(p) + offset * point(std::cos(rad), std::sin(rad));
}

std::vector<arrow> arrows(const phasor_registry &registry, double label_offset)
{
  auto result = std::vector<arrow>();
  result.reserve(registry.size());
  for (const auto &p : registry.phasors())
  {
    result.push_back(arrow{.start = p.start,
                           .end = p.end,
                           .label = p.name,
                           .label_anchor = label_anchor(p, label_offset),
                           .color = p.color});
  }
  return result;
}

std::optional<rect> auto_scale(const phasor_registry &registry, double margin_fraction,
                               double min_margin)
{
  if (registry.empty())
  {
    return std::nullopt;
  }
  auto points = std::vector<point>();
  points.reserve(2 * registry.size());
  for (const auto &p : registry.phasors())
  {
    points.push_back(p.start);
    points.push_back(p.end);
  }
  const auto bounds = bounding_rect(points);
  return grow(bounds, std::max(min_margin, margin_fraction * extent(bounds).x));
}
} // namespace phasorplot
