#pragma once

#include <glm/vec2.hpp>
#include <span>

namespace phasorplot
{
struct rect
{
  glm::dvec2 lower_bounds;
  glm::dvec2 upper_bounds;

  bool operator==(const rect &other) const = default;
};

// points must not be empty
rect bounding_rect(std::span<const glm::dvec2> points);
rect union_rect(const rect &r1, const rect &r2);
rect grow(const rect &r, double margin);
glm::dvec2 extent(const rect &r);
} // namespace phasorplot
