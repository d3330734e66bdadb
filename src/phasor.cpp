#include "phasor.hpp"
#include <cmath>
#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

namespace phasorplot
{
double normalize_angle(double deg)
{
  auto a = std::fmod(deg, 360.0);
  if (a <= -180.0)
  {
    a += 360.0;
  }
  else if (a > 180.0)
  {
    a -= 360.0;
  }
  return a;
}

point polar_end(const point &start, double magnitude, double angle_deg)
{
  const auto rad = glm::radians(angle_deg);
  return start + magnitude * point(std::cos(rad), std::sin(rad));
}

phasor make_phasor(std::string name, const point &start, const point &end, std::string kind,
                   const glm::vec4 &color)
{
  const auto d = end - start;
  const auto magnitude = glm::length(d);
  // atan2 of signed zeros yields +-180, a zero-length phasor points along +x
  const auto angle = magnitude == 0.0 ? 0.0 : normalize_angle(glm::degrees(std::atan2(d.y, d.x)));
  return phasor{.name = std::move(name),
                .start = start,
                .end = end,
                .magnitude = magnitude,
                .angle_deg = angle,
                .kind = std::move(kind),
                .color = color};
}

const point &point_of(const phasor &p, endpoint which)
{
  switch (which)
  {
  case endpoint::start:
    return p.start;
  case endpoint::end:
    return p.end;
  }
  return p.end;
}

point midpoint(const phasor &p) { return (p.start + p.end) / 2.0; }
} // namespace phasorplot
