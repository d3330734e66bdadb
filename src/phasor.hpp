#pragma once

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>
#include <string>

namespace phasorplot
{
using point = glm::dvec2;

enum class endpoint
{
  start,
  end
};

// Resolved phasor. Coordinates are absolute; magnitude and angle_deg are derived from them
// when the record is made and never change afterwards.
struct phasor final
{
  std::string name;
  point start;
  point end;
  double magnitude;
  double angle_deg;
  std::string kind;
  glm::vec4 color;
};

// Maps any angle in degrees to (-180, 180].
double normalize_angle(double deg);

point polar_end(const point &start, double magnitude, double angle_deg);

phasor make_phasor(std::string name, const point &start, const point &end, std::string kind,
                   const glm::vec4 &color);

const point &point_of(const phasor &p, endpoint which);

point midpoint(const phasor &p);
} // namespace phasorplot
