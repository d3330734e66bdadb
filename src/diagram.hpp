#pragma once

#include <glm/vec4.hpp>
#include <optional>
#include <string>
#include <vector>
#include "phasor.hpp"
#include "rect.hpp"
#include "registry.hpp"

namespace phasorplot
{
// Everything a renderer needs to draw one phasor.
struct arrow final
{
  point start;
  point end;
  std::string label;
  point label_anchor;
  glm::vec4 color;
};

// Midpoint of the phasor moved by offset along the phasor's own direction.
point label_anchor(const phasor &p, double offset);

std::vector<arrow> arrows(const phasor_registry &registry, double label_offset);

// View rectangle around every start and end point, grown on each side by
// max(min_margin, margin_fraction * x extent). Empty registries have no view.
std::optional<rect> auto_scale(const phasor_registry &registry, double margin_fraction,
                               double min_margin);
} // namespace phasorplot
