#pragma once

#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "registry.hpp"

namespace phasorplot
{
struct chain_link final
{
  std::string label;
  double magnitude;
  double angle_deg;
};

// Parses "label,magnitude,angle".
std::expected<chain_link, std::string> parse_chain_link(std::string_view text);

// Adds the links head to tail: the first starts at origin, every other one at the end of its
// predecessor. Either every link is added or the registry is left as it was.
std::expected<std::vector<phasor>, registry_error> add_chain(phasor_registry &registry,
                                                             const point &origin,
                                                             std::span<const chain_link> links,
                                                             const phasor_style &style = {});
} // namespace phasorplot
