#pragma once

#include <string>
#include "diagram.hpp"
#include "phasor.hpp"
#include "rect.hpp"

namespace phasorplot
{
std::string describe(const phasor &p, int precision);
std::string describe(const arrow &a, int precision);
std::string describe(const rect &r, int precision);
} // namespace phasorplot
