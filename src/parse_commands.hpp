#pragma once
#include "commands.hpp"
#include <expected>
#include <string>
#include <string_view>

namespace phasorplot
{
std::expected<command, std::string> parse_command(std::string_view line);
} // namespace phasorplot
