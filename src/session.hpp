#pragma once

#include <expected>
#include <string>
#include "commands.hpp"
#include "registry.hpp"

namespace phasorplot
{
// State behind one interactive session. Commands read the current settings when they run.
struct session final
{
  phasor_registry registry;
};

// Runs cmd and returns the text to print. quit_command is a no-op here, the caller ends the
// session.
std::expected<std::string, std::string> execute(session &s, const command &cmd);
} // namespace phasorplot
