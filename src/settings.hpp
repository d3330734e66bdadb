#pragma once
#include <string>
#include "commands.hpp"

namespace phasorplot
{
namespace settings
{

std::string show(const any_setting &setting);
void set(const any_settings_value &value);
void unset(const any_setting &setting);

duplicate_policy duplicates();
const std::string &kind();
double label_offset();
double margin();
double min_margin();
int precision();
} // namespace settings
} // namespace phasorplot
