#pragma once
#include "rig.hpp"

namespace vb
{
int run_editor(const Rig& rig);
} // namespace vb
