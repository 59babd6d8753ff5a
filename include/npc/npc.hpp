#pragma once

/// @file npc.hpp
/// @brief Umbrella header: version info and the core Result type.

#include "npc/core/result.hpp"
#include "npc/version.hpp"
