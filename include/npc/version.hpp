#pragma once

/// @file version.hpp
/// @brief npc_core release identification.

#include <cstdint>

#define NPC_VERSION_MAJOR 0
#define NPC_VERSION_MINOR 2
#define NPC_VERSION_PATCH 0
#define NPC_VERSION_STRING "0.2.0"

/// Single integer for preprocessor comparisons, e.g.
/// `#if NPC_VERSION_NUMBER >= 200` for 0.2.0 or later.
#define NPC_VERSION_NUMBER \
    (NPC_VERSION_MAJOR * 10000 + NPC_VERSION_MINOR * 100 + NPC_VERSION_PATCH)

namespace npc {

struct Version {
    static constexpr int major = NPC_VERSION_MAJOR;
    static constexpr int minor = NPC_VERSION_MINOR;
    static constexpr int patch = NPC_VERSION_PATCH;
    static constexpr uint32_t number = NPC_VERSION_NUMBER;
    static constexpr const char* string = NPC_VERSION_STRING;

    static constexpr const char* name = "npc_core";
    static constexpr const char* description =
        "Behavior trees and decaying working memory for grid-based NPCs";

    /// True when this build is at least @p maj.@p min.@p pat.
    static constexpr bool AtLeast(int maj, int min, int pat) {
        return number >= static_cast<uint32_t>(maj * 10000 + min * 100 + pat);
    }
};

} // namespace npc
