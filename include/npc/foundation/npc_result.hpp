#pragma once

/// @file npc_result.hpp
/// @brief NpcResult<T> alias for fallible setup paths.

#include "npc/core/result.hpp"
#include "npc/foundation/npc_error.hpp"

namespace npc::foundation {

/// Result type specialized with NpcError.
///
/// Example:
/// @code
///   NpcResult<double> readRate(const ConfigManager& config) {
///       auto rate = config.get<double>("memory.decay.normal.rate_per_turn");
///       if (!rate) {
///           return NpcResult<double>::err(rate.error());
///       }
///       return NpcResult<double>::ok(rate.value());
///   }
/// @endcode
template <typename T>
using NpcResult = npc::Result<T, NpcError>;

}  // namespace npc::foundation
