#pragma once

/// @file decay_policy.hpp
/// @brief Per-tier forgetting curve for memory records.
///
/// Retained confidence is a closed-form function of the record's anchor
/// confidence and its age in turns:
/// @code
///   idle     = max(0, currentTurn - lastAccessTurn)
///   decaying = max(0, idle - tier.graceTurns)
///   retained = clamp(anchor - tier.ratePerTurn * kindScale * decaying, 0, 1)
/// @endcode
/// A record is forgotten when its tier is removable and retained falls
/// below the tier's removal threshold.

#include "npc/game/memory_types.hpp"

#include <array>

namespace npc::foundation {
class ConfigManager;
}

namespace npc::game {

/// Decay parameters of one importance tier.
struct TierDecay {
    Turn graceTurns = 0;            ///< Idle turns before decay starts.
    double ratePerTurn = 0.0;       ///< Confidence lost per idle turn after grace.
    double removalThreshold = 0.0;  ///< Forget below this retained confidence.
    bool removable = true;          ///< False: never forgotten.
};

class DecayPolicy {
public:
    /// Default curve: Trivial < Low < Normal < High decay ever slower,
    /// Critical never decays.
    DecayPolicy();

    /// Defaults overridden by `memory.decay.*` and `memory.reinforce_step`
    /// keys present in @p config.  Missing or ill-typed keys keep their
    /// default; out-of-range values are clamped.
    static DecayPolicy FromConfig(const foundation::ConfigManager& config);

    [[nodiscard]] const TierDecay& ForTier(MemoryImportance tier) const {
        return tiers_[static_cast<std::size_t>(tier)];
    }

    void SetTier(MemoryImportance tier, const TierDecay& decay) {
        tiers_[static_cast<std::size_t>(tier)] = decay;
    }

    /// Rate multiplier per record kind (events fade faster than places).
    [[nodiscard]] double KindScale(MemoryKind kind) const {
        return kindScale_[static_cast<std::size_t>(kind)];
    }

    void SetKindScale(MemoryKind kind, double scale) {
        kindScale_[static_cast<std::size_t>(kind)] = scale;
    }

    /// Confidence added by one reinforcement.
    [[nodiscard]] float ReinforceStep() const noexcept { return reinforceStep_; }
    void SetReinforceStep(float step) noexcept { reinforceStep_ = step; }

    /// Confidence @p record retains at @p now.
    [[nodiscard]] float RetainedConfidence(const MemoryRecord& record, Turn now) const;

    /// True when a record of this tier with @p retained confidence is gone.
    [[nodiscard]] bool ShouldForget(MemoryImportance tier, float retained) const;

private:
    std::array<TierDecay, kImportanceTierCount> tiers_;
    std::array<double, kMemoryKindCount> kindScale_;
    float reinforceStep_ = 0.1f;
};

}  // namespace npc::game
