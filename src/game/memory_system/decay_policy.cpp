/// @file decay_policy.cpp
/// @brief Default forgetting curve and its configuration overrides.

#include "npc/game/decay_policy.hpp"

#include "npc/foundation/config_manager.hpp"
#include "npc/foundation/npc_logger.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace npc::game {

namespace {

constexpr Turn kNeverDecays = std::numeric_limits<Turn>::max();

constexpr std::array<MemoryImportance, kImportanceTierCount> kAllTiers = {
    MemoryImportance::Trivial, MemoryImportance::Low, MemoryImportance::Normal,
    MemoryImportance::High, MemoryImportance::Critical};

constexpr std::array<MemoryKind, kMemoryKindCount> kAllKinds = {
    MemoryKind::Entity, MemoryKind::Location, MemoryKind::Event};

double clampLogged(std::string_view key, double value, double lo, double hi) {
    double clamped = std::clamp(value, lo, hi);
    if (clamped != value) {
        NPC_LOG_WARN(foundation::LogCategory::Config,
                     std::string(key) + " out of range, clamped to " + std::to_string(clamped));
    }
    return clamped;
}

}  // namespace

DecayPolicy::DecayPolicy()
    : tiers_{{
          // grace, rate/turn, threshold, removable
          TierDecay{25, 0.01, 0.1, true},      // Trivial
          TierDecay{50, 0.005, 0.1, true},     // Low
          TierDecay{100, 0.0025, 0.1, true},   // Normal
          TierDecay{500, 0.0005, 0.05, true},  // High
          TierDecay{kNeverDecays, 0.0, 0.0, false},  // Critical
      }},
      kindScale_{{1.0, 0.5, 2.0}} {}

DecayPolicy DecayPolicy::FromConfig(const foundation::ConfigManager& config) {
    DecayPolicy policy;

    for (auto tier : kAllTiers) {
        const std::string prefix = "memory.decay." + std::string(importanceName(tier)) + ".";
        TierDecay decay = policy.ForTier(tier);

        decay.graceTurns = config.getOr<Turn>(prefix + "grace_turns", decay.graceTurns);
        decay.ratePerTurn = clampLogged(prefix + "rate_per_turn",
                                        config.getOr<double>(prefix + "rate_per_turn",
                                                             decay.ratePerTurn),
                                        0.0, 1.0);
        decay.removalThreshold = clampLogged(prefix + "removal_threshold",
                                             config.getOr<double>(prefix + "removal_threshold",
                                                                  decay.removalThreshold),
                                             0.0, 1.0);
        decay.removable = config.getOr<bool>(prefix + "removable", decay.removable);

        policy.SetTier(tier, decay);
    }

    for (auto kind : kAllKinds) {
        const std::string key = "memory.decay.kind_scale." + std::string(memoryKindName(kind));
        double scale = config.getOr<double>(key, policy.KindScale(kind));
        policy.SetKindScale(kind, clampLogged(key, scale, 0.0, std::numeric_limits<double>::max()));
    }

    double step = config.getOr<double>("memory.reinforce_step", policy.ReinforceStep());
    policy.SetReinforceStep(static_cast<float>(clampLogged("memory.reinforce_step", step, 0.0, 1.0)));

    return policy;
}

float DecayPolicy::RetainedConfidence(const MemoryRecord& record, Turn now) const {
    const auto& tier = ForTier(record.importance);

    // A clock moved backwards counts as no time passed.
    Turn idle = now > record.lastAccessTurn ? now - record.lastAccessTurn : 0;
    if (idle <= tier.graceTurns) {
        return std::clamp(record.anchorConfidence, 0.0f, 1.0f);
    }

    double decaying = static_cast<double>(idle - tier.graceTurns);
    double retained = static_cast<double>(record.anchorConfidence) -
                      tier.ratePerTurn * KindScale(record.kind()) * decaying;
    return static_cast<float>(std::clamp(retained, 0.0, 1.0));
}

bool DecayPolicy::ShouldForget(MemoryImportance tier, float retained) const {
    const auto& decay = ForTier(tier);
    return decay.removable && static_cast<double>(retained) < decay.removalThreshold;
}

}  // namespace npc::game
