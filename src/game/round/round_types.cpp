/// @file round_types.cpp
/// @brief Names for round enums.

#include "rse/game/round_types.hpp"

#include <algorithm>

namespace rse::game {

std::string_view RoundPhaseName(RoundPhase phase) noexcept {
    switch (phase) {
        case RoundPhase::Buy:    return "buy";
        case RoundPhase::Active: return "active";
        case RoundPhase::End:    return "end";
    }
    return "unknown";
}

std::string_view RoundWinnerName(RoundWinner winner) noexcept {
    switch (winner) {
        case RoundWinner::None:      return "none";
        case RoundWinner::Attackers: return "attackers";
        case RoundWinner::Defenders: return "defenders";
    }
    return "unknown";
}

std::string_view EndConditionName(EndCondition condition) noexcept {
    switch (condition) {
        case EndCondition::None:            return "none";
        case EndCondition::Elimination:     return "elimination";
        case EndCondition::SpikeDetonation: return "spike_detonation";
        case EndCondition::SpikeDefused:    return "spike_defused";
        case EndCondition::TimeExpired:     return "time_expired";
    }
    return "unknown";
}

std::string_view SpikeStateName(SpikeState state) noexcept {
    switch (state) {
        case SpikeState::Carried:   return "carried";
        case SpikeState::Dropped:   return "dropped";
        case SpikeState::Planting:  return "planting";
        case SpikeState::Planted:   return "planted";
        case SpikeState::Defusing:  return "defusing";
        case SpikeState::Defused:   return "defused";
        case SpikeState::Detonated: return "detonated";
    }
    return "unknown";
}

std::string_view RoundEventTypeName(RoundEventType type) noexcept {
    switch (type) {
        case RoundEventType::PhaseChange:     return "phase_change";
        case RoundEventType::Purchase:        return "purchase";
        case RoundEventType::Damage:          return "damage";
        case RoundEventType::Death:           return "death";
        case RoundEventType::PlantStart:      return "plant_start";
        case RoundEventType::PlantInterrupt:  return "plant_interrupt";
        case RoundEventType::PlantComplete:   return "plant_complete";
        case RoundEventType::DefuseStart:     return "defuse_start";
        case RoundEventType::DefuseInterrupt: return "defuse_interrupt";
        case RoundEventType::DefuseComplete:  return "defuse_complete";
        case RoundEventType::Detonation:      return "detonation";
        case RoundEventType::AbilityUse:      return "ability_use";
        case RoundEventType::Communication:   return "communication";
        case RoundEventType::SpikeDrop:       return "spike_drop";
        case RoundEventType::SpikePickup:     return "spike_pickup";
        case RoundEventType::ItemPickup:      return "item_pickup";
        case RoundEventType::RoundEnd:        return "round_end";
    }
    return "unknown";
}

bool RoundTimings::IsPistolRound(int32_t roundNumber) const noexcept {
    return std::find(pistolRounds.begin(), pistolRounds.end(), roundNumber) !=
           pistolRounds.end();
}

}  // namespace rse::game
