/// @file intent.cpp
/// @brief Intent names for logging.

#include "rse/game/intent.hpp"

namespace rse::game {

namespace {

struct IntentNamer {
    std::string_view operator()(const IdleIntent&) const noexcept { return "idle"; }
    std::string_view operator()(const MoveIntent&) const noexcept { return "move"; }
    std::string_view operator()(const ShootIntent&) const noexcept { return "shoot"; }
    std::string_view operator()(const PlantIntent&) const noexcept { return "plant"; }
    std::string_view operator()(const DefuseIntent&) const noexcept { return "defuse"; }
    std::string_view operator()(const BuyIntent&) const noexcept { return "buy"; }
    std::string_view operator()(const UseAbilityIntent&) const noexcept { return "use_ability"; }
    std::string_view operator()(const CommunicateIntent&) const noexcept { return "communicate"; }
};

}  // namespace

std::string_view IntentName(const Intent& intent) noexcept {
    if (intent.valueless_by_exception()) {
        return "invalid";
    }
    return std::visit(IntentNamer{}, intent);
}

}  // namespace rse::game
