#pragma once

/// @file round.hpp
/// @brief Round state machine: buy phase, objective, combat and win conditions.
///
/// A Round exclusively owns its players, ability instances, dropped items
/// and both team blackboards.  It is created through Round::Create, which
/// validates the whole setup first, and then advanced with Update(dt) (or
/// Simulate) until the phase reaches End.
///
/// Per active tick the order is fixed:
///   timers -> status effects -> vision -> intents -> movement ->
///   communication -> ability activation -> plant/defuse ->
///   perception -> duels -> pickups -> ability effects ->
///   blackboard upkeep -> end conditions
///
/// Example:
/// @code
///   RoundParams params;
///   params.roundNumber = 1;
///   params.players = MakeRoster();
///   params.attackers = {PlayerId(1), PlayerId(2), PlayerId(3), PlayerId(4), PlayerId(5)};
///   params.defenders = {PlayerId(6), PlayerId(7), PlayerId(8), PlayerId(9), PlayerId(10)};
///   params.map = map;
///   params.seed = 42;
///
///   auto round = Round::Create(std::move(params));
///   if (!round) { return round.error(); }
///   round.value().SetIntentProvider(std::make_shared<HeuristicIntentProvider>(map));
///   RoundSummary summary = round.value().Simulate();
/// @endcode

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "rse/foundation/game_result.hpp"
#include "rse/game/ability_system.hpp"
#include "rse/game/ability_types.hpp"
#include "rse/game/blackboard.hpp"
#include "rse/game/combat_system.hpp"
#include "rse/game/economy.hpp"
#include "rse/game/intent.hpp"
#include "rse/game/map_geometry.hpp"
#include "rse/game/movement_system.hpp"
#include "rse/game/player.hpp"
#include "rse/game/round_types.hpp"
#include "rse/game/simulation_config.hpp"

namespace rse::game {

/// Everything needed to construct a Round.
struct RoundParams {
    int32_t roundNumber = 1;
    std::vector<Player> players;
    std::vector<PlayerId> attackers;
    std::vector<PlayerId> defenders;
    std::shared_ptr<const MapGeometry> map;
    std::optional<uint64_t> seed;  ///< Unseeded rounds draw one from std::random_device.
    LossBonusInput lossBonus;
    SimulationConfig config;
    AbilityCatalog catalog = AbilityCatalog::Standard();

    /// Boards carried over from the previous round; fresh ones otherwise.
    std::optional<TeamBlackboard> attackerBlackboard;
    std::optional<TeamBlackboard> defenderBlackboard;
};

class Round {
public:
    /// Validate @p params and build a ready-to-run round in the buy phase.
    ///
    /// @return MissingMap, InvalidRoster (empty side, duplicate or unknown
    ///         ids, players outside the partition), InvalidRoundSetup (map
    ///         without spawns for a side), AbilityNotFound (ability slot
    ///         naming an unknown ability) or a tunables validation error.
    [[nodiscard]] static foundation::GameResult<Round> Create(RoundParams params);

    Round(Round&&) = default;
    Round& operator=(Round&&) = default;
    Round(const Round&) = delete;
    Round& operator=(const Round&) = delete;

    // ── Driving ─────────────────────────────────────────────────────────

    /// Advance the round by @p deltaTime seconds.  No-op once ended.
    void Update(double deltaTime);

    /// Run fixed ticks of config.round.tickInterval until End or until
    /// @p maxTicks ticks have run (0 picks a bound covering every timer).
    RoundSummary Simulate(std::size_t maxTicks = 0);

    /// Queue @p intent for @p player for the next tick.
    /// @return PlayerNotFound for an id outside the roster.
    foundation::GameResult<void> SetIntent(PlayerId player, Intent intent);

    /// Install the producer asked for players without a queued intent.
    void SetIntentProvider(std::shared_ptr<IIntentProvider> provider);

    /// Deal @p amount damage to @p target from @p source (may be invalid
    /// for environmental damage).  Kills are handled like any other death.
    /// @return Health removed, or PlayerNotFound.
    foundation::GameResult<double> ApplyDamage(PlayerId target, double amount, PlayerId source,
                                               const std::string& cause);

    // ── Observation ─────────────────────────────────────────────────────

    [[nodiscard]] RoundSummary GetSummary() const;

    [[nodiscard]] const std::vector<RoundEvent>& Events() const noexcept { return events_; }

    /// Carryover for the next round.
    /// @return InvalidState while the round has not ended.
    [[nodiscard]] foundation::GameResult<Carryover> GetCarryover() const;

    [[nodiscard]] int32_t RoundNumber() const noexcept { return roundNumber_; }
    [[nodiscard]] RoundPhase Phase() const noexcept { return phase_; }
    [[nodiscard]] double Elapsed() const noexcept { return elapsed_; }
    [[nodiscard]] RoundWinner Winner() const noexcept { return winner_; }
    [[nodiscard]] EndCondition GetEndCondition() const noexcept { return endCondition_; }

    [[nodiscard]] const std::vector<Player>& Players() const noexcept { return players_; }
    [[nodiscard]] const Player* FindPlayer(PlayerId id) const;
    [[nodiscard]] const std::vector<PlayerId>& Attackers() const noexcept { return attackers_; }
    [[nodiscard]] const std::vector<PlayerId>& Defenders() const noexcept { return defenders_; }
    [[nodiscard]] int32_t AliveCount(Team team) const;

    [[nodiscard]] const Spike& GetSpike() const noexcept { return spike_; }

    /// Every ability instance of the round, active or not.
    [[nodiscard]] const std::vector<AbilityInstance>& AbilityInstances() const noexcept {
        return abilities_;
    }
    /// Instances currently in effect or in flight.
    [[nodiscard]] std::vector<const AbilityInstance*> ActiveAbilities() const;

    [[nodiscard]] const std::vector<DroppedWeapon>& DroppedWeapons() const noexcept {
        return droppedWeapons_;
    }
    [[nodiscard]] const std::vector<DroppedShield>& DroppedShields() const noexcept {
        return droppedShields_;
    }

    [[nodiscard]] const TeamBlackboard& Blackboard(Team team) const noexcept {
        return team == Team::Attackers ? attackerBoard_ : defenderBoard_;
    }

    [[nodiscard]] const VisionMap& Vision() const noexcept { return vision_; }
    [[nodiscard]] const SimulationConfig& Config() const noexcept { return config_; }
    [[nodiscard]] const MapGeometry& Map() const noexcept { return *map_; }
    [[nodiscard]] const AbilityCatalog& Catalog() const noexcept { return catalog_; }

private:
    /// Ability hit remembered for assist credit.
    struct AbilityTouch {
        PlayerId owner;
        PlayerId victim;
        double time = 0.0;
    };

    Round(RoundParams params, uint64_t seed);

    void setup();
    void assignSpawns();
    void assignSpike();
    void setInitialStrategies();

    // ── Phases ──────────────────────────────────────────────────────────
    void updateBuyPhase(double deltaTime);
    void updateActivePhase(double deltaTime);
    void finishBuyPhase();
    void endRound(RoundWinner winner, EndCondition condition);

    // ── Active phase steps ──────────────────────────────────────────────
    std::vector<Intent> collectIntents();
    void applyMovement(const std::vector<Intent>& intents, double deltaTime);
    void applyCommunication(const std::vector<Intent>& intents);
    void applyAbilityUse(const std::vector<Intent>& intents);
    void processPlant(const std::vector<Intent>& intents, double deltaTime);
    void processDefuse(const std::vector<Intent>& intents, double deltaTime);
    void updatePerception();
    void resolveShots(const std::vector<Intent>& intents);
    void processPickups();
    void updateAbilities(double deltaTime);
    void updateBlackboards(double deltaTime);
    void updateStrategiesMidRound();
    void checkEndConditions();
    void checkElimination();

    // ── Helpers ─────────────────────────────────────────────────────────
    void handleDeath(std::size_t victim, std::optional<PlayerId> killer, const std::string& cause,
                     bool headshot);
    void dropSpike(Player& carrier);
    void postNoise(NoiseKind kind, const Vector3& source, double range, const Player& emitter);
    void publishEconomy();
    void callStrategy(Team team, const std::string& name, std::optional<std::string> site,
                      const std::string& reason);
    void emit(RoundEvent event);

    [[nodiscard]] Player* findPlayer(PlayerId id);
    [[nodiscard]] std::optional<std::size_t> indexOf(PlayerId id) const;
    [[nodiscard]] TeamBlackboard& boardFor(Team team) noexcept {
        return team == Team::Attackers ? attackerBoard_ : defenderBoard_;
    }
    [[nodiscard]] std::vector<SmokeVolume> activeSmokes() const;
    [[nodiscard]] bool sees(PlayerId viewer, PlayerId target) const;
    [[nodiscard]] std::optional<PlayerId> randomAlive(Team team);

    int32_t roundNumber_ = 1;
    SimulationConfig config_;
    std::shared_ptr<const MapGeometry> map_;
    AbilityCatalog catalog_;
    LossBonusInput lossBonus_;
    std::mt19937_64 rng_;

    MovementSystem movement_;
    CombatSystem combat_;

    std::vector<Player> players_;
    std::unordered_map<PlayerId, std::size_t> index_;
    std::vector<PlayerId> attackers_;
    std::vector<PlayerId> defenders_;

    RoundPhase phase_ = RoundPhase::Buy;
    double elapsed_ = 0.0;
    double buyTimeRemaining_ = 0.0;
    double roundTimeRemaining_ = 0.0;
    RoundWinner winner_ = RoundWinner::None;
    EndCondition endCondition_ = EndCondition::None;
    int32_t killCount_ = 0;

    Spike spike_;
    std::vector<AbilityInstance> abilities_;
    std::vector<std::vector<std::size_t>> slotInstances_;  ///< Per player, per ability slot.
    std::vector<AbilityTouch> touches_;
    std::vector<DroppedWeapon> droppedWeapons_;
    std::vector<DroppedShield> droppedShields_;
    std::vector<bool> boughtThisRound_;

    TeamBlackboard attackerBoard_;
    TeamBlackboard defenderBoard_;

    std::shared_ptr<IIntentProvider> provider_;
    std::unordered_map<PlayerId, Intent> queued_;
    VisionMap vision_;
    std::vector<RoundEvent> events_;
};

}  // namespace rse::game
