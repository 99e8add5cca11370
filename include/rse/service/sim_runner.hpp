#pragma once

/// @file sim_runner.hpp
/// @brief Entry-point helpers for the round simulator: signals, config,
///        CLI parsing, a stock roster and a round-to-round driver.

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rse/foundation/config_manager.hpp"
#include "rse/foundation/game_result.hpp"
#include "rse/game/blackboard.hpp"
#include "rse/game/intent.hpp"
#include "rse/game/map_geometry.hpp"
#include "rse/game/player.hpp"
#include "rse/game/round.hpp"
#include "rse/game/simulation_config.hpp"

namespace rse::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler should exist per process.  The handler performs
/// a relaxed store on a lock-free atomic, which is async-signal-safe.
/// Destruction restores the default handlers.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    [[nodiscard]] bool shutdownRequested() const noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Load a YAML configuration file into @p config.
///
/// The path is resolved in order:
///   1. RSE_CONFIG_PATH environment variable (if set)
///   2. @p path
///
/// @return Success or ConfigLoadFailed.
[[nodiscard]] foundation::GameResult<void> loadConfig(foundation::ConfigManager& config,
                                                      const std::filesystem::path& path);

/// Command-line options of rse_round_sim.
struct RunOptions {
    std::filesystem::path configPath;  ///< --config; empty uses the defaults.
    std::filesystem::path mapPath;     ///< --map; empty uses the built-in map.
    std::optional<uint64_t> seed;      ///< --seed
    int32_t rounds = 1;                ///< --rounds
    bool realtime = false;             ///< --realtime: pace ticks on a TickLoop.
    bool printEvents = false;          ///< --events: print every round event.
    bool help = false;                 ///< --help
};

/// Parse the simulator's command line.
/// @return InvalidArgument for unknown flags, missing or malformed values.
[[nodiscard]] foundation::GameResult<RunOptions> parseArgs(int argc, char* argv[]);

[[nodiscard]] std::string usage();

/// Map used when no --map is given: two sites reached through walled
/// lanes, with a screen at each site entrance.
[[nodiscard]] foundation::GameResult<std::shared_ptr<const game::MapGeometry>> builtinMap();

/// Players and their side partition.
struct Roster {
    std::vector<game::Player> players;
    std::vector<game::PlayerId> attackers;
    std::vector<game::PlayerId> defenders;
};

/// Ten players (ids 1-5 attack, 6-10 defend) with stock abilities and
/// the configured starting credits.
[[nodiscard]] Roster defaultRoster(const game::EconomyTuning& economy);

/// Plays consecutive rounds with the same sides, carrying credits,
/// surviving loadouts, loss streaks and blackboards from one round into
/// the next.  Halves and scoring are left to the caller.
class MatchRunner {
public:
    MatchRunner(std::shared_ptr<const game::MapGeometry> map, game::SimulationConfig config,
                Roster roster, std::optional<uint64_t> seed = std::nullopt);

    /// Build the next round without running it.
    [[nodiscard]] foundation::GameResult<game::Round> nextRound() const;

    /// Absorb the outcome of a finished round produced by nextRound().
    /// @return InvalidState when the round has not ended.
    foundation::GameResult<void> completeRound(const game::Round& round);

    /// nextRound, Simulate, completeRound in one call.
    foundation::GameResult<game::RoundSummary> playRound(
        std::shared_ptr<game::IIntentProvider> provider);

    [[nodiscard]] int32_t roundNumber() const noexcept { return roundNumber_; }
    [[nodiscard]] const std::vector<game::Player>& players() const noexcept {
        return roster_.players;
    }
    [[nodiscard]] const game::LossBonusInput& lossBonus() const noexcept { return lossBonus_; }
    [[nodiscard]] int32_t wins(game::Team team) const noexcept {
        return team == game::Team::Attackers ? attackerWins_ : defenderWins_;
    }

private:
    std::shared_ptr<const game::MapGeometry> map_;
    game::SimulationConfig config_;
    Roster roster_;
    std::optional<uint64_t> seed_;
    int32_t roundNumber_ = 1;
    game::LossBonusInput lossBonus_;
    std::optional<game::TeamBlackboard> attackerBoard_;
    std::optional<game::TeamBlackboard> defenderBoard_;
    int32_t attackerWins_ = 0;
    int32_t defenderWins_ = 0;
};

/// One-line human-readable summary.
[[nodiscard]] std::string formatSummary(const game::RoundSummary& summary);

/// One-line human-readable event.
[[nodiscard]] std::string formatEvent(const game::RoundEvent& event);

}  // namespace rse::service
