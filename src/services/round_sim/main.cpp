/// @file main.cpp
/// @brief Round simulator entry point.
///
/// Plays one or more consecutive rounds between the stock rosters with
/// the heuristic intent provider and prints a summary per round.  Rounds
/// run as fast as possible unless --realtime paces them on a TickLoop.

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "rse/foundation/config_manager.hpp"
#include "rse/foundation/game_logger.hpp"
#include "rse/game/heuristic_agent.hpp"
#include "rse/game/map_loader.hpp"
#include "rse/game/round.hpp"
#include "rse/game/simulation_config.hpp"
#include "rse/service/sim_runner.hpp"
#include "rse/service/tick_loop.hpp"
#include "rse/version.hpp"

namespace {

/// Drive @p round on a TickLoop at the configured tick rate.
/// @return false when interrupted by a signal before the round ended.
bool runRealtime(rse::game::Round& round, const rse::service::SignalHandler& signals) {
    const auto rate =
        static_cast<uint32_t>(std::lround(1.0 / round.Config().round.tickInterval));
    rse::service::TickLoop loop(rate);
    const double dt = round.Config().round.tickInterval;
    loop.setTickCallback([&round, &signals, dt](double) {
        round.Update(dt);
        return round.Phase() != rse::game::RoundPhase::End && !signals.shutdownRequested();
    });
    if (!loop.start()) {
        return false;
    }
    loop.waitUntilFinished();
    return round.Phase() == rse::game::RoundPhase::End;
}

void printEvents(const rse::game::Round& round) {
    for (const auto& event : round.Events()) {
        std::cout << "  " << rse::service::formatEvent(event) << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = rse::service::parseArgs(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error().message() << "\n" << rse::service::usage();
        return EXIT_FAILURE;
    }
    const auto options = parsed.value();
    if (options.help) {
        std::cout << rse::service::usage();
        return EXIT_SUCCESS;
    }

    rse::service::SignalHandler signals;

    rse::foundation::ConfigManager config;
    if (auto loaded = rse::service::loadConfig(config, options.configPath); !loaded) {
        std::cerr << "Failed to load config: " << loaded.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto simConfig = rse::game::LoadSimulationConfig(config);
    if (!simConfig) {
        std::cerr << "Invalid simulation config: " << simConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto map = options.mapPath.empty() ? rse::service::builtinMap()
                                       : rse::game::LoadMapFile(options.mapPath);
    if (!map) {
        std::cerr << "Failed to load map: " << map.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "rse_round_sim " << rse::Version::string << " on " << map.value()->Name()
              << "\n";

    const auto& tunables = simConfig.value();
    rse::service::MatchRunner runner(map.value(), tunables,
                                     rse::service::defaultRoster(tunables.economy),
                                     options.seed);
    auto provider = std::make_shared<rse::game::HeuristicIntentProvider>(map.value());

    for (int32_t i = 0; i < options.rounds && !signals.shutdownRequested(); ++i) {
        auto created = runner.nextRound();
        if (!created) {
            std::cerr << "Failed to set up round: " << created.error().message() << "\n";
            return EXIT_FAILURE;
        }
        rse::game::Round round = std::move(created).value();
        round.SetIntentProvider(provider);

        if (options.realtime) {
            if (!runRealtime(round, signals)) {
                std::cout << "Interrupted during round " << round.RoundNumber() << "\n";
                break;
            }
        } else {
            (void)round.Simulate();
        }

        std::cout << rse::service::formatSummary(round.GetSummary()) << "\n";
        if (options.printEvents) {
            printEvents(round);
        }

        if (auto done = runner.completeRound(round); !done) {
            std::cerr << "Round did not finish: " << done.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    std::cout << "score: attackers " << runner.wins(rse::game::Team::Attackers)
              << " - defenders " << runner.wins(rse::game::Team::Defenders) << "\n";
    if (auto flushed = rse::foundation::GameLogger::instance().flush(); !flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
